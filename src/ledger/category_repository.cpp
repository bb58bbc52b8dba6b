#include "ledger/category_repository.h"
#include "transaction/connection_manager.h"
#include "utils/id_generator.h"
#include "utils/input_validator.h"
#include "utils/logger.h"
#include "validation/request_validators.h"

#include <functional>
#include <map>
#include <set>

namespace fiscus {
namespace ledger {

using storage::toValue;

namespace {

const char* kCategoryColumns =
    "id, user_id, name, description, color, icon, parent_category_id, is_income, is_active, "
    "created_at, updated_at";

} // namespace

nlohmann::json CategoryNode::toJson() const {
    nlohmann::json j = category.toJson();
    j["children"] = nlohmann::json::array();
    for (const auto& child : children) {
        j["children"].push_back(child.toJson());
    }
    return j;
}

CategoryRepository::CategoryRepository(ConnectionManager& conn)
    : conn_(conn) {}

Category CategoryRepository::create(const validation::CreateCategoryRequest& request) {
    requireValid(validation::validateCreateCategoryRequest(request));
    requireUser(conn_, request.user_id);

    std::optional<std::string> parent;
    if (request.parent_category_id && !request.parent_category_id->empty()) {
        parent = request.parent_category_id;
        requireOwned(conn_, "categories", "Category", *parent, request.user_id);
    }

    const std::string id = utils::IdGenerator::uuidV4();
    conn_.runTransactionOrThrow({
        {"INSERT INTO categories (id, user_id, name, description, color, icon, parent_category_id, "
         "is_income, is_active) VALUES (?, ?, ?, ?, ?, ?, ?, ?, 1)",
         {toValue(id), toValue(request.user_id), toValue(utils::InputValidator::sanitizeString(request.name)),
          toValue(cleanText(request.description)), toValue(cleanText(request.color)),
          toValue(cleanText(request.icon)), toValue(parent), toValue(request.is_income)}}
    });

    FISCUS_DEBUG("Created category {} (parent {})", id, parent.value_or("-"));
    return getById(id, request.user_id);
}

std::optional<Category> CategoryRepository::findById(const std::string& id, const std::string& user_id) {
    requireUuid(id, "category_id");
    auto row = conn_.queryOne(
        std::string("SELECT ") + kCategoryColumns + " FROM categories WHERE id = ? AND user_id = ?",
        {toValue(id), toValue(user_id)});
    if (!row) return std::nullopt;
    return Category::fromRow(*row);
}

Category CategoryRepository::getById(const std::string& id, const std::string& user_id) {
    auto category = findById(id, user_id);
    if (!category) {
        throw NotFoundError("Category", id);
    }
    return *category;
}

std::vector<Category> CategoryRepository::listForUser(const std::string& user_id,
                                                      std::optional<bool> is_income,
                                                      bool include_inactive) {
    requireUuid(user_id, "user_id");
    std::string sql = std::string("SELECT ") + kCategoryColumns + " FROM categories WHERE user_id = ?";
    storage::Params params{toValue(user_id)};
    if (!include_inactive) {
        sql += " AND is_active = 1";
    }
    if (is_income) {
        sql += " AND is_income = ?";
        params.push_back(toValue(*is_income));
    }
    sql += " ORDER BY name, id";
    return conn_.query<Category>(sql, params, &Category::fromRow);
}

bool CategoryRepository::wouldCreateCycle(const std::string& id, const std::string& proposed_parent) {
    std::set<std::string> visited;
    std::optional<std::string> current = proposed_parent;
    while (current) {
        if (*current == id || !visited.insert(*current).second) {
            return true;
        }
        auto row = conn_.queryOne("SELECT parent_category_id FROM categories WHERE id = ?",
                                  {toValue(*current)});
        current = row ? row->getOptionalString("parent_category_id") : std::nullopt;
    }
    return false;
}

Category CategoryRepository::update(const std::string& id, const std::string& user_id,
                                    const validation::UpdateCategoryRequest& request) {
    requireValid(validation::validateUpdateCategoryRequest(request));
    getById(id, user_id);

    UpdateBuilder changes;
    if (request.name) changes.set("name", toValue(utils::InputValidator::sanitizeString(*request.name)));
    if (request.description) changes.set("description", toValue(cleanText(request.description)));
    if (request.color) changes.set("color", toValue(cleanText(request.color)));
    if (request.icon) changes.set("icon", toValue(cleanText(request.icon)));
    if (request.is_active) changes.set("is_active", toValue(*request.is_active));
    if (request.parent_category_id) {
        if (request.parent_category_id->empty()) {
            changes.set("parent_category_id", storage::Value{});
        } else {
            const std::string& parent = *request.parent_category_id;
            requireOwned(conn_, "categories", "Category", parent, user_id);
            if (wouldCreateCycle(id, parent)) {
                throw ConflictError("Category " + id + " cannot be moved below " + parent +
                                    ": circular hierarchy");
            }
            changes.set("parent_category_id", toValue(parent));
        }
    }

    if (!changes.empty()) {
        conn_.runTransactionOrThrow({changes.build("categories", id, user_id)});
    }
    return getById(id, user_id);
}

RemoveOutcome CategoryRepository::remove(const std::string& id, const std::string& user_id) {
    getById(id, user_id);

    auto refs = conn_.queryOne(
        "SELECT (SELECT COUNT(*) FROM transactions WHERE category_id = ?) AS tx_count, "
        "(SELECT COUNT(*) FROM categories WHERE parent_category_id = ? AND is_active = 1) AS child_count",
        {toValue(id), toValue(id)});
    const bool referenced = refs && (refs->getInt("tx_count") > 0 || refs->getInt("child_count") > 0);

    if (referenced) {
        UpdateBuilder changes;
        changes.set("is_active", toValue(false));
        conn_.runTransactionOrThrow({changes.build("categories", id, user_id)});
        FISCUS_INFO("Category {} still referenced, deactivated", id);
        return RemoveOutcome::Deactivated;
    }

    // Inactive children keep existing, detached from the removed parent
    conn_.runTransactionOrThrow({
        {"UPDATE categories SET parent_category_id = NULL, updated_at = CURRENT_TIMESTAMP "
         "WHERE parent_category_id = ? AND user_id = ?", {toValue(id), toValue(user_id)}},
        {"DELETE FROM categories WHERE id = ? AND user_id = ?", {toValue(id), toValue(user_id)}}
    });
    FISCUS_INFO("Deleted category {}", id);
    return RemoveOutcome::Deleted;
}

std::vector<CategoryNode> CategoryRepository::hierarchy(const std::string& user_id,
                                                        std::optional<bool> is_income) {
    requireUser(conn_, user_id);
    const auto categories = listForUser(user_id, is_income);

    std::map<std::string, std::vector<const Category*>> byParent;
    std::set<std::string> present;
    for (const auto& c : categories) {
        present.insert(c.id);
    }
    for (const auto& c : categories) {
        // Orphans (inactive or filtered-out parent) surface as roots
        const bool hasParent = c.parent_category_id && present.count(*c.parent_category_id) > 0;
        byParent[hasParent ? *c.parent_category_id : std::string()].push_back(&c);
    }

    std::function<std::vector<CategoryNode>(const std::string&)> build =
        [&](const std::string& parent) {
            std::vector<CategoryNode> nodes;
            auto it = byParent.find(parent);
            if (it == byParent.end()) return nodes;
            for (const Category* c : it->second) {
                CategoryNode node;
                node.category = *c;
                node.children = build(c->id);
                nodes.push_back(std::move(node));
            }
            return nodes;
        };
    return build(std::string());
}

} // namespace ledger
} // namespace fiscus
