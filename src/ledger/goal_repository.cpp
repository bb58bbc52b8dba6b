#include "ledger/goal_repository.h"
#include "ledger/repository_support.h"
#include "transaction/connection_manager.h"
#include "utils/id_generator.h"
#include "utils/input_validator.h"
#include "utils/logger.h"
#include "validation/request_validators.h"
#include "validation/validator.h"

namespace fiscus {
namespace ledger {

using storage::toValue;

const std::vector<std::string> kGoalSortFields = {
    "name", "target_amount", "current_amount", "target_date", "priority", "status", "created_at"
};

namespace {

const char* kGoalColumns =
    "g.id, g.user_id, g.name, g.description, g.target_amount, g.current_amount, g.target_date, "
    "g.priority, g.status, g.category, g.created_at, g.updated_at";

std::optional<std::string> optionalDate(const std::optional<std::string>& date) {
    if (!date || date->empty()) return std::nullopt;
    return date;
}

} // namespace

GoalRepository::GoalRepository(ConnectionManager& conn)
    : conn_(conn) {}

Goal GoalRepository::create(const validation::CreateGoalRequest& request) {
    requireValid(validation::validateCreateGoalRequest(request));
    requireUser(conn_, request.user_id);

    const std::string id = utils::IdGenerator::uuidV4();
    conn_.runTransactionOrThrow({
        {"INSERT INTO goals (id, user_id, name, description, target_amount, current_amount, "
         "target_date, priority, status, category) VALUES (?, ?, ?, ?, ?, 0, ?, ?, 'active', ?)",
         {toValue(id), toValue(request.user_id), toValue(utils::InputValidator::sanitizeString(request.name)),
          toValue(cleanText(request.description)), toValue(*request.target_amount),
          toValue(optionalDate(request.target_date)), toValue(request.priority.value_or(1)),
          toValue(cleanText(request.category))}}
    });
    return getById(id, request.user_id);
}

std::optional<Goal> GoalRepository::findById(const std::string& id, const std::string& user_id) {
    requireUuid(id, "goal_id");
    auto row = conn_.queryOne(
        std::string("SELECT ") + kGoalColumns + " FROM goals g WHERE g.id = ? AND g.user_id = ?",
        {toValue(id), toValue(user_id)});
    if (!row) return std::nullopt;
    return Goal::fromRow(*row);
}

Goal GoalRepository::getById(const std::string& id, const std::string& user_id) {
    auto goal = findById(id, user_id);
    if (!goal) {
        throw NotFoundError("Goal", id);
    }
    return *goal;
}

std::vector<Goal> GoalRepository::listForUser(const std::string& user_id, const ListOptions& options) {
    requireUuid(user_id, "user_id");
    if (options.status && !goalStatusFromString(*options.status)) {
        requireValid(validation::ValidationResult::fromErrors({
            {"status", "Invalid goal status", validation::ValidationCode::InvalidFormat}}));
    }
    const std::string order = orderClause(options.sort_by, options.sort_direction, kGoalSortFields, "g",
                                          "g.priority DESC, g.target_date IS NULL, g.target_date ASC, g.id ASC");

    std::string sql = std::string("SELECT ") + kGoalColumns + " FROM goals g WHERE g.user_id = ?";
    storage::Params params{toValue(user_id)};
    if (options.status) {
        sql += " AND g.status = ?";
        params.push_back(toValue(*options.status));
    }
    if (options.category) {
        sql += " AND g.category = ?";
        params.push_back(toValue(*options.category));
    }
    sql += " ORDER BY " + order;
    return conn_.query<Goal>(sql, params, &Goal::fromRow);
}

Goal GoalRepository::update(const std::string& id, const std::string& user_id,
                            const validation::UpdateGoalRequest& request) {
    requireValid(validation::validateUpdateGoalRequest(request));
    getById(id, user_id);

    UpdateBuilder changes;
    if (request.name) changes.set("name", toValue(utils::InputValidator::sanitizeString(*request.name)));
    if (request.description) changes.set("description", toValue(cleanText(request.description)));
    if (request.target_amount) changes.set("target_amount", toValue(*request.target_amount));
    if (request.target_date) changes.set("target_date", toValue(optionalDate(request.target_date)));
    if (request.priority) changes.set("priority", toValue(*request.priority));
    if (request.status) changes.set("status", toValue(*request.status));
    if (request.category) changes.set("category", toValue(cleanText(request.category)));

    if (!changes.empty()) {
        conn_.runTransactionOrThrow({changes.build("goals", id, user_id)});
    }
    return getById(id, user_id);
}

void GoalRepository::remove(const std::string& id, const std::string& user_id) {
    getById(id, user_id);
    conn_.runTransactionOrThrow({
        {"DELETE FROM goals WHERE id = ? AND user_id = ?", {toValue(id), toValue(user_id)}}
    });
}

Goal GoalRepository::addContribution(const std::string& id, const std::string& user_id,
                                     std::optional<double> amount) {
    requireValid(validation::ValidationResult::fromErrors(
        validation::validateAmount(amount, "amount", false, false)));
    getById(id, user_id);

    // Status is derived from the stored row inside the same statement
    conn_.runTransactionOrThrow({
        {"UPDATE goals SET current_amount = current_amount + ?, "
         "status = CASE WHEN status = 'active' AND current_amount + ? >= target_amount "
         "THEN 'completed' ELSE status END, "
         "updated_at = CURRENT_TIMESTAMP WHERE id = ? AND user_id = ?",
         {toValue(*amount), toValue(*amount), toValue(id), toValue(user_id)}}
    });

    auto goal = getById(id, user_id);
    if (goal.status == GoalStatus::Completed) {
        FISCUS_INFO("Goal {} reached its target", id);
    }
    return goal;
}

GoalProgressSummary GoalRepository::progressSummary(const std::string& user_id) {
    requireUuid(user_id, "user_id");
    requireUser(conn_, user_id);

    GoalProgressSummary s;
    double progress_sum = 0.0;
    int64_t with_target = 0;
    for (const auto& goal : listForUser(user_id)) {
        ++s.total_goals;
        switch (goal.status) {
            case GoalStatus::Active: ++s.active_goals; break;
            case GoalStatus::Completed: ++s.completed_goals; break;
            case GoalStatus::Paused: ++s.paused_goals; break;
            case GoalStatus::Cancelled: break;
        }
        s.total_target += goal.target_amount;
        s.total_saved += goal.current_amount;
        if (goal.target_amount > 0.0) {
            progress_sum += goal.progressPercent();
            ++with_target;
        }
    }
    if (with_target > 0) {
        s.average_progress_percent = progress_sum / static_cast<double>(with_target);
    }
    return s;
}

} // namespace ledger
} // namespace fiscus
