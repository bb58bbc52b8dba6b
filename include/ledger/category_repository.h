#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ledger/models.h"
#include "ledger/repository_support.h"
#include "validation/requests.h"

namespace fiscus {

class ConnectionManager;

namespace ledger {

/// Category with its active descendants
struct CategoryNode {
    Category category;
    std::vector<CategoryNode> children;

    nlohmann::json toJson() const;
};

/// Per-user category tree. parent_category_id never forms a cycle.
class CategoryRepository {
public:
    explicit CategoryRepository(ConnectionManager& conn);

    /// Parent must exist and belong to the same user.
    /// Throws ValidationFailed, NotFoundError
    Category create(const validation::CreateCategoryRequest& request);

    std::optional<Category> findById(const std::string& id, const std::string& user_id);
    Category getById(const std::string& id, const std::string& user_id);

    /// Sorted by name; inactive categories only when requested
    std::vector<Category> listForUser(const std::string& user_id,
                                      std::optional<bool> is_income = std::nullopt,
                                      bool include_inactive = false);

    /// An empty parent_category_id detaches the category.
    /// Throws ConflictError when the new parent is the category itself or
    /// one of its descendants.
    Category update(const std::string& id, const std::string& user_id,
                    const validation::UpdateCategoryRequest& request);

    /// Categories referenced by transactions or active subcategories are
    /// deactivated, others deleted
    RemoveOutcome remove(const std::string& id, const std::string& user_id);

    /// Active categories as a forest, roots and siblings sorted by name
    std::vector<CategoryNode> hierarchy(const std::string& user_id,
                                        std::optional<bool> is_income = std::nullopt);

private:
    ConnectionManager& conn_;

    bool wouldCreateCycle(const std::string& id, const std::string& proposed_parent);
};

} // namespace ledger
} // namespace fiscus
