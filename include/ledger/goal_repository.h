#pragma once

#include <optional>
#include <string>
#include <vector>
#include "ledger/models.h"
#include "validation/requests.h"

namespace fiscus {

class ConnectionManager;

namespace ledger {

extern const std::vector<std::string> kGoalSortFields;

/// Savings goals. current_amount only grows, through addContribution().
class GoalRepository {
public:
    struct ListOptions {
        std::optional<std::string> status;
        std::optional<std::string> category;
        std::optional<std::string> sort_by;
        std::optional<std::string> sort_direction;
    };

    explicit GoalRepository(ConnectionManager& conn);

    /// Status starts active, current_amount at zero
    Goal create(const validation::CreateGoalRequest& request);

    std::optional<Goal> findById(const std::string& id, const std::string& user_id);
    Goal getById(const std::string& id, const std::string& user_id);

    /// Default order: priority DESC, target_date ASC (undated last)
    std::vector<Goal> listForUser(const std::string& user_id, const ListOptions& options = {});

    /// An empty target_date clears it
    Goal update(const std::string& id, const std::string& user_id,
                const validation::UpdateGoalRequest& request);

    void remove(const std::string& id, const std::string& user_id);

    /// Adds a positive amount; an active goal that reaches its target
    /// becomes completed in the same write.
    Goal addContribution(const std::string& id, const std::string& user_id, std::optional<double> amount);

    GoalProgressSummary progressSummary(const std::string& user_id);

private:
    ConnectionManager& conn_;
};

} // namespace ledger
} // namespace fiscus
