#pragma once

#include <optional>
#include <string>
#include <vector>
#include "ledger/models.h"
#include "ledger/repository_support.h"
#include "query/pagination.h"
#include "validation/requests.h"

namespace fiscus {

class ConnectionManager;

namespace ledger {

/// Sortable account columns
extern const std::vector<std::string> kAccountSortFields;

/// Accounts and the seeded account types.
class AccountRepository {
public:
    struct ListOptions {
        std::optional<bool> is_active;
        std::optional<std::string> account_type_id;
        std::optional<std::string> currency;
        std::optional<std::string> sort_by;
        std::optional<std::string> sort_direction;
        std::optional<int64_t> offset;
        std::optional<int64_t> limit;
    };

    explicit AccountRepository(ConnectionManager& conn, RepositoryOptions options = {});

    std::vector<AccountType> listAccountTypes();
    std::optional<AccountType> findAccountTypeByCode(const std::string& code);

    /// Opening balance becomes both initial and current balance.
    /// Throws ValidationFailed, NotFoundError (user or account type)
    Account create(const validation::CreateAccountRequest& request);

    std::optional<Account> findById(const std::string& id, const std::string& user_id);
    /// Throws NotFoundError
    Account getById(const std::string& id, const std::string& user_id);

    query::Page<Account> listForUser(const std::string& user_id, const ListOptions& options = {});

    /// Descriptive fields and the active flag; balances are untouched
    Account update(const std::string& id, const std::string& user_id,
                   const validation::UpdateAccountRequest& request);

    /// Administrative correction of current_balance, no transaction row
    Account updateBalance(const std::string& id, const std::string& user_id,
                          std::optional<double> new_balance);

    /// Accounts with transactions are deactivated, others deleted
    RemoveOutcome remove(const std::string& id, const std::string& user_id);

    /// Active accounts only; liabilities are reported as absolute values
    AccountSummary summary(const std::string& user_id);

private:
    ConnectionManager& conn_;
    RepositoryOptions options_;
};

} // namespace ledger
} // namespace fiscus
