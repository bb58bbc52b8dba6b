#include "ledger/account_repository.h"
#include "transaction/connection_manager.h"
#include "utils/id_generator.h"
#include "utils/input_validator.h"
#include "utils/logger.h"
#include "validation/request_validators.h"
#include "validation/validator.h"

namespace fiscus {
namespace ledger {

using storage::toValue;

const std::vector<std::string> kAccountSortFields = {
    "name", "current_balance", "currency", "created_at", "updated_at"
};

namespace {

const char* kAccountColumns =
    "a.id, a.user_id, a.account_type_id, a.name, a.description, a.initial_balance, "
    "a.current_balance, a.currency, a.is_active, a.institution_name, a.account_number, "
    "a.created_at, a.updated_at";

const char* kAccountTypeColumns = "id, code, name, description, is_asset";

} // namespace

AccountRepository::AccountRepository(ConnectionManager& conn, RepositoryOptions options)
    : conn_(conn)
    , options_(options) {}

std::vector<AccountType> AccountRepository::listAccountTypes() {
    return conn_.query<AccountType>(
        std::string("SELECT ") + kAccountTypeColumns + " FROM account_types ORDER BY name",
        {}, &AccountType::fromRow);
}

std::optional<AccountType> AccountRepository::findAccountTypeByCode(const std::string& code) {
    auto row = conn_.queryOne(
        std::string("SELECT ") + kAccountTypeColumns + " FROM account_types WHERE code = ?",
        {toValue(code)});
    if (!row) return std::nullopt;
    return AccountType::fromRow(*row);
}

Account AccountRepository::create(const validation::CreateAccountRequest& request) {
    requireValid(validation::validateCreateAccountRequest(request));
    requireUser(conn_, request.user_id);
    if (!conn_.queryOne("SELECT id FROM account_types WHERE id = ?", {toValue(request.account_type_id)})) {
        throw NotFoundError("AccountType", request.account_type_id);
    }

    const std::string id = utils::IdGenerator::uuidV4();
    const double balance = request.balance.value_or(0.0);
    conn_.runTransactionOrThrow({
        {"INSERT INTO accounts (id, user_id, account_type_id, name, description, initial_balance, "
         "current_balance, currency, is_active, institution_name, account_number) "
         "VALUES (?, ?, ?, ?, ?, ?, ?, ?, 1, ?, ?)",
         {toValue(id), toValue(request.user_id), toValue(request.account_type_id),
          toValue(utils::InputValidator::sanitizeString(request.name)), toValue(cleanText(request.description)),
          toValue(balance), toValue(balance), toValue(request.currency),
          toValue(cleanText(request.institution_name)), toValue(cleanText(request.account_number))}}
    });

    FISCUS_INFO("Created account {} for user {}", id, request.user_id);
    return getById(id, request.user_id);
}

std::optional<Account> AccountRepository::findById(const std::string& id, const std::string& user_id) {
    requireUuid(id, "account_id");
    auto row = conn_.queryOne(
        std::string("SELECT ") + kAccountColumns + " FROM accounts a WHERE a.id = ? AND a.user_id = ?",
        {toValue(id), toValue(user_id)});
    if (!row) return std::nullopt;
    return Account::fromRow(*row);
}

Account AccountRepository::getById(const std::string& id, const std::string& user_id) {
    auto account = findById(id, user_id);
    if (!account) {
        throw NotFoundError("Account", id);
    }
    return *account;
}

query::Page<Account> AccountRepository::listForUser(const std::string& user_id, const ListOptions& options) {
    requireUuid(user_id, "user_id");
    if (options.account_type_id) requireUuid(*options.account_type_id, "account_type_id");
    const std::string order = orderClause(options.sort_by, options.sort_direction, kAccountSortFields,
                                          "a", "a.created_at DESC, a.id ASC");

    std::string where = "a.user_id = ?";
    storage::Params params{toValue(user_id)};
    if (options.is_active) {
        where += " AND a.is_active = ?";
        params.push_back(toValue(*options.is_active));
    }
    if (options.account_type_id) {
        where += " AND a.account_type_id = ?";
        params.push_back(toValue(*options.account_type_id));
    }
    if (options.currency) {
        where += " AND a.currency = ?";
        params.push_back(toValue(*options.currency));
    }

    const auto page = query::PageRequest::normalize(options.offset, options.limit,
                                                    options_.default_page_size, options_.max_page_size);

    auto countRow = conn_.queryOne("SELECT COUNT(*) AS total FROM accounts a WHERE " + where, params);
    const int64_t total = countRow ? countRow->getInt("total") : 0;

    storage::Params pageParams = params;
    pageParams.push_back(toValue(page.limit));
    pageParams.push_back(toValue(page.offset));
    auto items = conn_.query<Account>(
        std::string("SELECT ") + kAccountColumns + " FROM accounts a WHERE " + where +
            " ORDER BY " + order + " LIMIT ? OFFSET ?",
        pageParams, &Account::fromRow);

    return query::Page<Account>::make(std::move(items), total, page);
}

Account AccountRepository::update(const std::string& id, const std::string& user_id,
                                  const validation::UpdateAccountRequest& request) {
    requireValid(validation::validateUpdateAccountRequest(request));
    getById(id, user_id);

    UpdateBuilder changes;
    if (request.name) changes.set("name", toValue(utils::InputValidator::sanitizeString(*request.name)));
    if (request.description) changes.set("description", toValue(cleanText(request.description)));
    if (request.institution_name) changes.set("institution_name", toValue(cleanText(request.institution_name)));
    if (request.account_number) changes.set("account_number", toValue(cleanText(request.account_number)));
    if (request.is_active) changes.set("is_active", toValue(*request.is_active));

    if (!changes.empty()) {
        conn_.runTransactionOrThrow({changes.build("accounts", id, user_id)});
    }
    return getById(id, user_id);
}

Account AccountRepository::updateBalance(const std::string& id, const std::string& user_id,
                                         std::optional<double> new_balance) {
    requireValid(validation::ValidationResult::fromErrors(
        validation::validateAmount(new_balance, "balance", true)));
    getById(id, user_id);

    UpdateBuilder changes;
    changes.set("current_balance", toValue(*new_balance));
    conn_.runTransactionOrThrow({changes.build("accounts", id, user_id)});

    FISCUS_INFO("Balance of account {} set administratively", id);
    return getById(id, user_id);
}

RemoveOutcome AccountRepository::remove(const std::string& id, const std::string& user_id) {
    getById(id, user_id);

    auto countRow = conn_.queryOne("SELECT COUNT(*) AS n FROM transactions WHERE account_id = ?",
                                   {toValue(id)});
    if (countRow && countRow->getInt("n") > 0) {
        UpdateBuilder changes;
        changes.set("is_active", toValue(false));
        conn_.runTransactionOrThrow({changes.build("accounts", id, user_id)});
        FISCUS_INFO("Account {} has transactions, deactivated", id);
        return RemoveOutcome::Deactivated;
    }

    conn_.runTransactionOrThrow({
        {"DELETE FROM accounts WHERE id = ? AND user_id = ?", {toValue(id), toValue(user_id)}}
    });
    FISCUS_INFO("Deleted account {}", id);
    return RemoveOutcome::Deleted;
}

AccountSummary AccountRepository::summary(const std::string& user_id) {
    requireUuid(user_id, "user_id");
    requireUser(conn_, user_id);

    auto rows = conn_.query(
        "SELECT at.is_asset AS is_asset, COUNT(*) AS n, COALESCE(SUM(a.current_balance), 0) AS total, "
        "COALESCE(SUM(ABS(a.current_balance)), 0) AS total_abs "
        "FROM accounts a JOIN account_types at ON a.account_type_id = at.id "
        "WHERE a.user_id = ? AND a.is_active = 1 GROUP BY at.is_asset",
        {toValue(user_id)});

    AccountSummary s;
    for (const auto& row : rows) {
        s.account_count += row.getInt("n");
        if (row.getBool("is_asset")) {
            s.total_assets += row.getDouble("total");
        } else {
            s.total_liabilities += row.getDouble("total_abs");
        }
    }
    s.net_worth = s.total_assets - s.total_liabilities;
    return s;
}

} // namespace ledger
} // namespace fiscus
