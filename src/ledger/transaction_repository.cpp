#include "ledger/transaction_repository.h"
#include "transaction/connection_manager.h"
#include "utils/id_generator.h"
#include "utils/input_validator.h"
#include "utils/logger.h"
#include "validation/request_validators.h"
#include "validation/validator.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace fiscus {
namespace ledger {

using storage::toValue;
using validation::ValidationCode;

namespace {

const char* kTransferColumns =
    "id, user_id, from_account_id, to_account_id, from_transaction_id, to_transaction_id, "
    "amount, description, transfer_date, created_at";

std::string placeholders(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        out += (i == 0) ? "?" : ", ?";
    }
    return out;
}

storage::Value tagsValue(const std::optional<std::vector<std::string>>& tags) {
    if (!tags || tags->empty()) return storage::Value{};
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& tag : *tags) {
        auto clean = utils::InputValidator::sanitizeString(tag);
        if (!clean.empty()) arr.push_back(clean);
    }
    if (arr.empty()) return storage::Value{};
    return toValue(arr.dump());
}

// CSV cells must not contain the separator
std::string csvCell(const std::string& s) {
    std::string out = s;
    std::replace(out.begin(), out.end(), ',', ';');
    std::replace(out.begin(), out.end(), '\n', ' ');
    return out;
}

// "YYYY-MM-DD HH:MM:SS" from a stored date or date-time
std::string csvDateTime(const std::string& stored) {
    if (stored.size() == 10) return stored + " 00:00:00";
    std::string out = stored.substr(0, 19);
    if (out.size() > 10 && out[10] == 'T') out[10] = ' ';
    return out;
}

} // namespace

const char* toString(ExportFormat format) {
    return format == ExportFormat::Json ? "json" : "csv";
}

std::optional<ExportFormat> exportFormatFromString(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "csv") return ExportFormat::Csv;
    if (lower == "json") return ExportFormat::Json;
    return std::nullopt;
}

TransactionRepository::TransactionRepository(ConnectionManager& conn, RepositoryOptions options)
    : conn_(conn)
    , options_(options)
    , builder_(query::TransactionQueryBuilder::Options{options.default_page_size, options.max_page_size})
    , stats_(conn, builder_) {}

storage::Statement TransactionRepository::reverseBalance(const std::string& transaction_id) {
    return {std::string("UPDATE accounts SET current_balance = current_balance - "
                        "(SELECT ") + kBalanceDeltaSql + " FROM transactions WHERE id = ?), "
            "updated_at = CURRENT_TIMESTAMP "
            "WHERE id = (SELECT account_id FROM transactions WHERE id = ?)",
            {toValue(transaction_id), toValue(transaction_id)}};
}

storage::Statement TransactionRepository::applyBalance(const std::string& transaction_id) {
    return {std::string("UPDATE accounts SET current_balance = current_balance + "
                        "(SELECT ") + kBalanceDeltaSql + " FROM transactions WHERE id = ?), "
            "updated_at = CURRENT_TIMESTAMP "
            "WHERE id = (SELECT account_id FROM transactions WHERE id = ?)",
            {toValue(transaction_id), toValue(transaction_id)}};
}

bool TransactionRepository::isTransferLeg(const std::string& transaction_id) {
    return conn_.queryOne(
               "SELECT id FROM transfers WHERE from_transaction_id = ? OR to_transaction_id = ?",
               {toValue(transaction_id), toValue(transaction_id)})
        .has_value();
}

// ===== Single transactions =====

Transaction TransactionRepository::create(const validation::CreateTransactionRequest& request) {
    requireValid(validation::validateCreateTransactionRequest(request));
    requireUser(conn_, request.user_id);
    requireOwned(conn_, "accounts", "Account", request.account_id, request.user_id);

    std::optional<std::string> category;
    if (request.category_id && !request.category_id->empty()) {
        category = request.category_id;
        requireOwned(conn_, "categories", "Category", *category, request.user_id);
    }

    const auto type = *transactionTypeFromString(request.transaction_type);
    if (type == TransactionType::Transfer) {
        throw ConflictError("Transfer transactions are created in pairs; use createTransfer");
    }
    const auto status = request.status ? *transactionStatusFromString(*request.status)
                                       : TransactionStatus::Completed;
    const double amount = *request.amount;
    const std::string date = validation::normalizeDateTime(request.transaction_date);
    const std::string id = utils::IdGenerator::uuidV4();

    std::vector<storage::Statement> batch;
    batch.push_back({
        "INSERT INTO transactions (id, user_id, account_id, category_id, amount, description, notes, "
        "transaction_date, transaction_type, status, reference_number, payee, tags) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        {toValue(id), toValue(request.user_id), toValue(request.account_id), toValue(category),
         toValue(amount), toValue(utils::InputValidator::sanitizeString(request.description)),
         toValue(cleanText(request.notes)), toValue(date), toValue(toString(type)),
         toValue(toString(status)), toValue(cleanText(request.reference_number)),
         toValue(cleanText(request.payee)), tagsValue(request.tags)}
    });

    if (status != TransactionStatus::Cancelled) {
        batch.push_back({
            "UPDATE accounts SET current_balance = current_balance + ?, updated_at = CURRENT_TIMESTAMP "
            "WHERE id = ? AND user_id = ?",
            {toValue(balanceDelta(type, amount)), toValue(request.account_id), toValue(request.user_id)}
        });

        // Spent amounts only grow; the budget is the one whose period covers the date.
        // Negative expenses are refunds and leave spent_amount alone.
        if (type == TransactionType::Expense && category && amount > 0) {
            batch.push_back({
                "UPDATE budgets SET spent_amount = spent_amount + ?, updated_at = CURRENT_TIMESTAMP "
                "WHERE user_id = ? AND category_id = ? AND budget_period_id IN ("
                "SELECT id FROM budget_periods WHERE user_id = ? "
                "AND DATE(?) BETWEEN DATE(start_date) AND DATE(end_date))",
                {toValue(amount), toValue(request.user_id), toValue(*category),
                 toValue(request.user_id), toValue(date)}
            });
        }
    }

    conn_.runTransactionOrThrow(batch);
    FISCUS_DEBUG("Created {} transaction {} on account {}", toString(type), id, request.account_id);
    return getById(id, request.user_id);
}

std::optional<Transaction> TransactionRepository::findById(const std::string& id, const std::string& user_id) {
    requireUuid(id, "transaction_id");
    auto row = conn_.queryOne(
        std::string("SELECT ") + query::TransactionQueryBuilder::selectColumns() +
            " FROM transactions t WHERE t.id = ? AND t.user_id = ?",
        {toValue(id), toValue(user_id)});
    if (!row) return std::nullopt;
    return Transaction::fromRow(*row);
}

Transaction TransactionRepository::getById(const std::string& id, const std::string& user_id) {
    auto tx = findById(id, user_id);
    if (!tx) {
        throw NotFoundError("Transaction", id);
    }
    return *tx;
}

query::Page<Transaction> TransactionRepository::list(const query::TransactionFilter& filter) {
    const auto plan = builder_.build(filter);
    requireUser(conn_, filter.user_id);

    auto countRow = conn_.queryOne(builder_.countSql(plan), plan.params);
    const int64_t total = countRow ? countRow->getInt("total") : 0;
    auto items = conn_.query<Transaction>(builder_.selectSql(plan), builder_.selectParams(plan),
                                          &Transaction::fromRow);
    return query::Page<Transaction>::make(std::move(items), total, plan.page);
}

Transaction TransactionRepository::update(const std::string& id, const std::string& user_id,
                                          const validation::UpdateTransactionRequest& request) {
    requireValid(validation::validateUpdateTransactionRequest(request));
    getById(id, user_id);
    if (isTransferLeg(id)) {
        throw ConflictError("Transaction " + id + " is part of a transfer; remove the transfer instead");
    }
    if (request.transaction_type &&
        transactionTypeFromString(*request.transaction_type) == TransactionType::Transfer) {
        throw ConflictError("A transaction cannot be turned into a transfer; use createTransfer");
    }

    UpdateBuilder changes;
    if (request.account_id) {
        requireOwned(conn_, "accounts", "Account", *request.account_id, user_id);
        changes.set("account_id", toValue(*request.account_id));
    }
    if (request.category_id) {
        if (request.category_id->empty()) {
            changes.set("category_id", storage::Value{});
        } else {
            requireOwned(conn_, "categories", "Category", *request.category_id, user_id);
            changes.set("category_id", toValue(*request.category_id));
        }
    }
    if (request.amount) changes.set("amount", toValue(*request.amount));
    if (request.description) {
        changes.set("description", toValue(utils::InputValidator::sanitizeString(*request.description)));
    }
    if (request.notes) changes.set("notes", toValue(cleanText(request.notes)));
    if (request.transaction_date) {
        changes.set("transaction_date", toValue(validation::normalizeDateTime(*request.transaction_date)));
    }
    if (request.transaction_type) changes.set("transaction_type", toValue(*request.transaction_type));
    if (request.status) changes.set("status", toValue(*request.status));
    if (request.reference_number) changes.set("reference_number", toValue(cleanText(request.reference_number)));
    if (request.payee) changes.set("payee", toValue(cleanText(request.payee)));
    if (request.tags) changes.set("tags", tagsValue(request.tags));

    if (changes.empty()) {
        return getById(id, user_id);
    }

    conn_.runTransactionOrThrow({
        reverseBalance(id),
        changes.build("transactions", id, user_id),
        applyBalance(id)
    });
    return getById(id, user_id);
}

void TransactionRepository::remove(const std::string& id, const std::string& user_id) {
    getById(id, user_id);
    if (isTransferLeg(id)) {
        throw ConflictError("Transaction " + id + " is part of a transfer; remove the transfer instead");
    }

    conn_.runTransactionOrThrow({
        reverseBalance(id),
        {"DELETE FROM transactions WHERE id = ? AND user_id = ?", {toValue(id), toValue(user_id)}}
    });
    FISCUS_DEBUG("Deleted transaction {}", id);
}

// ===== Aggregates =====

query::TransactionStatistics TransactionRepository::statistics(const query::TransactionFilter& filter) {
    return stats_.compute(filter);
}

std::vector<query::CategorySpending> TransactionRepository::categorySpending(const query::TransactionFilter& filter) {
    return stats_.categorySpending(filter);
}

std::vector<query::MonthlySummary> TransactionRepository::monthlySeries(const query::TransactionFilter& filter) {
    return stats_.monthlySeries(filter);
}

// ===== Transfers =====

Transfer TransactionRepository::createTransfer(const validation::CreateTransferRequest& request) {
    requireValid(validation::validateCreateTransferRequest(request));
    requireUser(conn_, request.user_id);
    requireOwned(conn_, "accounts", "Account", request.from_account_id, request.user_id);
    requireOwned(conn_, "accounts", "Account", request.to_account_id, request.user_id);

    const double amount = *request.amount;
    const std::string description = utils::InputValidator::sanitizeString(request.description);
    const std::string date = validation::normalizeDateTime(request.transfer_date);
    const std::string transfer_id = utils::IdGenerator::uuidV4();
    const std::string from_tx = utils::IdGenerator::uuidV4();
    const std::string to_tx = utils::IdGenerator::uuidV4();

    const std::string insertLeg =
        "INSERT INTO transactions (id, user_id, account_id, amount, description, transaction_date, "
        "transaction_type, status) VALUES (?, ?, ?, ?, ?, ?, 'transfer', 'completed')";
    const std::string moveBalance =
        "UPDATE accounts SET current_balance = current_balance + ?, updated_at = CURRENT_TIMESTAMP "
        "WHERE id = ? AND user_id = ?";

    conn_.runTransactionOrThrow({
        {insertLeg, {toValue(from_tx), toValue(request.user_id), toValue(request.from_account_id),
                     toValue(-amount), toValue("Transfer to account: " + description),
                     toValue(date)}},
        {insertLeg, {toValue(to_tx), toValue(request.user_id), toValue(request.to_account_id),
                     toValue(amount), toValue("Transfer from account: " + description),
                     toValue(date)}},
        {"INSERT INTO transfers (id, user_id, from_account_id, to_account_id, from_transaction_id, "
         "to_transaction_id, amount, description, transfer_date) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
         {toValue(transfer_id), toValue(request.user_id), toValue(request.from_account_id),
          toValue(request.to_account_id), toValue(from_tx), toValue(to_tx), toValue(amount),
          toValue(cleanText(description)), toValue(date)}},
        {moveBalance, {toValue(-amount), toValue(request.from_account_id), toValue(request.user_id)}},
        {moveBalance, {toValue(amount), toValue(request.to_account_id), toValue(request.user_id)}}
    });

    FISCUS_INFO("Transfer {} from {} to {}", transfer_id, request.from_account_id, request.to_account_id);
    auto created = findTransfer(transfer_id, request.user_id);
    if (!created) {
        throw NotFoundError("Transfer", transfer_id);
    }
    return *created;
}

std::optional<Transfer> TransactionRepository::findTransfer(const std::string& id, const std::string& user_id) {
    requireUuid(id, "transfer_id");
    auto row = conn_.queryOne(
        std::string("SELECT ") + kTransferColumns + " FROM transfers WHERE id = ? AND user_id = ?",
        {toValue(id), toValue(user_id)});
    if (!row) return std::nullopt;
    return Transfer::fromRow(*row);
}

std::vector<Transfer> TransactionRepository::listTransfers(const std::string& user_id,
                                                           const std::optional<std::string>& account_id) {
    requireUuid(user_id, "user_id");
    std::string sql = std::string("SELECT ") + kTransferColumns + " FROM transfers WHERE user_id = ?";
    storage::Params params{toValue(user_id)};
    if (account_id) {
        requireUuid(*account_id, "account_id");
        sql += " AND (from_account_id = ? OR to_account_id = ?)";
        params.push_back(toValue(*account_id));
        params.push_back(toValue(*account_id));
    }
    sql += " ORDER BY transfer_date DESC, created_at DESC, id ASC";
    return conn_.query<Transfer>(sql, params, &Transfer::fromRow);
}

void TransactionRepository::removeTransfer(const std::string& id, const std::string& user_id) {
    auto transfer = findTransfer(id, user_id);
    if (!transfer) {
        throw NotFoundError("Transfer", id);
    }

    conn_.runTransactionOrThrow({
        reverseBalance(transfer->from_transaction_id),
        reverseBalance(transfer->to_transaction_id),
        {"DELETE FROM transfers WHERE id = ? AND user_id = ?", {toValue(id), toValue(user_id)}},
        {"DELETE FROM transactions WHERE id IN (?, ?) AND user_id = ?",
         {toValue(transfer->from_transaction_id), toValue(transfer->to_transaction_id), toValue(user_id)}}
    });
    FISCUS_INFO("Removed transfer {}", id);
}

// ===== Bulk operations =====

std::vector<std::string> TransactionRepository::resolveBulk(const validation::BulkTransactionRequest& request,
                                                            bool reject_legs) {
    requireValid(validation::validateBulkRequest(request, options_.max_bulk_items));
    requireUser(conn_, request.user_id);

    std::vector<std::string> ids;
    std::set<std::string> seen;
    for (const auto& id : request.transaction_ids) {
        if (seen.insert(id).second) ids.push_back(id);
    }

    storage::Params params{toValue(request.user_id)};
    for (const auto& id : ids) params.push_back(toValue(id));
    auto rows = conn_.query("SELECT id FROM transactions WHERE user_id = ? AND id IN (" +
                                placeholders(ids.size()) + ")",
                            params);
    std::set<std::string> owned;
    for (const auto& row : rows) owned.insert(row.getString("id"));
    for (const auto& id : ids) {
        if (owned.count(id) == 0) {
            throw NotFoundError("Transaction", id);
        }
    }

    if (reject_legs) {
        storage::Params legParams;
        for (const auto& id : ids) legParams.push_back(toValue(id));
        for (const auto& id : ids) legParams.push_back(toValue(id));
        const std::string in = placeholders(ids.size());
        auto legs = conn_.query("SELECT id FROM transfers WHERE from_transaction_id IN (" + in +
                                    ") OR to_transaction_id IN (" + in + ") LIMIT 1",
                                legParams);
        if (!legs.empty()) {
            throw ConflictError("Bulk selection contains transfer legs of transfer " +
                                legs.front().getString("id"));
        }
    }
    return ids;
}

size_t TransactionRepository::bulkDelete(const validation::BulkTransactionRequest& request) {
    const auto ids = resolveBulk(request, true);

    std::vector<storage::Statement> batch;
    batch.reserve(ids.size() * 2);
    for (const auto& id : ids) {
        batch.push_back(reverseBalance(id));
        batch.push_back({"DELETE FROM transactions WHERE id = ? AND user_id = ?",
                         {toValue(id), toValue(request.user_id)}});
    }
    conn_.runTransactionOrThrow(batch);

    FISCUS_INFO("Bulk deleted {} transactions for user {}", ids.size(), request.user_id);
    return ids.size();
}

size_t TransactionRepository::bulkUpdateStatus(const validation::BulkTransactionRequest& request,
                                               const std::string& status) {
    if (!transactionStatusFromString(status)) {
        requireValid(validation::ValidationResult::fromErrors({
            {"status", "Invalid transaction status: " + utils::InputValidator::sanitizeForLogs(status, 32),
             ValidationCode::InvalidFormat}}));
    }
    const auto ids = resolveBulk(request, true);

    std::vector<storage::Statement> batch;
    batch.reserve(ids.size() * 3);
    for (const auto& id : ids) {
        UpdateBuilder changes;
        changes.set("status", toValue(status));
        batch.push_back(reverseBalance(id));
        batch.push_back(changes.build("transactions", id, request.user_id));
        batch.push_back(applyBalance(id));
    }
    conn_.runTransactionOrThrow(batch);

    FISCUS_INFO("Bulk status '{}' applied to {} transactions", status, ids.size());
    return ids.size();
}

size_t TransactionRepository::bulkUpdateCategory(const validation::BulkTransactionRequest& request,
                                                 const std::optional<std::string>& category_id) {
    std::optional<std::string> category;
    if (category_id && !category_id->empty()) {
        requireUuid(*category_id, "category_id");
        category = category_id;
    }
    const auto ids = resolveBulk(request, false);
    if (category) {
        requireOwned(conn_, "categories", "Category", *category, request.user_id);
    }

    std::vector<storage::Statement> batch;
    batch.reserve(ids.size());
    for (const auto& id : ids) {
        UpdateBuilder changes;
        changes.set("category_id", toValue(category));
        batch.push_back(changes.build("transactions", id, request.user_id));
    }
    conn_.runTransactionOrThrow(batch);
    return ids.size();
}

std::string TransactionRepository::exportTransactions(const validation::BulkTransactionRequest& request,
                                                      ExportFormat format) {
    const auto ids = resolveBulk(request, false);

    std::vector<Transaction> selected;
    selected.reserve(ids.size());
    for (const auto& id : ids) {
        selected.push_back(getById(id, request.user_id));
    }
    return format == ExportFormat::Json ? toJsonText(selected) : toCsv(selected);
}

std::string TransactionRepository::exportFiltered(const query::TransactionFilter& filter, ExportFormat format) {
    const auto plan = builder_.build(filter);
    requireUser(conn_, filter.user_id);

    auto all = conn_.query<Transaction>(
        std::string("SELECT ") + query::TransactionQueryBuilder::selectColumns() +
            " FROM transactions t WHERE " + plan.where + " ORDER BY " + plan.order_by,
        plan.params, &Transaction::fromRow);
    FISCUS_INFO("Exporting {} transactions as {}", all.size(), toString(format));
    return format == ExportFormat::Json ? toJsonText(all) : toCsv(all);
}

const char* TransactionRepository::csvHeader() {
    return "id,account_id,category_id,amount,description,transaction_date,transaction_type,status,payee,notes";
}

std::string TransactionRepository::toCsv(const std::vector<Transaction>& transactions) {
    std::string out = csvHeader();
    out += "\n";
    for (const auto& t : transactions) {
        out += fmt::format("{},{},{},{:.2f},{},{},{},{},{},{}\n",
                           t.id, t.account_id, t.category_id.value_or(""), t.amount,
                           csvCell(t.description), csvDateTime(t.transaction_date),
                           toString(t.transaction_type), toString(t.status),
                           csvCell(t.payee.value_or("")), csvCell(t.notes.value_or("")));
    }
    return out;
}

std::string TransactionRepository::toJsonText(const std::vector<Transaction>& transactions) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& t : transactions) {
        arr.push_back(t.toJson());
    }
    return arr.dump(2);
}

} // namespace ledger
} // namespace fiscus
