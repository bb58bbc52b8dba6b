#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "ledger/models.h"
#include "ledger/repository_support.h"
#include "query/pagination.h"
#include "query/query_filter.h"
#include "query/statistics_aggregator.h"
#include "query/transaction_query.h"
#include "storage/value.h"
#include "validation/requests.h"

namespace fiscus {

class ConnectionManager;

namespace ledger {

enum class ExportFormat { Csv, Json };

const char* toString(ExportFormat format);
std::optional<ExportFormat> exportFormatFromString(const std::string& s);

/**
 * @brief Transactions, transfers and the balance bookkeeping attached to them.
 *
 * Every write is a single runTransaction batch: the transaction rows, the
 * account balance deltas and (for new expenses) the budget spent amount
 * commit together or not at all. Balance effects follow balanceDelta();
 * cancelled transactions have none.
 *
 * Transfer legs belong to their transfer: update() and remove() on a leg
 * throw ConflictError, removeTransfer() deletes both legs.
 */
class TransactionRepository {
public:
    explicit TransactionRepository(ConnectionManager& conn, RepositoryOptions options = {});

    // ===== Single transactions =====

    /// Throws ValidationFailed, NotFoundError (user, account, category)
    Transaction create(const validation::CreateTransactionRequest& request);

    std::optional<Transaction> findById(const std::string& id, const std::string& user_id);
    Transaction getById(const std::string& id, const std::string& user_id);

    /// Paginated listing; throws ValidationFailed for an invalid filter
    query::Page<Transaction> list(const query::TransactionFilter& filter);

    /// Reverses the stored balance effect and applies the updated one.
    /// Budget spent amounts are not revisited.
    Transaction update(const std::string& id, const std::string& user_id,
                       const validation::UpdateTransactionRequest& request);

    /// Deletes the row and reverses its balance effect
    void remove(const std::string& id, const std::string& user_id);

    // ===== Aggregates (same WHERE clause as list) =====

    query::TransactionStatistics statistics(const query::TransactionFilter& filter);
    std::vector<query::CategorySpending> categorySpending(const query::TransactionFilter& filter);
    std::vector<query::MonthlySummary> monthlySeries(const query::TransactionFilter& filter);

    // ===== Transfers =====

    /// Two completed legs (-amount on the source, +amount on the
    /// destination), the transfer row and both balance updates, atomically.
    Transfer createTransfer(const validation::CreateTransferRequest& request);

    std::optional<Transfer> findTransfer(const std::string& id, const std::string& user_id);

    /// Newest first; account_id matches either side
    std::vector<Transfer> listTransfers(const std::string& user_id,
                                        const std::optional<std::string>& account_id = std::nullopt);

    /// Deletes the transfer and both legs, reversing both balances
    void removeTransfer(const std::string& id, const std::string& user_id);

    // ===== Bulk operations (1..max_bulk_items ids, all or nothing) =====

    /// Returns the number of deleted transactions
    size_t bulkDelete(const validation::BulkTransactionRequest& request);

    /// Re-evaluates balance effects under the new status
    size_t bulkUpdateStatus(const validation::BulkTransactionRequest& request, const std::string& status);

    /// Empty or absent category_id clears the category
    size_t bulkUpdateCategory(const validation::BulkTransactionRequest& request,
                              const std::optional<std::string>& category_id);

    /// Selected transactions in request order
    std::string exportTransactions(const validation::BulkTransactionRequest& request, ExportFormat format);

    /// Every transaction matching the filter, in filter order, unpaginated
    std::string exportFiltered(const query::TransactionFilter& filter, ExportFormat format);

    /// CSV header shared by both export paths
    static const char* csvHeader();
    static std::string toCsv(const std::vector<Transaction>& transactions);
    static std::string toJsonText(const std::vector<Transaction>& transactions);

private:
    ConnectionManager& conn_;
    RepositoryOptions options_;
    query::TransactionQueryBuilder builder_;
    query::StatisticsAggregator stats_;

    bool isTransferLeg(const std::string& transaction_id);

    /// Validated, de-duplicated ids of the request, all owned by the user.
    /// Throws ValidationFailed, NotFoundError, ConflictError (transfer legs
    /// when reject_legs is set)
    std::vector<std::string> resolveBulk(const validation::BulkTransactionRequest& request, bool reject_legs);

    static storage::Statement reverseBalance(const std::string& transaction_id);
    static storage::Statement applyBalance(const std::string& transaction_id);
};

} // namespace ledger
} // namespace fiscus
