#include "ledger/models.h"

#include <algorithm>

namespace fiscus {
namespace ledger {

namespace {

template<typename E>
struct EnumName {
    E value;
    const char* name;
};

constexpr EnumName<TransactionType> kTypeNames[] = {
    {TransactionType::Income, "income"},
    {TransactionType::Expense, "expense"},
    {TransactionType::Transfer, "transfer"},
};

constexpr EnumName<TransactionStatus> kStatusNames[] = {
    {TransactionStatus::Pending, "pending"},
    {TransactionStatus::Completed, "completed"},
    {TransactionStatus::Cancelled, "cancelled"},
};

constexpr EnumName<GoalStatus> kGoalStatusNames[] = {
    {GoalStatus::Active, "active"},
    {GoalStatus::Completed, "completed"},
    {GoalStatus::Paused, "paused"},
    {GoalStatus::Cancelled, "cancelled"},
};

template<typename E, size_t N>
const char* nameOf(const EnumName<E> (&table)[N], E value) {
    for (const auto& e : table) {
        if (e.value == value) return e.name;
    }
    return table[0].name;
}

template<typename E, size_t N>
std::optional<E> valueOf(const EnumName<E> (&table)[N], const std::string& name) {
    for (const auto& e : table) {
        if (name == e.name) return e.value;
    }
    return std::nullopt;
}

nlohmann::json optionalJson(const std::optional<std::string>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

std::vector<std::string> parseTags(const std::optional<std::string>& text) {
    std::vector<std::string> tags;
    if (!text || text->empty()) return tags;
    auto j = nlohmann::json::parse(*text, nullptr, false);
    if (j.is_discarded() || !j.is_array()) return tags;
    for (const auto& t : j) {
        if (t.is_string()) tags.push_back(t.get<std::string>());
    }
    return tags;
}

} // namespace

const char* toString(TransactionType t) { return nameOf(kTypeNames, t); }
const char* toString(TransactionStatus s) { return nameOf(kStatusNames, s); }
const char* toString(GoalStatus s) { return nameOf(kGoalStatusNames, s); }

std::optional<TransactionType> transactionTypeFromString(const std::string& s) {
    return valueOf(kTypeNames, s);
}

std::optional<TransactionStatus> transactionStatusFromString(const std::string& s) {
    return valueOf(kStatusNames, s);
}

std::optional<GoalStatus> goalStatusFromString(const std::string& s) {
    return valueOf(kGoalStatusNames, s);
}

double balanceDelta(TransactionType type, double amount) {
    switch (type) {
        case TransactionType::Income: return amount;
        case TransactionType::Expense: return -amount;
        case TransactionType::Transfer: return amount;
    }
    return 0.0;
}

// ===== User =====

User User::fromRow(const storage::Row& row) {
    User u;
    u.id = row.getString("id");
    u.username = row.getString("username");
    u.email = row.getOptionalString("email");
    u.password_hash = row.getString("password_hash");
    u.created_at = row.getString("created_at");
    u.updated_at = row.getString("updated_at");
    return u;
}

nlohmann::json User::toJson() const {
    return {
        {"id", id},
        {"username", username},
        {"email", optionalJson(email)},
        {"created_at", created_at},
        {"updated_at", updated_at}
    };
}

// ===== AccountType =====

AccountType AccountType::fromRow(const storage::Row& row) {
    AccountType t;
    t.id = row.getString("id");
    t.code = row.getString("code");
    t.name = row.getString("name");
    t.description = row.getOptionalString("description");
    t.is_asset = row.getBool("is_asset", true);
    return t;
}

nlohmann::json AccountType::toJson() const {
    return {
        {"id", id},
        {"code", code},
        {"name", name},
        {"description", optionalJson(description)},
        {"is_asset", is_asset}
    };
}

// ===== Account =====

Account Account::fromRow(const storage::Row& row) {
    Account a;
    a.id = row.getString("id");
    a.user_id = row.getString("user_id");
    a.account_type_id = row.getString("account_type_id");
    a.name = row.getString("name");
    a.description = row.getOptionalString("description");
    a.initial_balance = row.getDouble("initial_balance");
    a.current_balance = row.getDouble("current_balance");
    a.currency = row.getString("currency", "USD");
    a.is_active = row.getBool("is_active", true);
    a.institution_name = row.getOptionalString("institution_name");
    a.account_number = row.getOptionalString("account_number");
    a.created_at = row.getString("created_at");
    a.updated_at = row.getString("updated_at");
    return a;
}

nlohmann::json Account::toJson() const {
    return {
        {"id", id},
        {"user_id", user_id},
        {"account_type_id", account_type_id},
        {"name", name},
        {"description", optionalJson(description)},
        {"initial_balance", initial_balance},
        {"current_balance", current_balance},
        {"currency", currency},
        {"is_active", is_active},
        {"institution_name", optionalJson(institution_name)},
        {"account_number", optionalJson(account_number)},
        {"created_at", created_at},
        {"updated_at", updated_at}
    };
}

// ===== Category =====

Category Category::fromRow(const storage::Row& row) {
    Category c;
    c.id = row.getString("id");
    c.user_id = row.getString("user_id");
    c.name = row.getString("name");
    c.description = row.getOptionalString("description");
    c.color = row.getOptionalString("color");
    c.icon = row.getOptionalString("icon");
    c.parent_category_id = row.getOptionalString("parent_category_id");
    c.is_income = row.getBool("is_income");
    c.is_active = row.getBool("is_active", true);
    c.created_at = row.getString("created_at");
    c.updated_at = row.getString("updated_at");
    return c;
}

nlohmann::json Category::toJson() const {
    return {
        {"id", id},
        {"user_id", user_id},
        {"name", name},
        {"description", optionalJson(description)},
        {"color", optionalJson(color)},
        {"icon", optionalJson(icon)},
        {"parent_category_id", optionalJson(parent_category_id)},
        {"is_income", is_income},
        {"is_active", is_active},
        {"created_at", created_at},
        {"updated_at", updated_at}
    };
}

// ===== Transaction =====

Transaction Transaction::fromRow(const storage::Row& row) {
    Transaction t;
    t.id = row.getString("id");
    t.user_id = row.getString("user_id");
    t.account_id = row.getString("account_id");
    t.category_id = row.getOptionalString("category_id");
    t.amount = row.getDouble("amount");
    t.description = row.getString("description");
    t.notes = row.getOptionalString("notes");
    t.transaction_date = row.getString("transaction_date");
    t.transaction_type = transactionTypeFromString(row.getString("transaction_type"))
                             .value_or(TransactionType::Expense);
    t.status = transactionStatusFromString(row.getString("status")).value_or(TransactionStatus::Completed);
    t.reference_number = row.getOptionalString("reference_number");
    t.payee = row.getOptionalString("payee");
    t.tags = parseTags(row.getOptionalString("tags"));
    t.created_at = row.getString("created_at");
    t.updated_at = row.getString("updated_at");
    return t;
}

nlohmann::json Transaction::toJson() const {
    return {
        {"id", id},
        {"user_id", user_id},
        {"account_id", account_id},
        {"category_id", optionalJson(category_id)},
        {"amount", amount},
        {"description", description},
        {"notes", optionalJson(notes)},
        {"transaction_date", transaction_date},
        {"transaction_type", toString(transaction_type)},
        {"status", toString(status)},
        {"reference_number", optionalJson(reference_number)},
        {"payee", optionalJson(payee)},
        {"tags", tags},
        {"created_at", created_at},
        {"updated_at", updated_at}
    };
}

// ===== Transfer =====

Transfer Transfer::fromRow(const storage::Row& row) {
    Transfer t;
    t.id = row.getString("id");
    t.user_id = row.getString("user_id");
    t.from_account_id = row.getString("from_account_id");
    t.to_account_id = row.getString("to_account_id");
    t.from_transaction_id = row.getString("from_transaction_id");
    t.to_transaction_id = row.getString("to_transaction_id");
    t.amount = row.getDouble("amount");
    t.description = row.getOptionalString("description");
    t.transfer_date = row.getString("transfer_date");
    t.created_at = row.getString("created_at");
    return t;
}

nlohmann::json Transfer::toJson() const {
    return {
        {"id", id},
        {"user_id", user_id},
        {"from_account_id", from_account_id},
        {"to_account_id", to_account_id},
        {"from_transaction_id", from_transaction_id},
        {"to_transaction_id", to_transaction_id},
        {"amount", amount},
        {"description", optionalJson(description)},
        {"transfer_date", transfer_date},
        {"created_at", created_at}
    };
}

// ===== Budgets =====

BudgetPeriod BudgetPeriod::fromRow(const storage::Row& row) {
    BudgetPeriod p;
    p.id = row.getString("id");
    p.user_id = row.getString("user_id");
    p.name = row.getString("name");
    p.start_date = row.getString("start_date");
    p.end_date = row.getString("end_date");
    p.is_active = row.getBool("is_active", true);
    p.created_at = row.getString("created_at");
    p.updated_at = row.getString("updated_at");
    return p;
}

nlohmann::json BudgetPeriod::toJson() const {
    return {
        {"id", id},
        {"user_id", user_id},
        {"name", name},
        {"start_date", start_date},
        {"end_date", end_date},
        {"is_active", is_active},
        {"created_at", created_at},
        {"updated_at", updated_at}
    };
}

Budget Budget::fromRow(const storage::Row& row) {
    Budget b;
    b.id = row.getString("id");
    b.user_id = row.getString("user_id");
    b.budget_period_id = row.getString("budget_period_id");
    b.category_id = row.getString("category_id");
    b.allocated_amount = row.getDouble("allocated_amount");
    b.spent_amount = row.getDouble("spent_amount");
    b.notes = row.getOptionalString("notes");
    b.created_at = row.getString("created_at");
    b.updated_at = row.getString("updated_at");
    return b;
}

nlohmann::json Budget::toJson() const {
    return {
        {"id", id},
        {"user_id", user_id},
        {"budget_period_id", budget_period_id},
        {"category_id", category_id},
        {"allocated_amount", allocated_amount},
        {"spent_amount", spent_amount},
        {"remaining", remaining()},
        {"notes", optionalJson(notes)},
        {"created_at", created_at},
        {"updated_at", updated_at}
    };
}

// ===== Goal =====

double Goal::progressPercent() const {
    if (target_amount <= 0.0) return 0.0;
    return std::min(100.0, current_amount / target_amount * 100.0);
}

Goal Goal::fromRow(const storage::Row& row) {
    Goal g;
    g.id = row.getString("id");
    g.user_id = row.getString("user_id");
    g.name = row.getString("name");
    g.description = row.getOptionalString("description");
    g.target_amount = row.getDouble("target_amount");
    g.current_amount = row.getDouble("current_amount");
    g.target_date = row.getOptionalString("target_date");
    g.priority = static_cast<int>(row.getInt("priority", 1));
    g.status = goalStatusFromString(row.getString("status")).value_or(GoalStatus::Active);
    g.category = row.getOptionalString("category");
    g.created_at = row.getString("created_at");
    g.updated_at = row.getString("updated_at");
    return g;
}

nlohmann::json Goal::toJson() const {
    return {
        {"id", id},
        {"user_id", user_id},
        {"name", name},
        {"description", optionalJson(description)},
        {"target_amount", target_amount},
        {"current_amount", current_amount},
        {"progress_percent", progressPercent()},
        {"target_date", optionalJson(target_date)},
        {"priority", priority},
        {"status", toString(status)},
        {"category", optionalJson(category)},
        {"created_at", created_at},
        {"updated_at", updated_at}
    };
}

// ===== Summaries =====

nlohmann::json AccountSummary::toJson() const {
    return {
        {"total_assets", total_assets},
        {"total_liabilities", total_liabilities},
        {"net_worth", net_worth},
        {"account_count", account_count}
    };
}

nlohmann::json BudgetSummary::toJson() const {
    return {
        {"total_allocated", total_allocated},
        {"total_spent", total_spent},
        {"remaining", remaining},
        {"budget_count", budget_count},
        {"categories_over_budget", over_budget_count},
        {"categories_under_budget", under_budget_count}
    };
}

nlohmann::json GoalProgressSummary::toJson() const {
    return {
        {"total_goals", total_goals},
        {"active_goals", active_goals},
        {"completed_goals", completed_goals},
        {"paused_goals", paused_goals},
        {"total_target_amount", total_target},
        {"total_current_amount", total_saved},
        {"average_progress_percentage", average_progress_percent}
    };
}

} // namespace ledger
} // namespace fiscus
