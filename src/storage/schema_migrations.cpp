#include "storage/schema_migrations.h"
#include "storage/sqlite_wrapper.h"
#include "storage/ledger_errors.h"
#include "utils/logger.h"

namespace fiscus {
namespace storage {

namespace {

const char* kInitialSchema = R"SQL(
CREATE TABLE users (
    id TEXT PRIMARY KEY,
    username TEXT UNIQUE NOT NULL,
    email TEXT UNIQUE,
    password_hash TEXT NOT NULL,
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at DATETIME DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE account_types (
    id TEXT PRIMARY KEY,
    code TEXT UNIQUE NOT NULL,
    name TEXT NOT NULL,
    description TEXT,
    is_asset BOOLEAN NOT NULL DEFAULT 1,
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE accounts (
    id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    account_type_id TEXT NOT NULL,
    name TEXT NOT NULL,
    description TEXT,
    initial_balance DECIMAL(15,2) NOT NULL DEFAULT 0.00,
    current_balance DECIMAL(15,2) NOT NULL DEFAULT 0.00,
    currency TEXT NOT NULL DEFAULT 'USD',
    is_active BOOLEAN NOT NULL DEFAULT 1,
    institution_name TEXT,
    account_number TEXT,
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE,
    FOREIGN KEY (account_type_id) REFERENCES account_types(id)
);

CREATE TABLE categories (
    id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    name TEXT NOT NULL,
    description TEXT,
    color TEXT,
    icon TEXT,
    parent_category_id TEXT,
    is_income BOOLEAN NOT NULL DEFAULT 0,
    is_active BOOLEAN NOT NULL DEFAULT 1,
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE,
    FOREIGN KEY (parent_category_id) REFERENCES categories(id)
);

CREATE TABLE transactions (
    id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    account_id TEXT NOT NULL,
    category_id TEXT,
    amount DECIMAL(15,2) NOT NULL,
    description TEXT NOT NULL,
    notes TEXT,
    transaction_date DATETIME NOT NULL,
    transaction_type TEXT NOT NULL CHECK (transaction_type IN ('income', 'expense', 'transfer')),
    status TEXT NOT NULL DEFAULT 'completed' CHECK (status IN ('pending', 'completed', 'cancelled')),
    reference_number TEXT,
    payee TEXT,
    tags TEXT CHECK (tags IS NULL OR json_valid(tags)),
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE,
    FOREIGN KEY (account_id) REFERENCES accounts(id) ON DELETE CASCADE,
    FOREIGN KEY (category_id) REFERENCES categories(id)
);

CREATE TABLE transfers (
    id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    from_account_id TEXT NOT NULL,
    to_account_id TEXT NOT NULL,
    from_transaction_id TEXT NOT NULL,
    to_transaction_id TEXT NOT NULL,
    amount DECIMAL(15,2) NOT NULL,
    description TEXT,
    transfer_date DATETIME NOT NULL,
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    CHECK (from_account_id <> to_account_id),
    FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE,
    FOREIGN KEY (from_account_id) REFERENCES accounts(id) ON DELETE CASCADE,
    FOREIGN KEY (to_account_id) REFERENCES accounts(id) ON DELETE CASCADE,
    FOREIGN KEY (from_transaction_id) REFERENCES transactions(id) ON DELETE CASCADE,
    FOREIGN KEY (to_transaction_id) REFERENCES transactions(id) ON DELETE CASCADE
);

CREATE TABLE budget_periods (
    id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    name TEXT NOT NULL,
    start_date DATE NOT NULL,
    end_date DATE NOT NULL,
    is_active BOOLEAN NOT NULL DEFAULT 1,
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE
);

CREATE TABLE budgets (
    id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    budget_period_id TEXT NOT NULL,
    category_id TEXT NOT NULL,
    allocated_amount DECIMAL(15,2) NOT NULL DEFAULT 0.00,
    spent_amount DECIMAL(15,2) NOT NULL DEFAULT 0.00,
    notes TEXT,
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE,
    FOREIGN KEY (budget_period_id) REFERENCES budget_periods(id) ON DELETE CASCADE,
    FOREIGN KEY (category_id) REFERENCES categories(id) ON DELETE CASCADE,
    UNIQUE(budget_period_id, category_id)
);

CREATE TABLE goals (
    id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    name TEXT NOT NULL,
    description TEXT,
    target_amount DECIMAL(15,2) NOT NULL,
    current_amount DECIMAL(15,2) NOT NULL DEFAULT 0.00,
    target_date DATE,
    priority INTEGER DEFAULT 1 CHECK (priority BETWEEN 1 AND 5),
    status TEXT NOT NULL DEFAULT 'active' CHECK (status IN ('active', 'completed', 'paused', 'cancelled')),
    category TEXT,
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE
);

CREATE INDEX idx_transactions_account_date ON transactions(account_id, transaction_date);
CREATE INDEX idx_transactions_category ON transactions(category_id);
CREATE INDEX idx_transactions_date ON transactions(transaction_date);
CREATE INDEX idx_transactions_user ON transactions(user_id);
CREATE INDEX idx_accounts_user ON accounts(user_id);
CREATE INDEX idx_budgets_user_period ON budgets(user_id, budget_period_id);
CREATE INDEX idx_categories_user ON categories(user_id);
CREATE INDEX idx_goals_user ON goals(user_id);

INSERT INTO account_types (id, code, name, description, is_asset) VALUES
('00000000-0000-4000-8000-000000000001', 'checking', 'Checking Account', 'Standard checking account for daily transactions', 1),
('00000000-0000-4000-8000-000000000002', 'savings', 'Savings Account', 'Savings account for storing money', 1),
('00000000-0000-4000-8000-000000000003', 'credit_card', 'Credit Card', 'Credit card account', 0),
('00000000-0000-4000-8000-000000000004', 'investment', 'Investment Account', 'Investment and brokerage accounts', 1),
('00000000-0000-4000-8000-000000000005', 'loan', 'Loan Account', 'Loan and debt accounts', 0),
('00000000-0000-4000-8000-000000000006', 'cash', 'Cash', 'Physical cash', 1),
('00000000-0000-4000-8000-000000000007', 'other_asset', 'Other Asset', 'Other asset accounts', 1),
('00000000-0000-4000-8000-000000000008', 'other_liability', 'Other Liability', 'Other liability accounts', 0);
)SQL";

// Listing filters and transfer lookups
const char* kQueryIndexes = R"SQL(
CREATE INDEX idx_transactions_user_date ON transactions(user_id, transaction_date DESC, created_at DESC);
CREATE INDEX idx_transactions_status ON transactions(user_id, status);
CREATE INDEX idx_transfers_user ON transfers(user_id, transfer_date);
CREATE INDEX idx_budget_periods_user ON budget_periods(user_id, start_date);
)SQL";

} // namespace

const std::vector<Migration>& SchemaMigrations::all() {
    static const std::vector<Migration> migrations = {
        {1, "initial_schema", kInitialSchema},
        {2, "query_indexes", kQueryIndexes},
    };
    return migrations;
}

int SchemaMigrations::latestVersion() {
    return all().empty() ? 0 : all().back().version;
}

int SchemaMigrations::currentVersion(SQLiteWrapper& db) {
    try {
        auto rows = db.query("PRAGMA user_version");
        if (rows.empty()) return 0;
        return static_cast<int>(rows.front().getInt("user_version", 0));
    } catch (const SQLiteError& e) {
        FISCUS_WARN("Could not read schema version: {}", e.what());
        return 0;
    }
}

int SchemaMigrations::apply(SQLiteWrapper& db) {
    const int current = currentVersion(db);
    const int latest = latestVersion();
    if (current > latest) {
        throw ConnectionError("Database schema version " + std::to_string(current) +
                              " is newer than supported version " + std::to_string(latest));
    }

    int applied = 0;
    for (const auto& m : all()) {
        if (m.version <= current) continue;

        FISCUS_INFO("Applying schema migration {} ({})", m.version, m.name);
        try {
            db.exec("BEGIN IMMEDIATE");
            db.exec(m.sql);
            // PRAGMA cannot take bound parameters
            db.exec("PRAGMA user_version = " + std::to_string(m.version));
            db.exec("COMMIT");
        } catch (const SQLiteError& e) {
            const std::string cause = e.what();
            if (db.inTransaction()) {
                try {
                    db.exec("ROLLBACK");
                } catch (const SQLiteError& rb) {
                    FISCUS_CRITICAL("Rollback of migration {} failed: {}", m.version, rb.what());
                }
            }
            FISCUS_ERROR("Schema migration {} ({}) failed: {}", m.version, m.name, cause);
            throw ConnectionError("Schema migration " + std::to_string(m.version) + " (" + m.name +
                                  ") failed: " + cause);
        }
        ++applied;
    }
    return applied;
}

} // namespace storage
} // namespace fiscus
