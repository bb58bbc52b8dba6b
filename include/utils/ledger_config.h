#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ledger/repository_support.h"
#include "transaction/connection_manager.h"
#include "utils/logger.h"

namespace fiscus {
namespace utils {

using json = nlohmann::json;

/**
 * @brief Runtime configuration of the ledger core (YAML root key `ledger`)
 */
struct LedgerConfig {
    struct DatabaseConfig {
        std::string path = "./data/fiscus.db";      // ":memory:" for ephemeral stores
        int busy_timeout_ms = 5000;
        bool enable_wal = true;
        bool enable_foreign_keys = true;
        int64_t slow_query_threshold_ms = 50;       // 0 disables slow statement warnings
        bool enable_query_logging = true;
    } database;

    struct QueryConfig {
        int64_t default_page_size = 50;
        int64_t max_page_size = 1000;
        int64_t max_bulk_items = 100;
    } query;

    struct SecurityConfig {
        uint32_t password_iterations = 120000;      // PBKDF2 rounds
    } security;

    struct LoggingConfig {
        std::string file = "fiscus.log";            // empty -> console only
        std::string level = "info";
        bool console = true;
    } logging;

    /// Load from YAML file; missing keys keep defaults, unreadable file
    /// yields the default config (logged).
    static LedgerConfig loadFromYaml(const std::string& yaml_path);

    /// Parse YAML text (same structure as the file)
    static LedgerConfig fromYamlString(const std::string& yaml_text);

    static LedgerConfig fromJson(const json& j);
    json toJson() const;

    /// Human readable problems; empty when the config is usable
    std::vector<std::string> validate() const;

    ConnectionManager::Config toConnectionConfig() const;
    ledger::RepositoryOptions toRepositoryOptions() const;
    Logger::Options toLoggerOptions() const;
};

} // namespace utils
} // namespace fiscus
