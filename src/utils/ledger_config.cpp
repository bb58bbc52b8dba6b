#include "utils/ledger_config.h"

#include <yaml-cpp/yaml.h>

namespace fiscus {
namespace utils {

namespace {

LedgerConfig fromYamlNode(const YAML::Node& root) {
    LedgerConfig result;
    const YAML::Node ledger = root["ledger"];
    if (!ledger) {
        return result;
    }

    if (auto db = ledger["database"]) {
        result.database.path = db["path"].as<std::string>(result.database.path);
        result.database.busy_timeout_ms = db["busy_timeout_ms"].as<int>(result.database.busy_timeout_ms);
        result.database.enable_wal = db["enable_wal"].as<bool>(result.database.enable_wal);
        result.database.enable_foreign_keys = db["enable_foreign_keys"].as<bool>(result.database.enable_foreign_keys);
        result.database.slow_query_threshold_ms =
            db["slow_query_threshold_ms"].as<int64_t>(result.database.slow_query_threshold_ms);
        result.database.enable_query_logging =
            db["enable_query_logging"].as<bool>(result.database.enable_query_logging);
    }

    if (auto q = ledger["query"]) {
        result.query.default_page_size = q["default_page_size"].as<int64_t>(result.query.default_page_size);
        result.query.max_page_size = q["max_page_size"].as<int64_t>(result.query.max_page_size);
        result.query.max_bulk_items = q["max_bulk_items"].as<int64_t>(result.query.max_bulk_items);
    }

    if (auto sec = ledger["security"]) {
        result.security.password_iterations =
            sec["password_iterations"].as<uint32_t>(result.security.password_iterations);
    }

    if (auto log = ledger["logging"]) {
        result.logging.file = log["file"].as<std::string>(result.logging.file);
        result.logging.level = log["level"].as<std::string>(result.logging.level);
        result.logging.console = log["console"].as<bool>(result.logging.console);
    }
    return result;
}

} // namespace

LedgerConfig LedgerConfig::loadFromYaml(const std::string& yaml_path) {
    try {
        YAML::Node config = YAML::LoadFile(yaml_path);
        LedgerConfig result = fromYamlNode(config);
        FISCUS_INFO("Loaded ledger configuration from {}", yaml_path);
        return result;
    } catch (const std::exception& e) {
        FISCUS_ERROR("Failed to load ledger configuration from {}: {}", yaml_path, e.what());
        return LedgerConfig();  // Return default config
    }
}

LedgerConfig LedgerConfig::fromYamlString(const std::string& yaml_text) {
    try {
        return fromYamlNode(YAML::Load(yaml_text));
    } catch (const std::exception& e) {
        FISCUS_ERROR("Failed to parse ledger configuration: {}", e.what());
        return LedgerConfig();
    }
}

LedgerConfig LedgerConfig::fromJson(const json& j) {
    LedgerConfig result;

    try {
        if (j.contains("database")) {
            const auto& db = j["database"];
            result.database.path = db.value("path", result.database.path);
            result.database.busy_timeout_ms = db.value("busy_timeout_ms", result.database.busy_timeout_ms);
            result.database.enable_wal = db.value("enable_wal", result.database.enable_wal);
            result.database.enable_foreign_keys = db.value("enable_foreign_keys", result.database.enable_foreign_keys);
            result.database.slow_query_threshold_ms =
                db.value("slow_query_threshold_ms", result.database.slow_query_threshold_ms);
            result.database.enable_query_logging =
                db.value("enable_query_logging", result.database.enable_query_logging);
        }

        if (j.contains("query")) {
            const auto& q = j["query"];
            result.query.default_page_size = q.value("default_page_size", result.query.default_page_size);
            result.query.max_page_size = q.value("max_page_size", result.query.max_page_size);
            result.query.max_bulk_items = q.value("max_bulk_items", result.query.max_bulk_items);
        }

        if (j.contains("security")) {
            result.security.password_iterations =
                j["security"].value("password_iterations", result.security.password_iterations);
        }

        if (j.contains("logging")) {
            const auto& log = j["logging"];
            result.logging.file = log.value("file", result.logging.file);
            result.logging.level = log.value("level", result.logging.level);
            result.logging.console = log.value("console", result.logging.console);
        }
    } catch (const json::exception& e) {
        FISCUS_ERROR("Failed to parse ledger configuration from JSON: {}", e.what());
        return LedgerConfig();
    }

    return result;
}

json LedgerConfig::toJson() const {
    return {
        {"database", {
            {"path", database.path},
            {"busy_timeout_ms", database.busy_timeout_ms},
            {"enable_wal", database.enable_wal},
            {"enable_foreign_keys", database.enable_foreign_keys},
            {"slow_query_threshold_ms", database.slow_query_threshold_ms},
            {"enable_query_logging", database.enable_query_logging}
        }},
        {"query", {
            {"default_page_size", query.default_page_size},
            {"max_page_size", query.max_page_size},
            {"max_bulk_items", query.max_bulk_items}
        }},
        {"security", {
            {"password_iterations", security.password_iterations}
        }},
        {"logging", {
            {"file", logging.file},
            {"level", logging.level},
            {"console", logging.console}
        }}
    };
}

std::vector<std::string> LedgerConfig::validate() const {
    std::vector<std::string> problems;
    if (database.path.empty()) {
        problems.emplace_back("database.path must not be empty");
    }
    if (database.busy_timeout_ms < 0) {
        problems.emplace_back("database.busy_timeout_ms must be >= 0");
    }
    if (query.max_page_size < 1) {
        problems.emplace_back("query.max_page_size must be >= 1");
    }
    if (query.default_page_size < 1 || query.default_page_size > query.max_page_size) {
        problems.emplace_back("query.default_page_size must be within [1, max_page_size]");
    }
    if (query.max_bulk_items < 1) {
        problems.emplace_back("query.max_bulk_items must be >= 1");
    }
    if (security.password_iterations == 0) {
        problems.emplace_back("security.password_iterations must be > 0");
    }
    return problems;
}

ConnectionManager::Config LedgerConfig::toConnectionConfig() const {
    ConnectionManager::Config cfg;
    cfg.db.db_path = database.path;
    cfg.db.busy_timeout_ms = database.busy_timeout_ms;
    cfg.db.enable_wal = database.enable_wal;
    cfg.db.enable_foreign_keys = database.enable_foreign_keys;
    cfg.slow_query_threshold_ms = database.slow_query_threshold_ms;
    cfg.enable_query_logging = database.enable_query_logging;
    return cfg;
}

ledger::RepositoryOptions LedgerConfig::toRepositoryOptions() const {
    ledger::RepositoryOptions opts;
    opts.default_page_size = query.default_page_size;
    opts.max_page_size = query.max_page_size;
    opts.max_bulk_items = static_cast<size_t>(query.max_bulk_items);
    return opts;
}

Logger::Options LedgerConfig::toLoggerOptions() const {
    Logger::Options opts;
    opts.log_file = logging.file;
    opts.level = Logger::levelFromString(logging.level);
    opts.console = logging.console;
    return opts;
}

} // namespace utils
} // namespace fiscus
