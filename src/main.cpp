#include "ledger/transaction_repository.h"
#include "storage/schema_migrations.h"
#include "transaction/connection_manager.h"
#include "utils/ledger_config.h"
#include "utils/logger.h"

#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using namespace fiscus;
using json = nlohmann::json;

namespace {

constexpr const char* kVersion = "0.1.0";

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --config FILE            Load ledger config from YAML (.yaml/.yml) or JSON file\n"
              << "  --db PATH                Override database.path\n"
              << "  --health                 Open the store and run a health check\n"
              << "  --export USER FORMAT     Export all transactions of USER as csv or json\n"
              << "  --output FILE            Write the export to FILE instead of stdout\n"
              << "  --version                Print version and supported schema version\n"
              << "  --help, -h               Show this help message\n";
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<utils::LedgerConfig> loadConfig(const std::string& path) {
    if (endsWith(path, ".yaml") || endsWith(path, ".yml")) {
        std::ifstream in(path);
        if (!in.is_open()) return std::nullopt;
        return utils::LedgerConfig::loadFromYaml(path);
    }
    std::ifstream f(path);
    if (!f.is_open()) return std::nullopt;
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) return std::nullopt;
    // Same layout as YAML, optionally under a "ledger" key
    return utils::LedgerConfig::fromJson(j.contains("ledger") ? j["ledger"] : j);
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> config_path;
    std::optional<std::string> db_override;
    std::optional<std::string> export_user;
    std::optional<std::string> export_format;
    std::optional<std::string> output_path;
    bool health = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--db" && i + 1 < argc) {
            db_override = argv[++i];
        } else if (arg == "--health") {
            health = true;
        } else if (arg == "--export" && i + 2 < argc) {
            export_user = argv[++i];
            export_format = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--version") {
            std::cout << "fiscus_ledger_cli " << kVersion << " (schema "
                      << storage::SchemaMigrations::latestVersion() << ")\n";
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    utils::LedgerConfig config;
    if (config_path) {
        auto loaded = loadConfig(*config_path);
        if (!loaded) {
            std::cerr << "Failed to read config file: " << *config_path << "\n";
            return 1;
        }
        config = *loaded;
    }
    if (db_override) {
        config.database.path = *db_override;
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) {
            std::cerr << "Invalid configuration: " << p << "\n";
        }
        return 1;
    }

    utils::Logger::init(config.toLoggerOptions());
    FISCUS_INFO("=== Fiscus Ledger {} ===", kVersion);
    FISCUS_INFO("Database path: {}", config.database.path);

    int rc = 0;
    try {
        ConnectionManager conn(config.toConnectionConfig());
        conn.open();

        if (health) {
            const bool ok = conn.healthCheck();
            json report = {
                {"healthy", ok},
                {"state", toString(conn.state())},
                {"schema_version", conn.schemaVersion()},
                {"supported_schema_version", storage::SchemaMigrations::latestVersion()}
            };
            std::cout << report.dump(2) << "\n";
            rc = ok ? 0 : 1;
        }

        if (export_user) {
            auto format = ledger::exportFormatFromString(*export_format);
            if (!format) {
                std::cerr << "Unknown export format: " << *export_format << " (expected csv or json)\n";
                rc = 2;
            } else {
                ledger::TransactionRepository transactions(conn, config.toRepositoryOptions());
                query::TransactionFilter filter;
                filter.user_id = *export_user;
                const std::string data = transactions.exportFiltered(filter, *format);

                if (!output_path) {
                    std::cout << data;
                } else {
                    std::ofstream out(*output_path, std::ios::trunc);
                    if (out.is_open()) {
                        out << data;
                        FISCUS_INFO("Export written to {}", *output_path);
                    } else {
                        std::cerr << "Cannot write " << *output_path << "\n";
                        rc = 1;
                    }
                }
            }
        }

        if (!health && !export_user) {
            std::cout << "Schema version " << conn.schemaVersion() << ", state "
                      << toString(conn.state()) << "\n";
        }
        conn.close();
    } catch (const LedgerError& e) {
        FISCUS_ERROR("{} ({})", e.what(), e.code());
        utils::Logger::flush();
        std::cerr << e.toEnvelope().dump(2) << "\n";
        rc = 1;
    } catch (const std::exception& e) {
        FISCUS_CRITICAL("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        rc = 1;
    }

    utils::Logger::shutdown();
    return rc;
}
