#pragma once

#include <string>
#include <vector>

namespace fiscus {
namespace storage {

class SQLiteWrapper;

/// Versioned DDL. PRAGMA user_version records the last applied version.
struct Migration {
    int version;
    std::string name;
    std::string sql;
};

class SchemaMigrations {
public:
    /// All known migrations, ascending by version
    static const std::vector<Migration>& all();

    static int latestVersion();

    /// Reads PRAGMA user_version; 0 when unreadable
    static int currentVersion(SQLiteWrapper& db);

    /// Applies every migration above the current version, each in its own
    /// transaction. Returns the number applied. Throws ConnectionError when a
    /// migration fails or the file carries a newer schema than this build.
    static int apply(SQLiteWrapper& db);
};

} // namespace storage
} // namespace fiscus
