#pragma once

#include <string>

#include "database.h"

namespace hm {

// Database schema initialization and migration
class Schema {
  public:
    static constexpr int CURRENT_VERSION = 2;

    // Initialize schema: create tables on a fresh database, migrate an older one
    [[nodiscard]] static bool initialize(Database& db);

    // Check if schema is initialized
    [[nodiscard]] static bool isInitialized(Database& db);

    // Get schema version. A database written before versioning (legacy profile
    // size columns, no schema_version table) reports 1; an empty one reports 0.
    static int getVersion(Database& db);

    static bool tableExists(Database& db, const std::string& table);
    static bool columnExists(Database& db, const std::string& table, const std::string& column);

  private:
    static bool migrate(Database& db, int fromVersion);
    static bool migrateLegacySizes(Database& db);

    static bool createTables(Database& db);
    static bool createTableStatements(Database& db);
    static bool setVersion(Database& db, int version);
};

} // namespace hm
