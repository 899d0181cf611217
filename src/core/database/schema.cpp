#include "schema.h"

#include <cstdio>
#include <vector>

#include "../utils/log.h"
#include "../utils/string_utils.h"
#include "size_repository.h"

namespace hm {

namespace {

constexpr const char* kCreateSchemaVersion = R"(
    CREATE TABLE IF NOT EXISTS schema_version (
        version INTEGER NOT NULL
    )
)";

constexpr const char* kCreateMaterialSizes = R"(
    CREATE TABLE IF NOT EXISTS material_sizes (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        width REAL NOT NULL,
        thickness REAL NOT NULL DEFAULT 0,
        name TEXT NOT NULL DEFAULT '',
        description TEXT NOT NULL DEFAULT ''
    )
)";

// %s is the table name so the same definition serves the migration rebuild
constexpr const char* kCreateProfilesFmt = R"(
    CREATE TABLE IF NOT EXISTS %s (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        name TEXT NOT NULL UNIQUE,
        description TEXT NOT NULL DEFAULT '',
        feed_rate REAL NOT NULL DEFAULT 30.0,
        material_size_id INTEGER DEFAULT NULL,
        preview_image BLOB,
        pdf_path TEXT,
        created_at TEXT DEFAULT CURRENT_TIMESTAMP,
        FOREIGN KEY (material_size_id) REFERENCES material_sizes(id) ON DELETE SET NULL
    )
)";

constexpr const char* kCreateVariants = R"(
    CREATE TABLE IF NOT EXISTS product_size_variants (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        profile_id INTEGER NOT NULL,
        width REAL NOT NULL,
        thickness REAL NOT NULL DEFAULT 0,
        tolerance REAL NOT NULL DEFAULT 0.5,
        material_size_id INTEGER DEFAULT NULL,
        is_default INTEGER NOT NULL DEFAULT 0,
        sort_order INTEGER NOT NULL DEFAULT 0,
        notes TEXT NOT NULL DEFAULT '',
        FOREIGN KEY (profile_id) REFERENCES profiles(id) ON DELETE CASCADE,
        FOREIGN KEY (material_size_id) REFERENCES material_sizes(id) ON DELETE SET NULL
    )
)";

constexpr const char* kCreateTools = R"(
    CREATE TABLE IF NOT EXISTS tools (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        profile_id INTEGER NOT NULL,
        position TEXT NOT NULL,
        tool_type TEXT NOT NULL,
        set_number INTEGER NOT NULL DEFAULT 1,
        code TEXT NOT NULL UNIQUE,
        knives_count INTEGER NOT NULL DEFAULT 6,
        template_id TEXT NOT NULL DEFAULT '',
        status TEXT NOT NULL DEFAULT 'ready',
        notes TEXT NOT NULL DEFAULT '',
        photo BLOB,
        FOREIGN KEY (profile_id) REFERENCES profiles(id) ON DELETE CASCADE
    )
)";

constexpr const char* kCreateAssignments = R"(
    CREATE TABLE IF NOT EXISTS tool_assignments (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        profile_id INTEGER NOT NULL,
        tool_id INTEGER NOT NULL,
        head_number INTEGER NOT NULL CHECK (head_number BETWEEN 1 AND 10),
        rpm INTEGER,
        pass_depth REAL,
        work_material TEXT NOT NULL DEFAULT '',
        remarks TEXT NOT NULL DEFAULT '',
        FOREIGN KEY (profile_id) REFERENCES profiles(id) ON DELETE CASCADE,
        FOREIGN KEY (tool_id) REFERENCES tools(id) ON DELETE CASCADE,
        UNIQUE (profile_id, head_number)
    )
)";

const std::vector<const char*> kIndexes = {
    "CREATE INDEX IF NOT EXISTS idx_tools_profile ON tools(profile_id)",
    "CREATE INDEX IF NOT EXISTS idx_tools_set ON tools(profile_id, substr(code, 1, 5))",
    "CREATE INDEX IF NOT EXISTS idx_assignments_tool ON tool_assignments(tool_id)",
    "CREATE INDEX IF NOT EXISTS idx_variants_profile ON product_size_variants(profile_id)",
    "CREATE INDEX IF NOT EXISTS idx_material_sizes_dims ON material_sizes(width, thickness)",
};

std::string profilesTableSql(const char* tableName) {
    char buffer[1024];
    std::snprintf(buffer, sizeof(buffer), kCreateProfilesFmt, tableName);
    return buffer;
}

// PRAGMA foreign_keys is a no-op inside a transaction, so the table rebuild
// switches enforcement off around the whole migration and back on afterwards.
class ForeignKeysOff {
  public:
    explicit ForeignKeysOff(Database& db) : m_db(db) {
        if (!m_db.execute("PRAGMA foreign_keys = OFF")) {
            log::warning("Schema", "Failed to disable foreign keys for migration");
        }
    }
    ~ForeignKeysOff() {
        if (!m_db.execute("PRAGMA foreign_keys = ON")) {
            log::error("Schema", "Failed to re-enable foreign keys after migration");
        }
    }

    ForeignKeysOff(const ForeignKeysOff&) = delete;
    ForeignKeysOff& operator=(const ForeignKeysOff&) = delete;

  private:
    Database& m_db;
};

struct LegacyProfileSizes {
    i64 profileId = 0;
    std::string materialSize;
    std::string productSize;
};

} // namespace

bool Schema::initialize(Database& db) {
    if (!db.isOpen()) {
        log::error("Schema", "Cannot initialize: database not open");
        return false;
    }

    int version = getVersion(db);
    if (version == CURRENT_VERSION) {
        log::debug("Schema", "Already up to date");
        // Tables added within a version are created idempotently
        return createTables(db);
    }
    if (version > 0 && version < CURRENT_VERSION) {
        log::infof("Schema", "Migrating from version %d to %d", version, CURRENT_VERSION);
        if (!migrate(db, version)) {
            log::error("Schema", "Migration failed");
            return false;
        }
        return true;
    }
    if (version > CURRENT_VERSION) {
        log::errorf("Schema", "Database version %d is newer than supported version %d", version,
                    CURRENT_VERSION);
        return false;
    }

    return createTables(db);
}

bool Schema::isInitialized(Database& db) {
    return tableExists(db, "schema_version");
}

int Schema::getVersion(Database& db) {
    if (!isInitialized(db)) {
        // Pre-versioning layout: profiles with free-text size columns
        if (tableExists(db, "profiles") && columnExists(db, "profiles", "material_size")) {
            return 1;
        }
        return 0;
    }

    auto stmt = db.prepare("SELECT version FROM schema_version LIMIT 1");
    if (stmt.isValid() && stmt.step()) {
        return static_cast<int>(stmt.getInt(0));
    }
    return 0;
}

bool Schema::tableExists(Database& db, const std::string& table) {
    auto stmt = db.prepare("SELECT name FROM sqlite_master WHERE type='table' AND name = ?");
    if (!stmt.isValid() || !stmt.bindText(1, table)) {
        return false;
    }
    return stmt.step();
}

bool Schema::columnExists(Database& db, const std::string& table, const std::string& column) {
    auto stmt = db.prepare("SELECT name FROM pragma_table_info(?)");
    if (!stmt.isValid() || !stmt.bindText(1, table)) {
        return false;
    }
    while (stmt.step()) {
        if (stmt.getText(0) == column) {
            return true;
        }
    }
    return false;
}

bool Schema::setVersion(Database& db, int version) {
    if (!db.execute("DELETE FROM schema_version")) {
        return false;
    }
    auto stmt = db.prepare("INSERT INTO schema_version (version) VALUES (?)");
    if (!stmt.isValid() || !stmt.bindInt(1, version)) {
        return false;
    }
    return stmt.execute();
}

bool Schema::createTableStatements(Database& db) {
    if (!db.execute(kCreateSchemaVersion) || !db.execute(kCreateMaterialSizes) ||
        !db.execute(profilesTableSql("profiles")) || !db.execute(kCreateVariants) ||
        !db.execute(kCreateTools) || !db.execute(kCreateAssignments)) {
        return false;
    }

    for (const char* index : kIndexes) {
        if (!db.execute(index)) {
            return false;
        }
    }
    return true;
}

bool Schema::createTables(Database& db) {
    Transaction txn(db);
    if (!txn.isActive()) {
        return false;
    }

    if (!createTableStatements(db)) {
        return false;
    }

    if (!setVersion(db, CURRENT_VERSION)) {
        return false;
    }

    if (!txn.commit()) {
        log::error("Schema", "Failed to commit schema creation");
        return false;
    }

    log::infof("Schema", "Schema ready (version %d)", CURRENT_VERSION);
    return true;
}

bool Schema::migrate(Database& db, int fromVersion) {
    ForeignKeysOff fkOff(db);

    {
        Transaction txn(db);
        if (!txn.isActive()) {
            return false;
        }

        if (fromVersion < 2) {
            // v2: normalized material sizes and product variants replace the
            // free-text profile columns
            if (!migrateLegacySizes(db)) {
                return false;
            }
        }

        if (!createTableStatements(db) || !setVersion(db, CURRENT_VERSION)) {
            return false;
        }

        if (!txn.commit()) {
            log::error("Schema", "Failed to commit migration");
            return false;
        }
    }

    auto check = db.prepare("SELECT COUNT(*) FROM pragma_foreign_key_check");
    if (check.isValid() && check.step() && check.getInt(0) > 0) {
        log::warningf("Schema", "Foreign key check reports %lld violation(s) after migration",
                      static_cast<long long>(check.getInt(0)));
    }

    log::infof("Schema", "Migrated to version %d", CURRENT_VERSION);
    return true;
}

bool Schema::migrateLegacySizes(Database& db) {
    if (!db.execute(kCreateSchemaVersion) || !db.execute(kCreateMaterialSizes)) {
        return false;
    }

    // Capture the legacy text before the profiles table is rebuilt
    std::vector<LegacyProfileSizes> legacy;
    {
        std::string productColumn =
            columnExists(db, "profiles", "product_size") ? "product_size" : "''";
        auto stmt = db.prepare("SELECT id, COALESCE(material_size, ''), COALESCE(" +
                               productColumn + ", '') FROM profiles ORDER BY id ASC");
        if (!stmt.isValid()) {
            return false;
        }
        while (stmt.step()) {
            LegacyProfileSizes row;
            row.profileId = stmt.getInt(0);
            row.materialSize = stmt.getText(1);
            row.productSize = stmt.getText(2);
            legacy.push_back(std::move(row));
        }
    }

    std::string copyColumns = "id, name, description, feed_rate, pdf_path, created_at";
    std::string sourceColumns = "id, name, COALESCE(description, ''), COALESCE(feed_rate, 30.0), "
                                "pdf_path, created_at";
    if (columnExists(db, "profiles", "preview_image")) {
        copyColumns += ", preview_image";
        sourceColumns += ", preview_image";
    }

    if (!db.execute(profilesTableSql("profiles_v2")) ||
        !db.execute("INSERT INTO profiles_v2 (" + copyColumns + ") SELECT " + sourceColumns +
                    " FROM profiles") ||
        !db.execute("DROP TABLE profiles") ||
        !db.execute("ALTER TABLE profiles_v2 RENAME TO profiles")) {
        log::error("Schema", "Failed to rebuild profiles table");
        return false;
    }

    // An early variants table keyed its material as material_id without
    // tolerance or ordering; carry its rows over into the current layout
    if (tableExists(db, "product_size_variants") &&
        !columnExists(db, "product_size_variants", "material_size_id")) {
        if (!db.execute("ALTER TABLE product_size_variants RENAME TO product_size_variants_v1") ||
            !db.execute(kCreateVariants) ||
            !db.execute("INSERT INTO product_size_variants "
                        "(profile_id, width, thickness, material_size_id, is_default) "
                        "SELECT profile_id, width, COALESCE(thickness, 0), material_id, "
                        "COALESCE(is_default, 0) FROM product_size_variants_v1") ||
            !db.execute("DROP TABLE product_size_variants_v1")) {
            log::error("Schema", "Failed to convert product_size_variants");
            return false;
        }
    }

    if (!db.execute(kCreateVariants)) {
        return false;
    }

    SizeRepository sizes(db);
    int converted = 0;
    int skipped = 0;

    for (const auto& row : legacy) {
        if (!str::trim(row.materialSize).empty()) {
            auto dims = parseSizeText(row.materialSize);
            if (!dims) {
                log::warningf("Schema", "Profile %lld: cannot parse material size '%s'",
                              static_cast<long long>(row.profileId), row.materialSize.c_str());
                ++skipped;
            } else {
                std::optional<i64> sizeId;
                if (auto existing = sizes.findMaterialSizeByDims(dims->width, dims->thickness)) {
                    sizeId = existing->id;
                } else {
                    MaterialSizeRecord record;
                    record.width = dims->width;
                    record.thickness = dims->thickness;
                    record.name = str::trim(row.materialSize);
                    sizeId = sizes.insertMaterialSize(record);
                }
                if (!sizeId) {
                    return false;
                }

                auto stmt = db.prepare("UPDATE profiles SET material_size_id = ? WHERE id = ?");
                if (!stmt.isValid() || !stmt.bindInt(1, *sizeId) ||
                    !stmt.bindInt(2, row.profileId) || !stmt.execute()) {
                    return false;
                }
                ++converted;
            }
        }

        if (!sizes.findVariantsForProfile(row.profileId).empty()) {
            continue;
        }

        // Several product sizes may have been typed as a ';' separated list;
        // the first becomes the default variant
        int order = 0;
        for (const auto& text : str::split(row.productSize, ';')) {
            if (str::trim(text).empty()) {
                continue;
            }
            auto dims = parseSizeText(text);
            if (!dims) {
                log::warningf("Schema", "Profile %lld: cannot parse product size '%s'",
                              static_cast<long long>(row.profileId), text.c_str());
                ++skipped;
                continue;
            }

            ProductVariantRecord variant;
            variant.profileId = row.profileId;
            variant.width = dims->width;
            variant.thickness = dims->thickness;
            variant.isDefault = (order == 0);
            variant.sortOrder = order;
            if (!sizes.insertVariant(variant)) {
                return false;
            }
            ++order;
            ++converted;
        }
    }

    log::infof("Schema", "Converted %d legacy size value(s), skipped %d", converted, skipped);
    return true;
}

} // namespace hm
