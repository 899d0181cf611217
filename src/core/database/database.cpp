#include "database.h"

#include <cstring>

#include <sqlite3.h>

#include "../utils/log.h"

namespace hm {

// Statement implementation

Statement::Statement(sqlite3_stmt* stmt) : m_stmt(stmt) {}

Statement::~Statement() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
    }
}

Statement::Statement(Statement&& other) noexcept : m_stmt(other.m_stmt) {
    other.m_stmt = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
        m_stmt = other.m_stmt;
        other.m_stmt = nullptr;
    }
    return *this;
}

bool Statement::bindInt(int index, i64 value) {
    return sqlite3_bind_int64(m_stmt, index, value) == SQLITE_OK;
}

bool Statement::bindDouble(int index, f64 value) {
    return sqlite3_bind_double(m_stmt, index, value) == SQLITE_OK;
}

bool Statement::bindText(int index, const std::string& value) {
    return sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()),
                             SQLITE_TRANSIENT) == SQLITE_OK;
}

bool Statement::bindBlob(int index, const void* data, int size) {
    // sqlite3_bind_blob binds NULL for a null pointer; use a zero-length blob instead
    if (size == 0) {
        return sqlite3_bind_zeroblob(m_stmt, index, 0) == SQLITE_OK;
    }
    return sqlite3_bind_blob(m_stmt, index, data, size, SQLITE_TRANSIENT) == SQLITE_OK;
}

bool Statement::bindNull(int index) {
    return sqlite3_bind_null(m_stmt, index) == SQLITE_OK;
}

bool Statement::bindOptionalInt(int index, const std::optional<i64>& value) {
    return value ? bindInt(index, *value) : bindNull(index);
}

bool Statement::bindOptionalDouble(int index, const std::optional<f64>& value) {
    return value ? bindDouble(index, *value) : bindNull(index);
}

bool Statement::bindOptionalText(int index, const std::optional<std::string>& value) {
    return value ? bindText(index, *value) : bindNull(index);
}

bool Statement::bindOptionalBlob(int index, const std::optional<ByteBuffer>& value) {
    if (!value) {
        return bindNull(index);
    }
    return bindBlob(index, value->data(), static_cast<int>(value->size()));
}

bool Statement::step() {
    int result = sqlite3_step(m_stmt);
    return result == SQLITE_ROW;
}

bool Statement::execute() {
    int result = sqlite3_step(m_stmt);
    return result == SQLITE_DONE;
}

void Statement::reset() {
    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
}

i64 Statement::getInt(int column) const {
    return sqlite3_column_int64(m_stmt, column);
}

f64 Statement::getDouble(int column) const {
    return sqlite3_column_double(m_stmt, column);
}

std::string Statement::getText(int column) const {
    const unsigned char* text = sqlite3_column_text(m_stmt, column);
    if (text) {
        return std::string(reinterpret_cast<const char*>(text));
    }
    return "";
}

ByteBuffer Statement::getBlob(int column) const {
    const void* data = sqlite3_column_blob(m_stmt, column);
    int size = sqlite3_column_bytes(m_stmt, column);
    if (data && size > 0) {
        ByteBuffer buffer(static_cast<usize>(size));
        std::memcpy(buffer.data(), data, static_cast<usize>(size));
        return buffer;
    }
    return {};
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(m_stmt, column) == SQLITE_NULL;
}

std::optional<i64> Statement::getOptionalInt(int column) const {
    if (isNull(column)) {
        return std::nullopt;
    }
    return getInt(column);
}

std::optional<f64> Statement::getOptionalDouble(int column) const {
    if (isNull(column)) {
        return std::nullopt;
    }
    return getDouble(column);
}

std::optional<std::string> Statement::getOptionalText(int column) const {
    if (isNull(column)) {
        return std::nullopt;
    }
    return getText(column);
}

std::optional<ByteBuffer> Statement::getOptionalBlob(int column) const {
    if (isNull(column)) {
        return std::nullopt;
    }
    return getBlob(column);
}

int Statement::columnCount() const {
    return sqlite3_column_count(m_stmt);
}

// Database implementation

Database::~Database() {
    close();
}

bool Database::open(const Path& path) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_db) {
        close();
    }

    int result = sqlite3_open(path.string().c_str(), &m_db);
    if (result != SQLITE_OK) {
        log::errorf("Database", "Failed to open: %s", sqlite3_errmsg(m_db));
        sqlite3_close(m_db);
        m_db = nullptr;
        return false;
    }

    // Enable foreign keys (cascading deletes of tools, assignments, variants)
    if (!execute("PRAGMA foreign_keys = ON")) {
        log::warning("Database", "Failed to enable foreign keys");
    }

    // Use WAL mode for better concurrency
    if (!execute("PRAGMA journal_mode = WAL")) {
        log::warning("Database", "Failed to set WAL mode");
    }

    log::infof("Database", "Opened: %s", path.string().c_str());
    return true;
}

void Database::close() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
        log::debug("Database", "Closed");
    }
}

bool Database::execute(const std::string& sql) {
    if (!m_db) {
        log::error("Database", "execute() on a closed database");
        return false;
    }

    char* errMsg = nullptr;
    int result = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);

    if (result != SQLITE_OK) {
        log::errorf("Database", "SQL error: %s\nQuery: %s", errMsg ? errMsg : "unknown",
                    sql.c_str());
        sqlite3_free(errMsg);
        return false;
    }

    return true;
}

Statement Database::prepare(const std::string& sql) {
    if (!m_db) {
        log::error("Database", "prepare() on a closed database");
        return Statement();
    }

    sqlite3_stmt* stmt = nullptr;
    int result =
        sqlite3_prepare_v2(m_db, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);

    if (result != SQLITE_OK) {
        log::errorf("Database", "Failed to prepare statement: %s\nQuery: %s", sqlite3_errmsg(m_db),
                    sql.c_str());
        return Statement();
    }

    return Statement(stmt);
}

bool Database::beginTransaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION");
}

bool Database::commit() {
    return execute("COMMIT");
}

bool Database::rollback() {
    return execute("ROLLBACK");
}

bool Database::inTransaction() const {
    return m_db != nullptr && sqlite3_get_autocommit(m_db) == 0;
}

i64 Database::lastInsertId() const {
    return sqlite3_last_insert_rowid(m_db);
}

int Database::changesCount() const {
    return sqlite3_changes(m_db);
}

std::string Database::lastError() const {
    if (!m_db) {
        return "database not open";
    }
    return sqlite3_errmsg(m_db);
}

// Transaction implementation

Transaction::Transaction(Database& db) : m_db(db), m_lock(db.mutex()) {
    if (m_db.inTransaction()) {
        m_nested = true;
        m_active = true;
        return;
    }

    m_active = m_db.beginTransaction();
    if (!m_active) {
        log::error("Transaction", "Failed to begin transaction");
    }
}

Transaction::~Transaction() {
    if (m_active && !m_committed) {
        rollback();
    }
}

bool Transaction::commit() {
    if (!m_active) {
        return false;
    }
    if (m_nested) {
        // The outer scope commits; fail if it was already aborted
        m_committed = m_db.inTransaction();
        return m_committed;
    }
    if (!m_committed) {
        m_committed = m_db.commit();
    }
    return m_committed;
}

void Transaction::rollback() {
    if (m_active && !m_committed) {
        // A nested scope may already have aborted the transaction
        if (m_db.inTransaction() && !m_db.rollback()) {
            log::error("Transaction", "Rollback failed");
        }
        m_active = false; // Prevent double rollback in destructor
    }
}

} // namespace hm
