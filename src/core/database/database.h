#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "../types.h"

struct sqlite3;
struct sqlite3_stmt;

namespace hm {

// Forward declarations
class Database;

// RAII wrapper for prepared statement
class Statement {
  public:
    Statement() = default;
    Statement(sqlite3_stmt* stmt);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    // Bind parameters (1-indexed)
    [[nodiscard]] bool bindInt(int index, i64 value);
    [[nodiscard]] bool bindDouble(int index, f64 value);
    [[nodiscard]] bool bindText(int index, const std::string& value);
    [[nodiscard]] bool bindBlob(int index, const void* data, int size);
    [[nodiscard]] bool bindNull(int index);

    // NULL when the value is absent
    [[nodiscard]] bool bindOptionalInt(int index, const std::optional<i64>& value);
    [[nodiscard]] bool bindOptionalDouble(int index, const std::optional<f64>& value);
    [[nodiscard]] bool bindOptionalText(int index, const std::optional<std::string>& value);
    [[nodiscard]] bool bindOptionalBlob(int index, const std::optional<ByteBuffer>& value);

    // Execute and step
    [[nodiscard]] bool step();    // Returns true if there's a row (SQLITE_ROW)
    [[nodiscard]] bool execute(); // Returns true if successful (SQLITE_DONE)
    void reset();                 // Reset for reuse

    // Get column values (0-indexed)
    i64 getInt(int column) const;
    f64 getDouble(int column) const;
    std::string getText(int column) const;
    ByteBuffer getBlob(int column) const;
    bool isNull(int column) const;

    // nullopt for a NULL column
    std::optional<i64> getOptionalInt(int column) const;
    std::optional<f64> getOptionalDouble(int column) const;
    std::optional<std::string> getOptionalText(int column) const;
    std::optional<ByteBuffer> getOptionalBlob(int column) const;

    int columnCount() const;

    bool isValid() const { return m_stmt != nullptr; }

  private:
    sqlite3_stmt* m_stmt = nullptr;
};

// Database connection wrapper.
// One connection per database file; writers are serialized through mutex(),
// which every Transaction holds for its lifetime.
class Database {
  public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Open/close database (":memory:" opens a private in-memory database)
    [[nodiscard]] bool open(const Path& path);
    void close();
    bool isOpen() const { return m_db != nullptr; }

    // Execute SQL (for simple queries without results)
    [[nodiscard]] bool execute(const std::string& sql);

    // Prepare statement for queries with results or parameters
    Statement prepare(const std::string& sql);

    // Transaction support
    [[nodiscard]] bool beginTransaction();
    [[nodiscard]] bool commit();
    [[nodiscard]] bool rollback();
    bool inTransaction() const;

    // Utility
    i64 lastInsertId() const;
    int changesCount() const;
    std::string lastError() const;

    std::recursive_mutex& mutex() { return m_mutex; }

  private:
    sqlite3* m_db = nullptr;
    std::recursive_mutex m_mutex;
};

// Scoped transaction (RAII). Rolls back unless committed.
// Opened while another transaction is running, it joins the outer one: commit
// is left to the outer scope, and a rollback aborts the whole transaction.
class Transaction {
  public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    // False when BEGIN failed
    bool isActive() const { return m_active; }
    bool isNested() const { return m_nested; }

    [[nodiscard]] bool commit();
    void rollback();

  private:
    Database& m_db;
    std::unique_lock<std::recursive_mutex> m_lock;
    bool m_active = false;
    bool m_committed = false;
    bool m_nested = false;
};

} // namespace hm
