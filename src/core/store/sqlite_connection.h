#pragma once

#include <QString>
#include <cstdint>
#include <optional>

#include <sqlite3.h>

namespace aq {

// SqliteConnection -- move-only owner of a read-only sqlite3* handle.
// Opened with SQLITE_OPEN_FULLMUTEX so one handle can be shared by
// concurrent readers; SQLite serializes access internally.
class SqliteConnection {
public:
    ~SqliteConnection();

    // Move-only (owns sqlite3* handle)
    SqliteConnection(SqliteConnection&& other) noexcept
        : m_db(other.m_db), m_path(std::move(other.m_path)) { other.m_db = nullptr; }
    SqliteConnection& operator=(SqliteConnection&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            m_path = std::move(other.m_path);
            other.m_db = nullptr;
        }
        return *this;
    }
    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    // Open an existing database file read-only. Never creates the file.
    static std::optional<SqliteConnection> openReadOnly(const QString& dbPath);

    bool tableExists(const char* table) const;
    bool columnExists(const char* table, const char* column) const;

    sqlite3* handle() const { return m_db; }
    const QString& path() const { return m_path; }

private:
    SqliteConnection() = default;

    sqlite3* m_db = nullptr;
    QString m_path;
};

// Statement -- prepared statement finalized on scope exit.
// Throws DataSourceError when preparation fails.
class Statement {
public:
    Statement(const SqliteConnection& connection, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const QString& value);
    void bindInt(int index, int value);
    void bindDouble(int index, double value);

    // True while a row is available. Throws DataSourceError on step failure.
    bool next();

    QString text(int column) const;
    std::optional<QString> optionalText(int column) const;
    int integer(int column) const;
    std::optional<int> optionalInteger(int column) const;
    double real(int column) const;
    std::optional<double> optionalReal(int column) const;
    int64_t int64(int column) const;
    bool isNull(int column) const;

private:
    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_stmt = nullptr;
};

} // namespace aq
