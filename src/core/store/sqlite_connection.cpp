#include "core/store/sqlite_connection.h"
#include "core/store/store_error.h"
#include "core/shared/logging.h"

#include <QFile>

namespace aq {

SqliteConnection::~SqliteConnection()
{
    if (m_db) {
        LOG_DEBUG(aqStore, "Closing %s", qUtf8Printable(m_path));
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SqliteConnection> SqliteConnection::openReadOnly(const QString& dbPath)
{
    if (!QFile::exists(dbPath)) {
        LOG_WARN(aqStore, "Database not found: %s", qUtf8Printable(dbPath));
        return std::nullopt;
    }

    SqliteConnection connection;
    connection.m_path = dbPath;
    const int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &connection.m_db,
                                   SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(aqStore, "Failed to open database %s: %s",
                  qUtf8Printable(dbPath), sqlite3_errmsg(connection.m_db));
        // The destructor closes the partially opened handle
        return std::nullopt;
    }

    sqlite3_busy_timeout(connection.m_db, 5000);
    LOG_INFO(aqStore, "Opened %s (read-only)", qUtf8Printable(dbPath));
    return connection;
}

bool SqliteConnection::tableExists(const char* table) const
{
    if (!m_db) return false;

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT 1 FROM sqlite_master WHERE type IN ('table', 'view') AND name = ?1";
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_text(stmt, 1, table, -1, SQLITE_STATIC);
    const bool exists = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return exists;
}

bool SqliteConnection::columnExists(const char* table, const char* column) const
{
    if (!m_db) return false;

    const QByteArray sql = QByteArray("PRAGMA table_info(") + table + ")";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bool found = false;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        if (name && qstricmp(name, column) == 0) {
            found = true;
            break;
        }
    }
    sqlite3_finalize(stmt);
    return found;
}

// ── Statement ───────────────────────────────────────────────

Statement::Statement(const SqliteConnection& connection, const char* sql)
    : m_db(connection.handle())
{
    if (!m_db) {
        throw DataSourceError("database is not open");
    }
    if (sqlite3_prepare_v2(m_db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
        const std::string message = std::string("prepare failed: ") + sqlite3_errmsg(m_db);
        LOG_ERROR(aqStore, "%s (%s)", message.c_str(), qUtf8Printable(connection.path()));
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
        throw DataSourceError(message);
    }
}

Statement::~Statement()
{
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
    }
}

void Statement::bindText(int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(m_stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

void Statement::bindInt(int index, int value)
{
    sqlite3_bind_int(m_stmt, index, value);
}

void Statement::bindDouble(int index, double value)
{
    sqlite3_bind_double(m_stmt, index, value);
}

bool Statement::next()
{
    const int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    const std::string message = std::string("step failed: ") + sqlite3_errmsg(m_db);
    LOG_ERROR(aqStore, "%s", message.c_str());
    throw DataSourceError(message);
}

QString Statement::text(int column) const
{
    const char* value = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, column));
    return value ? QString::fromUtf8(value) : QString();
}

std::optional<QString> Statement::optionalText(int column) const
{
    if (isNull(column)) {
        return std::nullopt;
    }
    return text(column);
}

int Statement::integer(int column) const
{
    return sqlite3_column_int(m_stmt, column);
}

std::optional<int> Statement::optionalInteger(int column) const
{
    if (isNull(column)) {
        return std::nullopt;
    }
    return integer(column);
}

double Statement::real(int column) const
{
    return sqlite3_column_double(m_stmt, column);
}

std::optional<double> Statement::optionalReal(int column) const
{
    if (isNull(column)) {
        return std::nullopt;
    }
    return real(column);
}

int64_t Statement::int64(int column) const
{
    return sqlite3_column_int64(m_stmt, column);
}

bool Statement::isNull(int column) const
{
    return sqlite3_column_type(m_stmt, column) == SQLITE_NULL;
}

} // namespace aq
