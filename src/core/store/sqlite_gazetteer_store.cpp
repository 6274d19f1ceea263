#include "core/store/sqlite_gazetteer_store.h"
#include "core/shared/logging.h"

namespace aq {

namespace {

// Escape LIKE wildcards so user text matches literally (ESCAPE '\').
QString escapeLike(const QString& text)
{
    QString escaped;
    escaped.reserve(text.size());
    for (const QChar ch : text) {
        if (ch == QLatin1Char('\\') || ch == QLatin1Char('%') || ch == QLatin1Char('_')) {
            escaped.append(QLatin1Char('\\'));
        }
        escaped.append(ch);
    }
    return escaped;
}

QStringList splitAlternateNames(const QString& raw)
{
    QStringList names;
    const QStringList parts = raw.split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty()) {
            names.append(trimmed);
        }
    }
    return names;
}

} // namespace

std::optional<SqliteGazetteerStore> SqliteGazetteerStore::open(const QString& dbPath)
{
    std::optional<SqliteConnection> connection = SqliteConnection::openReadOnly(dbPath);
    if (!connection.has_value()) {
        return std::nullopt;
    }
    if (!connection->tableExists("cities")) {
        LOG_ERROR(aqStore, "No cities table in %s", qUtf8Printable(dbPath));
        return std::nullopt;
    }

    const bool hasAlternateNames = connection->columnExists("cities", "alternate_names");
    SqliteGazetteerStore store(std::move(*connection));
    store.m_hasAlternateNames = hasAlternateNames;
    if (!hasAlternateNames) {
        LOG_WARN(aqStore, "Gazetteer has no alternate_names column; alternate-name lookup disabled");
    }
    return store;
}

std::vector<GeocodeEntry> SqliteGazetteerStore::exactMatch(const QString& name, int limit) const
{
    if (name.trimmed().isEmpty()) {
        return {};
    }
    if (m_hasAlternateNames) {
        return runLookup(R"(
            SELECT name, latitude, longitude, country_code, population, alternate_names
            FROM cities
            WHERE name = ?1 COLLATE NOCASE
            ORDER BY population DESC
            LIMIT ?2
        )", name.trimmed(), limit);
    }
    return runLookup(R"(
        SELECT name, latitude, longitude, country_code, population, NULL
        FROM cities
        WHERE name = ?1 COLLATE NOCASE
        ORDER BY population DESC
        LIMIT ?2
    )", name.trimmed(), limit);
}

std::vector<GeocodeEntry> SqliteGazetteerStore::prefixMatch(const QString& prefix, int limit) const
{
    if (prefix.trimmed().isEmpty()) {
        return {};
    }
    const QString pattern = escapeLike(prefix.trimmed()) + QLatin1Char('%');
    if (m_hasAlternateNames) {
        return runLookup(R"(
            SELECT name, latitude, longitude, country_code, population, alternate_names
            FROM cities
            WHERE name LIKE ?1 ESCAPE '\'
            ORDER BY population DESC
            LIMIT ?2
        )", pattern, limit);
    }
    return runLookup(R"(
        SELECT name, latitude, longitude, country_code, population, NULL
        FROM cities
        WHERE name LIKE ?1 ESCAPE '\'
        ORDER BY population DESC
        LIMIT ?2
    )", pattern, limit);
}

std::vector<GeocodeEntry> SqliteGazetteerStore::substringMatch(const QString& text, int limit) const
{
    if (!m_hasAlternateNames || text.trimmed().isEmpty()) {
        return {};
    }
    const QString pattern = QLatin1Char('%') + escapeLike(text.trimmed()) + QLatin1Char('%');
    return runLookup(R"(
        SELECT name, latitude, longitude, country_code, population, alternate_names
        FROM cities
        WHERE alternate_names LIKE ?1 ESCAPE '\'
        ORDER BY population DESC
        LIMIT ?2
    )", pattern, limit);
}

std::vector<GeocodeEntry> SqliteGazetteerStore::runLookup(const char* sql,
                                                          const QString& argument,
                                                          int limit) const
{
    std::vector<GeocodeEntry> entries;
    if (limit <= 0) {
        return entries;
    }

    Statement stmt(m_connection, sql);
    stmt.bindText(1, argument);
    stmt.bindInt(2, limit);

    while (stmt.next()) {
        GeocodeEntry entry;
        entry.name = stmt.text(0);
        entry.coordinate = Coordinate{stmt.real(1), stmt.real(2)};
        entry.countryCode = stmt.text(3).toUpper();
        entry.population = stmt.int64(4);
        entry.alternateNames = splitAlternateNames(stmt.text(5));
        entries.push_back(std::move(entry));
    }
    return entries;
}

} // namespace aq
