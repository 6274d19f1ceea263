#pragma once

#include "core/store/gazetteer_store.h"
#include "core/store/sqlite_connection.h"

#include <optional>

namespace aq {

// SqliteGazetteerStore -- place-name lookups over the cities table of
// european_cities.db. Keeps one shared read-only handle for its lifetime.
class SqliteGazetteerStore : public GazetteerStore {
public:
    static std::optional<SqliteGazetteerStore> open(const QString& dbPath);

    std::vector<GeocodeEntry> exactMatch(const QString& name, int limit) const override;
    std::vector<GeocodeEntry> prefixMatch(const QString& prefix, int limit) const override;
    std::vector<GeocodeEntry> substringMatch(const QString& text, int limit) const override;

private:
    explicit SqliteGazetteerStore(SqliteConnection connection)
        : m_connection(std::move(connection)) {}

    std::vector<GeocodeEntry> runLookup(const char* sql, const QString& argument, int limit) const;

    SqliteConnection m_connection;
    bool m_hasAlternateNames = false;
};

} // namespace aq
