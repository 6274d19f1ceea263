#pragma once

#include "core/store/airport_store.h"

#include <QHash>
#include <optional>

namespace aq {

class SqliteConnection;

// SqliteAirportStore -- in-memory snapshot of airports.db.
//
// The whole dataset (airports, runways, procedures, AIP entries, border
// crossings and the optional fuel/fee enrichment tables) is read once in
// open(); the database handle is released as soon as loading finishes.
class SqliteAirportStore : public AirportStore {
public:
    // Returns nullopt when the file is missing or lacks an airports table.
    static std::optional<SqliteAirportStore> open(const QString& dbPath);

    // Reference aircraft weight for landing-fee lookups.
    static constexpr int kReferenceMtowKg = 1000;

    std::optional<Airport> lookupByCode(const QString& icao) const override;
    std::vector<Airport> textSearch(const QString& query) const override;
    std::vector<Airport> spatialQuery(const Coordinate& center, double radiusNm) const override;
    std::vector<Airport> attributeScan(const AirportPredicate& predicate) const override;
    QSet<QString> borderCrossingIcaos() const override { return m_borderCrossings; }
    const std::vector<Airport>& allAirports() const override { return m_airports; }

    size_t size() const { return m_airports.size(); }

private:
    SqliteAirportStore() = default;

    bool load(const SqliteConnection& connection);
    void loadAirports(const SqliteConnection& connection);
    void loadRunways(const SqliteConnection& connection);
    void loadProcedures(const SqliteConnection& connection);
    void loadAipEntries(const SqliteConnection& connection);
    void loadBorderCrossings(const SqliteConnection& connection);
    void loadFuel(const SqliteConnection& connection);
    void loadLandingFees(const SqliteConnection& connection);

    Airport* mutableAirport(const QString& icao);

    std::vector<Airport> m_airports;       // sorted by ICAO
    QHash<QString, size_t> m_indexByIcao;  // ICAO -> position in m_airports
    QSet<QString> m_borderCrossings;
};

} // namespace aq
