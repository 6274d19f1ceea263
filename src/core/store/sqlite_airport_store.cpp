#include "core/store/sqlite_airport_store.h"
#include "core/store/sqlite_connection.h"
#include "core/store/store_error.h"
#include "core/geo/geodesy.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace aq {

namespace {

RunwayEnd readRunwayEnd(const Statement& stmt, int firstColumn)
{
    RunwayEnd end;
    end.ident = stmt.text(firstColumn);
    const std::optional<double> lat = stmt.optionalReal(firstColumn + 1);
    const std::optional<double> lon = stmt.optionalReal(firstColumn + 2);
    if (lat && lon) {
        end.coordinate = Coordinate{*lat, *lon};
    }
    end.headingTrue = stmt.optionalReal(firstColumn + 3);
    return end;
}

constexpr double kHalfPi = 1.57079632679489661923;

// Margin for rounding at the window edge, in degrees.
constexpr double kWindowSlackDeg = 1e-6;

// Latitude/longitude window test ahead of the haversine. The window is the
// exact extent of the spherical cap, so it always contains the true circle.
bool withinBoundingBox(const Coordinate& center, double radiusNm, const Coordinate& point)
{
    const double angular = radiusNm / geo::kEarthRadiusNm;
    const double latDelta = geo::radiansToDegrees(angular) + kWindowSlackDeg;
    if (std::fabs(point.latitude - center.latitude) > latDelta) {
        return false;
    }

    // A cap that reaches a pole spans every longitude
    const double centerLat = geo::degreesToRadians(center.latitude);
    if (angular >= kHalfPi - std::fabs(centerLat)) {
        return true;
    }
    const double lonReach = std::asin(std::min(1.0, std::sin(angular) / std::cos(centerLat)));
    const double lonDelta = geo::radiansToDegrees(lonReach) + kWindowSlackDeg;

    double pointDelta = std::fabs(point.longitude - center.longitude);
    if (pointDelta > 180.0) {
        pointDelta = 360.0 - pointDelta;
    }
    return pointDelta <= lonDelta;
}

} // namespace

std::optional<SqliteAirportStore> SqliteAirportStore::open(const QString& dbPath)
{
    std::optional<SqliteConnection> connection = SqliteConnection::openReadOnly(dbPath);
    if (!connection.has_value()) {
        return std::nullopt;
    }

    SqliteAirportStore store;
    if (!store.load(*connection)) {
        return std::nullopt;
    }
    return store;
}

bool SqliteAirportStore::load(const SqliteConnection& connection)
{
    if (!connection.tableExists("airports")) {
        LOG_ERROR(aqStore, "No airports table in %s", qUtf8Printable(connection.path()));
        return false;
    }

    QElapsedTimer timer;
    timer.start();

    try {
        loadAirports(connection);
        loadRunways(connection);
        loadProcedures(connection);
        loadAipEntries(connection);
        loadBorderCrossings(connection);
        loadFuel(connection);
        loadLandingFees(connection);
    } catch (const DataSourceError& e) {
        LOG_ERROR(aqStore, "Failed to load airport snapshot: %s", e.what());
        return false;
    }

    LOG_INFO(aqStore, "Loaded %d airports (%d border crossings) in %lld ms",
             static_cast<int>(m_airports.size()),
             static_cast<int>(m_borderCrossings.size()),
             static_cast<long long>(timer.elapsed()));
    return true;
}

// ── Loading ─────────────────────────────────────────────────

void SqliteAirportStore::loadAirports(const SqliteConnection& connection)
{
    Statement stmt(connection, R"(
        SELECT icao_code, name, municipality, iso_country,
               latitude_deg, longitude_deg, elevation_ft, type
        FROM airports
        WHERE length(icao_code) = 4
        ORDER BY icao_code
    )");

    while (stmt.next()) {
        Airport airport;
        airport.icao = stmt.text(0).toUpper();
        airport.name = stmt.text(1);
        airport.city = stmt.text(2);
        airport.country = stmt.text(3).toUpper();
        airport.coordinate = Coordinate{stmt.real(4), stmt.real(5)};
        airport.elevationFt = stmt.integer(6);
        airport.type = airportTypeFromString(stmt.text(7));

        if (m_indexByIcao.contains(airport.icao)) {
            continue;
        }
        m_indexByIcao.insert(airport.icao, m_airports.size());
        m_airports.push_back(std::move(airport));
    }
}

void SqliteAirportStore::loadRunways(const SqliteConnection& connection)
{
    if (!connection.tableExists("runways")) {
        LOG_WARN(aqStore, "airports.db has no runways table");
        return;
    }

    Statement stmt(connection, R"(
        SELECT airport_icao, length_ft, width_ft, surface, lighted, closed,
               le_ident, le_latitude_deg, le_longitude_deg, le_heading_degT,
               he_ident, he_latitude_deg, he_longitude_deg, he_heading_degT
        FROM runways
    )");

    while (stmt.next()) {
        Airport* airport = mutableAirport(stmt.text(0));
        if (!airport) {
            continue;
        }
        Runway runway;
        runway.lengthFt = stmt.integer(1);
        runway.widthFt = stmt.integer(2);
        runway.surface = stmt.text(3);
        runway.lighted = stmt.integer(4) != 0;
        runway.closed = stmt.integer(5) != 0;
        runway.le = readRunwayEnd(stmt, 6);
        runway.he = readRunwayEnd(stmt, 10);
        airport->runways.push_back(std::move(runway));
    }
}

void SqliteAirportStore::loadProcedures(const SqliteConnection& connection)
{
    if (!connection.tableExists("procedures")) {
        LOG_WARN(aqStore, "airports.db has no procedures table");
        return;
    }

    Statement stmt(connection, R"(
        SELECT airport_icao, name, procedure_type, approach_type, precision_category
        FROM procedures
    )");

    while (stmt.next()) {
        Airport* airport = mutableAirport(stmt.text(0));
        if (!airport) {
            continue;
        }
        Procedure procedure;
        procedure.name = stmt.text(1);
        procedure.type = procedureTypeFromString(stmt.text(2));
        procedure.approachType = stmt.text(3);
        procedure.precision = precisionCategoryFromString(stmt.text(4));
        airport->procedures.push_back(std::move(procedure));
    }
}

void SqliteAirportStore::loadAipEntries(const SqliteConnection& connection)
{
    if (!connection.tableExists("aip_entries")) {
        LOG_WARN(aqStore, "airports.db has no aip_entries table");
        return;
    }

    Statement stmt(connection, R"(
        SELECT airport_icao, section, field, value, std_field
        FROM aip_entries
    )");

    while (stmt.next()) {
        Airport* airport = mutableAirport(stmt.text(0));
        if (!airport) {
            continue;
        }
        AipEntry entry;
        entry.section = stmt.text(1);
        entry.field = stmt.text(2);
        entry.value = stmt.text(3);
        entry.standardField = stmt.text(4);
        airport->aipEntries.push_back(std::move(entry));
    }
}

void SqliteAirportStore::loadBorderCrossings(const SqliteConnection& connection)
{
    if (!connection.tableExists("border_crossing_points")) {
        LOG_WARN(aqStore, "airports.db has no border_crossing_points table");
        return;
    }

    Statement stmt(connection, "SELECT DISTINCT icao_code FROM border_crossing_points");
    while (stmt.next()) {
        const QString icao = stmt.text(0).trimmed().toUpper();
        if (!icao.isEmpty()) {
            m_borderCrossings.insert(icao);
        }
    }
}

void SqliteAirportStore::loadFuel(const SqliteConnection& connection)
{
    if (!connection.tableExists("fuel_availability")) {
        return;
    }

    Statement stmt(connection, "SELECT icao, fuel_type, available FROM fuel_availability");
    while (stmt.next()) {
        Airport* airport = mutableAirport(stmt.text(0));
        if (!airport) {
            continue;
        }
        FuelAvailability fuel;
        fuel.fuelType = stmt.text(1);
        fuel.available = stmt.integer(2) != 0;
        airport->fuels.push_back(std::move(fuel));
    }
}

void SqliteAirportStore::loadLandingFees(const SqliteConnection& connection)
{
    if (!connection.tableExists("ga_landing_fees")) {
        return;
    }

    // Lowest-bounded band covering the reference weight wins
    Statement stmt(connection, R"(
        SELECT icao, amount, currency
        FROM ga_landing_fees
        WHERE (mtow_min_kg IS NULL OR mtow_min_kg <= ?1)
          AND (mtow_max_kg IS NULL OR mtow_max_kg >= ?1)
          AND amount IS NOT NULL
        ORDER BY icao, mtow_min_kg
    )");
    stmt.bindInt(1, kReferenceMtowKg);

    while (stmt.next()) {
        Airport* airport = mutableAirport(stmt.text(0));
        if (!airport || airport->landingFee.has_value()) {
            continue;
        }
        airport->landingFee = LandingFee{stmt.real(1), stmt.text(2)};
    }
}

Airport* SqliteAirportStore::mutableAirport(const QString& icao)
{
    const auto it = m_indexByIcao.constFind(icao.trimmed().toUpper());
    if (it == m_indexByIcao.constEnd()) {
        return nullptr;
    }
    return &m_airports[it.value()];
}

// ── Queries ─────────────────────────────────────────────────

std::optional<Airport> SqliteAirportStore::lookupByCode(const QString& icao) const
{
    const auto it = m_indexByIcao.constFind(icao.trimmed().toUpper());
    if (it == m_indexByIcao.constEnd()) {
        return std::nullopt;
    }
    return m_airports[it.value()];
}

std::vector<Airport> SqliteAirportStore::textSearch(const QString& query) const
{
    const QString needle = query.trimmed();
    if (needle.isEmpty()) {
        return {};
    }

    std::vector<Airport> matches;
    for (const Airport& airport : m_airports) {
        if (airport.icao.contains(needle, Qt::CaseInsensitive)
            || airport.name.contains(needle, Qt::CaseInsensitive)
            || airport.city.contains(needle, Qt::CaseInsensitive)) {
            matches.push_back(airport);
        }
    }
    return matches;
}

std::vector<Airport> SqliteAirportStore::spatialQuery(const Coordinate& center, double radiusNm) const
{
    std::vector<Airport> matches;
    if (radiusNm < 0.0) {
        return matches;
    }
    for (const Airport& airport : m_airports) {
        if (!withinBoundingBox(center, radiusNm, airport.coordinate)) {
            continue;
        }
        if (geo::distanceNm(center, airport.coordinate) <= radiusNm) {
            matches.push_back(airport);
        }
    }
    return matches;
}

std::vector<Airport> SqliteAirportStore::attributeScan(const AirportPredicate& predicate) const
{
    std::vector<Airport> matches;
    std::copy_if(m_airports.begin(), m_airports.end(), std::back_inserter(matches), predicate);
    return matches;
}

} // namespace aq
