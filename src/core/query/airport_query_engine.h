#pragma once

#include "core/store/airport_store.h"

#include <QString>
#include <stdexcept>
#include <vector>

namespace aq {

// Thrown for a detail or route-endpoint lookup on an unknown ICAO.
class AirportNotFoundError : public std::runtime_error {
public:
    explicit AirportNotFoundError(const QString& icao)
        : std::runtime_error("Airport not found: " + icao.toStdString()), m_icao(icao) {}

    const QString& icao() const { return m_icao; }

private:
    QString m_icao;
};

struct AirportDistance {
    Airport airport;
    double distanceNm = 0.0;
};

struct RouteAirport {
    Airport airport;
    double segmentDistanceNm = 0.0;    // distance off the route segment
    double alongTrackDistanceNm = 0.0; // progress from the departure end
};

struct RouteResult {
    Airport from;
    Airport to;
    double routeLengthNm = 0.0;
    std::vector<RouteAirport> airports;
};

// AirportQueryEngine -- text, spatial and attribute queries over an
// AirportStore. Holds no state of its own; safe to share.
class AirportQueryEngine {
public:
    explicit AirportQueryEngine(const AirportStore& store) : m_store(store) {}

    static constexpr int kDefaultSearchLimit = 10;

    // Ranked by exact > prefix > substring on ICAO, name or city, then ICAO.
    std::vector<Airport> searchByText(const QString& query, int limit = kDefaultSearchLimit) const;

    // Airports within radiusNm (inclusive), nearest first, ties by ICAO.
    std::vector<AirportDistance> withinRadius(const Coordinate& center, double radiusNm) const;

    // The n nearest airports, nearest first.
    std::vector<AirportDistance> nearestN(const Coordinate& center, int n) const;

    // Airports within corridorWidthNm of the great-circle segment between
    // two airports, endpoints included. Ordered by along-track distance,
    // then segment distance, then ICAO. Throws AirportNotFoundError.
    RouteResult alongRoute(const QString& fromIcao, const QString& toIcao,
                           double corridorWidthNm) const;

    std::vector<Airport> byField(const AirportPredicate& predicate) const;

    // Throws AirportNotFoundError.
    Airport detail(const QString& icao) const;

    bool isBorderCrossing(const QString& icao) const;

    const AirportStore& store() const { return m_store; }

private:
    const AirportStore& m_store;
};

} // namespace aq
