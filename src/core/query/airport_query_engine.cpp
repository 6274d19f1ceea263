#include "core/query/airport_query_engine.h"
#include "core/geo/geodesy.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace aq {

namespace {

enum class TextMatchRank {
    Exact = 0,
    Prefix = 1,
    Substring = 2,
    None = 3,
};

TextMatchRank rankField(const QString& field, const QString& query)
{
    if (field.isEmpty()) {
        return TextMatchRank::None;
    }
    if (field.compare(query, Qt::CaseInsensitive) == 0) {
        return TextMatchRank::Exact;
    }
    if (field.startsWith(query, Qt::CaseInsensitive)) {
        return TextMatchRank::Prefix;
    }
    if (field.contains(query, Qt::CaseInsensitive)) {
        return TextMatchRank::Substring;
    }
    return TextMatchRank::None;
}

TextMatchRank rankAirport(const Airport& airport, const QString& query)
{
    return std::min({rankField(airport.icao, query),
                     rankField(airport.name, query),
                     rankField(airport.city, query)});
}

bool closerThan(const AirportDistance& a, const AirportDistance& b)
{
    if (a.distanceNm != b.distanceNm) {
        return a.distanceNm < b.distanceNm;
    }
    return a.airport.icao < b.airport.icao;
}

} // namespace

std::vector<Airport> AirportQueryEngine::searchByText(const QString& query, int limit) const
{
    const QString needle = query.trimmed();
    if (needle.isEmpty() || limit <= 0) {
        return {};
    }

    struct Ranked {
        TextMatchRank rank;
        Airport airport;
    };

    std::vector<Ranked> ranked;
    for (Airport& airport : m_store.textSearch(needle)) {
        const TextMatchRank rank = rankAirport(airport, needle);
        if (rank != TextMatchRank::None) {
            ranked.push_back(Ranked{rank, std::move(airport)});
        }
    }

    std::sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        if (a.rank != b.rank) {
            return a.rank < b.rank;
        }
        return a.airport.icao < b.airport.icao;
    });

    std::vector<Airport> results;
    const size_t count = std::min(ranked.size(), static_cast<size_t>(limit));
    results.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        results.push_back(std::move(ranked[i].airport));
    }
    LOG_DEBUG(aqQuery, "searchByText('%s'): %d candidates, %d returned",
              qUtf8Printable(needle), static_cast<int>(ranked.size()),
              static_cast<int>(results.size()));
    return results;
}

std::vector<AirportDistance> AirportQueryEngine::withinRadius(const Coordinate& center,
                                                              double radiusNm) const
{
    std::vector<AirportDistance> results;
    for (Airport& airport : m_store.spatialQuery(center, radiusNm)) {
        const double distance = geo::distanceNm(center, airport.coordinate);
        if (distance <= radiusNm) {
            results.push_back(AirportDistance{std::move(airport), distance});
        }
    }
    std::sort(results.begin(), results.end(), closerThan);
    return results;
}

std::vector<AirportDistance> AirportQueryEngine::nearestN(const Coordinate& center, int n) const
{
    if (n <= 0) {
        return {};
    }

    std::vector<AirportDistance> all;
    const std::vector<Airport>& airports = m_store.allAirports();
    all.reserve(airports.size());
    for (const Airport& airport : airports) {
        all.push_back(AirportDistance{airport, geo::distanceNm(center, airport.coordinate)});
    }

    const size_t count = std::min(all.size(), static_cast<size_t>(n));
    std::partial_sort(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(count), all.end(),
                      closerThan);
    all.resize(count);
    return all;
}

RouteResult AirportQueryEngine::alongRoute(const QString& fromIcao, const QString& toIcao,
                                           double corridorWidthNm) const
{
    RouteResult result;
    result.from = detail(fromIcao);
    result.to = detail(toIcao);

    const Coordinate& start = result.from.coordinate;
    const Coordinate& end = result.to.coordinate;
    result.routeLengthNm = geo::distanceNm(start, end);

    const double width = std::max(0.0, corridorWidthNm);

    // Anything inside the corridor is within length + width of the start
    for (Airport& airport : m_store.spatialQuery(start, result.routeLengthNm + width)) {
        geo::SegmentProjection projection = geo::projectOntoSegment(start, end, airport.coordinate);

        // Endpoints sit on the route by definition
        if (airport.icao == result.from.icao) {
            projection = geo::SegmentProjection{0.0, 0.0};
        } else if (airport.icao == result.to.icao) {
            projection = geo::SegmentProjection{0.0, result.routeLengthNm};
        }

        if (projection.segmentDistanceNm > width) {
            continue;
        }
        result.airports.push_back(RouteAirport{std::move(airport),
                                               projection.segmentDistanceNm,
                                               projection.alongTrackDistanceNm});
    }

    std::sort(result.airports.begin(), result.airports.end(),
              [](const RouteAirport& a, const RouteAirport& b) {
                  if (a.alongTrackDistanceNm != b.alongTrackDistanceNm) {
                      return a.alongTrackDistanceNm < b.alongTrackDistanceNm;
                  }
                  if (a.segmentDistanceNm != b.segmentDistanceNm) {
                      return a.segmentDistanceNm < b.segmentDistanceNm;
                  }
                  return a.airport.icao < b.airport.icao;
              });

    LOG_DEBUG(aqQuery, "alongRoute %s -> %s (%.1f nm, corridor %.1f nm): %d airports",
              qUtf8Printable(result.from.icao), qUtf8Printable(result.to.icao),
              result.routeLengthNm, width, static_cast<int>(result.airports.size()));
    return result;
}

std::vector<Airport> AirportQueryEngine::byField(const AirportPredicate& predicate) const
{
    return m_store.attributeScan(predicate);
}

Airport AirportQueryEngine::detail(const QString& icao) const
{
    const QString code = icao.trimmed().toUpper();
    std::optional<Airport> airport = m_store.lookupByCode(code);
    if (!airport.has_value()) {
        throw AirportNotFoundError(code);
    }
    return std::move(*airport);
}

bool AirportQueryEngine::isBorderCrossing(const QString& icao) const
{
    return m_store.borderCrossingIcaos().contains(icao.trimmed().toUpper());
}

} // namespace aq
