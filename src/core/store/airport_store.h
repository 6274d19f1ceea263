#pragma once

#include "core/shared/types.h"

#include <QSet>
#include <QString>
#include <functional>
#include <optional>
#include <vector>

namespace aq {

using AirportPredicate = std::function<bool(const Airport&)>;

// Read-only access to the airport dataset. Implementations are immutable
// after construction and safe to share between threads. Methods throw
// DataSourceError when the backing data cannot be read.
class AirportStore {
public:
    virtual ~AirportStore() = default;

    // Exact ICAO lookup, case-insensitive.
    virtual std::optional<Airport> lookupByCode(const QString& icao) const = 0;

    // Every airport whose ICAO, name or city contains the query
    // (case-insensitive). Unranked.
    virtual std::vector<Airport> textSearch(const QString& query) const = 0;

    // Every airport within radiusNm of center (inclusive). Unordered.
    virtual std::vector<Airport> spatialQuery(const Coordinate& center, double radiusNm) const = 0;

    // Every airport for which predicate returns true, in ICAO order.
    virtual std::vector<Airport> attributeScan(const AirportPredicate& predicate) const = 0;

    virtual QSet<QString> borderCrossingIcaos() const = 0;

    // The full snapshot, ordered by ICAO.
    virtual const std::vector<Airport>& allAirports() const = 0;
};

} // namespace aq
