#pragma once

#include "core/query/airport_query_engine.h"
#include "core/store/gazetteer_store.h"

#include <QString>
#include <memory>
#include <optional>
#include <vector>

namespace aq {

enum class LocationSource {
    IcaoCode,
    GazetteerExact,
    GazetteerPrefix,
    GazetteerAlternateName,
    AirportName,
};

QString locationSourceToString(LocationSource source);

struct LocationQuery {
    QString text;
    // Reserved; the cascade does not narrow by country yet.
    std::optional<QString> countryHint;
};

struct ResolvedLocation {
    Coordinate coordinate;
    QString canonicalName;
    std::optional<QString> icao;         // set when the location is an airport
    LocationSource source = LocationSource::IcaoCode;
    std::optional<QString> countryCode;  // set for gazetteer hits
};

// Nearest airport standing in for a non-airport location.
struct AnchorAirport {
    Airport airport;
    double distanceNm = 0.0;
    bool substituted = false;  // false when the location already was an airport
};

// One step of the resolution cascade.
class LocationStrategy {
public:
    virtual ~LocationStrategy() = default;
    virtual LocationSource source() const = 0;
    virtual std::optional<ResolvedLocation> resolve(const LocationQuery& query) const = 0;
};

class IcaoCodeStrategy : public LocationStrategy {
public:
    explicit IcaoCodeStrategy(const AirportQueryEngine& airports) : m_airports(airports) {}
    LocationSource source() const override { return LocationSource::IcaoCode; }
    std::optional<ResolvedLocation> resolve(const LocationQuery& query) const override;

    // Exactly four ASCII letters after trimming.
    static bool looksLikeIcao(const QString& text);

private:
    const AirportQueryEngine& m_airports;
};

class GazetteerExactStrategy : public LocationStrategy {
public:
    explicit GazetteerExactStrategy(const GazetteerStore& gazetteer) : m_gazetteer(gazetteer) {}
    LocationSource source() const override { return LocationSource::GazetteerExact; }
    std::optional<ResolvedLocation> resolve(const LocationQuery& query) const override;

private:
    const GazetteerStore& m_gazetteer;
};

class GazetteerPrefixStrategy : public LocationStrategy {
public:
    explicit GazetteerPrefixStrategy(const GazetteerStore& gazetteer) : m_gazetteer(gazetteer) {}
    LocationSource source() const override { return LocationSource::GazetteerPrefix; }
    std::optional<ResolvedLocation> resolve(const LocationQuery& query) const override;

private:
    const GazetteerStore& m_gazetteer;
};

class GazetteerAlternateNameStrategy : public LocationStrategy {
public:
    explicit GazetteerAlternateNameStrategy(const GazetteerStore& gazetteer) : m_gazetteer(gazetteer) {}
    LocationSource source() const override { return LocationSource::GazetteerAlternateName; }
    std::optional<ResolvedLocation> resolve(const LocationQuery& query) const override;

private:
    const GazetteerStore& m_gazetteer;
};

class AirportNameStrategy : public LocationStrategy {
public:
    explicit AirportNameStrategy(const AirportQueryEngine& airports) : m_airports(airports) {}
    LocationSource source() const override { return LocationSource::AirportName; }
    std::optional<ResolvedLocation> resolve(const LocationQuery& query) const override;

private:
    const AirportQueryEngine& m_airports;
};

// LocationResolver -- ordered fallback cascade. The first strategy that
// yields a location wins; later strategies are not consulted.
//
// Default order: ICAO code, gazetteer exact, gazetteer prefix, gazetteer
// alternate names, airport name/city search. Gazetteer steps are skipped
// when no gazetteer is available.
class LocationResolver {
public:
    static constexpr double kDefaultAnchorRadiusNm = 100.0;

    LocationResolver(const AirportQueryEngine& airports, const GazetteerStore* gazetteer);

    // Custom cascade (tests, alternative orders).
    LocationResolver(const AirportQueryEngine& airports,
                     std::vector<std::unique_ptr<LocationStrategy>> strategies);

    std::optional<ResolvedLocation> resolve(const LocationQuery& query) const;
    std::optional<ResolvedLocation> resolve(const QString& text) const;

    // Airport to use when a caller needs an ICAO. Returns the location's own
    // airport when it has one; otherwise the nearest airport within
    // maxRadiusNm, preferring the location's country. Nullopt when none.
    std::optional<AnchorAirport> anchorAirport(const ResolvedLocation& location,
                                               double maxRadiusNm = kDefaultAnchorRadiusNm) const;

    size_t strategyCount() const { return m_strategies.size(); }

private:
    const AirportQueryEngine& m_airports;
    std::vector<std::unique_ptr<LocationStrategy>> m_strategies;
};

} // namespace aq
