#include "core/query/location_resolver.h"
#include "core/shared/logging.h"

namespace aq {

namespace {

ResolvedLocation fromAirport(const Airport& airport, LocationSource source)
{
    ResolvedLocation location;
    location.coordinate = airport.coordinate;
    location.canonicalName = airport.name;
    location.icao = airport.icao;
    location.source = source;
    if (!airport.country.isEmpty()) {
        location.countryCode = airport.country;
    }
    return location;
}

std::optional<ResolvedLocation> firstEntry(const std::vector<GeocodeEntry>& entries,
                                           LocationSource source)
{
    if (entries.empty()) {
        return std::nullopt;
    }
    const GeocodeEntry& top = entries.front();
    ResolvedLocation location;
    location.coordinate = top.coordinate;
    location.canonicalName = top.name;
    location.source = source;
    if (!top.countryCode.isEmpty()) {
        location.countryCode = top.countryCode;
    }
    return location;
}

} // namespace

QString locationSourceToString(LocationSource source)
{
    switch (source) {
    case LocationSource::IcaoCode:               return QStringLiteral("icao_code");
    case LocationSource::GazetteerExact:         return QStringLiteral("gazetteer_exact");
    case LocationSource::GazetteerPrefix:        return QStringLiteral("gazetteer_prefix");
    case LocationSource::GazetteerAlternateName: return QStringLiteral("gazetteer_alternate_name");
    case LocationSource::AirportName:            return QStringLiteral("airport_name");
    }
    return QStringLiteral("unknown");
}

// ── Strategies ──────────────────────────────────────────────

bool IcaoCodeStrategy::looksLikeIcao(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.size() != 4) {
        return false;
    }
    for (const QChar ch : trimmed) {
        const char16_t c = ch.unicode();
        const bool asciiLetter = (c >= u'A' && c <= u'Z') || (c >= u'a' && c <= u'z');
        if (!asciiLetter) {
            return false;
        }
    }
    return true;
}

std::optional<ResolvedLocation> IcaoCodeStrategy::resolve(const LocationQuery& query) const
{
    if (!looksLikeIcao(query.text)) {
        return std::nullopt;
    }
    const std::optional<Airport> airport =
        m_airports.store().lookupByCode(query.text.trimmed().toUpper());
    if (!airport.has_value()) {
        return std::nullopt;
    }
    return fromAirport(*airport, source());
}

std::optional<ResolvedLocation> GazetteerExactStrategy::resolve(const LocationQuery& query) const
{
    return firstEntry(m_gazetteer.exactMatch(query.text, 1), source());
}

std::optional<ResolvedLocation> GazetteerPrefixStrategy::resolve(const LocationQuery& query) const
{
    return firstEntry(m_gazetteer.prefixMatch(query.text, 1), source());
}

std::optional<ResolvedLocation> GazetteerAlternateNameStrategy::resolve(const LocationQuery& query) const
{
    return firstEntry(m_gazetteer.substringMatch(query.text, 1), source());
}

std::optional<ResolvedLocation> AirportNameStrategy::resolve(const LocationQuery& query) const
{
    const std::vector<Airport> hits = m_airports.searchByText(query.text, 1);
    if (hits.empty()) {
        return std::nullopt;
    }
    return fromAirport(hits.front(), source());
}

// ── LocationResolver ────────────────────────────────────────

LocationResolver::LocationResolver(const AirportQueryEngine& airports,
                                   const GazetteerStore* gazetteer)
    : m_airports(airports)
{
    m_strategies.push_back(std::make_unique<IcaoCodeStrategy>(airports));
    if (gazetteer) {
        m_strategies.push_back(std::make_unique<GazetteerExactStrategy>(*gazetteer));
        m_strategies.push_back(std::make_unique<GazetteerPrefixStrategy>(*gazetteer));
        m_strategies.push_back(std::make_unique<GazetteerAlternateNameStrategy>(*gazetteer));
    }
    m_strategies.push_back(std::make_unique<AirportNameStrategy>(airports));
}

LocationResolver::LocationResolver(const AirportQueryEngine& airports,
                                   std::vector<std::unique_ptr<LocationStrategy>> strategies)
    : m_airports(airports)
    , m_strategies(std::move(strategies))
{
}

std::optional<ResolvedLocation> LocationResolver::resolve(const LocationQuery& query) const
{
    if (query.text.trimmed().isEmpty()) {
        return std::nullopt;
    }

    for (const std::unique_ptr<LocationStrategy>& strategy : m_strategies) {
        std::optional<ResolvedLocation> location = strategy->resolve(query);
        if (location.has_value()) {
            LOG_DEBUG(aqQuery, "Resolved '%s' via %s -> %s (%.4f, %.4f)",
                      qUtf8Printable(query.text),
                      qUtf8Printable(locationSourceToString(strategy->source())),
                      qUtf8Printable(location->canonicalName),
                      location->coordinate.latitude, location->coordinate.longitude);
            return location;
        }
    }

    LOG_INFO(aqQuery, "Could not resolve location '%s'", qUtf8Printable(query.text));
    return std::nullopt;
}

std::optional<ResolvedLocation> LocationResolver::resolve(const QString& text) const
{
    return resolve(LocationQuery{text, std::nullopt});
}

std::optional<AnchorAirport> LocationResolver::anchorAirport(const ResolvedLocation& location,
                                                             double maxRadiusNm) const
{
    if (location.icao.has_value()) {
        std::optional<Airport> own = m_airports.store().lookupByCode(*location.icao);
        if (own.has_value()) {
            return AnchorAirport{std::move(*own), 0.0, false};
        }
    }

    const std::vector<AirportDistance> nearby = m_airports.withinRadius(location.coordinate, maxRadiusNm);
    if (nearby.empty()) {
        return std::nullopt;
    }

    const AirportDistance* chosen = &nearby.front();
    if (location.countryCode.has_value()) {
        for (const AirportDistance& candidate : nearby) {
            if (candidate.airport.country.compare(*location.countryCode, Qt::CaseInsensitive) == 0) {
                chosen = &candidate;
                break;
            }
        }
    }

    LOG_DEBUG(aqQuery, "Anchored '%s' to %s (%.1f nm)",
              qUtf8Printable(location.canonicalName),
              qUtf8Printable(chosen->airport.icao), chosen->distanceNm);
    return AnchorAirport{chosen->airport, chosen->distanceNm, true};
}

} // namespace aq
