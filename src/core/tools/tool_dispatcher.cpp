#include "core/tools/tool_dispatcher.h"
#include "core/notification/notification_classifier.h"
#include "core/shared/logging.h"
#include "core/store/store_error.h"
#include "core/tools/response_formatter.h"

#include <QElapsedTimer>

#include <algorithm>

namespace aq {

namespace {

constexpr int kMaxSearchLimit = 100;

template <typename T>
void truncateTo(std::vector<T>& items, int limit)
{
    if (limit >= 0 && items.size() > static_cast<size_t>(limit)) {
        items.resize(static_cast<size_t>(limit));
    }
}

std::optional<QString> upperCountry(const std::optional<QString>& code)
{
    if (!code.has_value()) {
        return std::nullopt;
    }
    return code->trimmed().toUpper();
}

} // namespace

const std::vector<ToolInfo>& ToolDispatcher::availableTools()
{
    static const std::vector<ToolInfo> kTools = {
        {QStringLiteral("search_airports"),
         QStringLiteral("Search airports by ICAO code, name or city")},
        {QStringLiteral("get_airport_details"),
         QStringLiteral("Full details for one airport")},
        {QStringLiteral("find_airports_near_route"),
         QStringLiteral("Airports within a corridor of the route between two locations")},
        {QStringLiteral("find_airports_near_location"),
         QStringLiteral("Airports within a radius of a place, city or airport")},
        {QStringLiteral("get_border_crossing_airports"),
         QStringLiteral("Airports that are points of entry")},
        {QStringLiteral("list_rules_for_country"),
         QStringLiteral("Aviation rules for a country")},
        {QStringLiteral("compare_rules_between_countries"),
         QStringLiteral("Side-by-side aviation rules for two countries")},
        {QStringLiteral("find_airports_by_notification"),
         QStringLiteral("Airports by prior-notice requirement")},
    };
    return kTools;
}

ToolDispatcher::ToolDispatcher(Settings settings)
    : m_settings(std::move(settings))
{
}

ToolDispatcher::~ToolDispatcher() = default;

bool ToolDispatcher::initialize(DataSources sources)
{
    if (isReady()) {
        LOG_WARN(aqTools, "ToolDispatcher already initialized");
        return false;
    }
    if (!sources.hasAirports()) {
        LOG_ERROR(aqTools, "Cannot initialize tools without an airport store");
        return false;
    }

    m_sources = std::move(sources);
    m_engine = std::make_unique<AirportQueryEngine>(*m_sources.airports);
    m_resolver = std::make_unique<LocationResolver>(*m_engine, m_sources.gazetteer.get());
    if (m_sources.rules.has_value()) {
        m_rules = std::make_unique<RulesLookup>(*m_sources.rules);
    }

    m_ready.store(true, std::memory_order_release);
    LOG_INFO(aqTools, "Tools ready: %d airports, gazetteer=%s, notifications=%s, rules=%s",
             static_cast<int>(m_sources.airports->allAirports().size()),
             m_sources.gazetteer ? "yes" : "no",
             m_sources.notifications ? "yes" : "no",
             m_rules ? "yes" : "no");
    return true;
}

ToolResult ToolDispatcher::dispatchText(const QString& text) const
{
    const std::optional<ToolCallRequest> request = parseToolCall(text);
    if (!request.has_value()) {
        return ToolResult::malformedToolCall();
    }
    return dispatch(*request);
}

ToolResult ToolDispatcher::dispatch(const ToolCallRequest& request) const
{
    if (!isReady()) {
        return ToolResult::notInitialized();
    }

    QElapsedTimer timer;
    timer.start();

    ToolResult result = ToolResult::executionFailed(QStringLiteral("no result"));
    try {
        result = route(request);
    } catch (const AirportNotFoundError& e) {
        result = ToolResult::airportNotFound(e.icao());
    } catch (const DataSourceError& e) {
        LOG_ERROR(aqTools, "%s: data source error: %s", qUtf8Printable(request.name), e.what());
        result = ToolResult::error(ToolErrorCode::DataSourceUnavailable,
                                   QStringLiteral("Data source error: %1").arg(QString::fromUtf8(e.what())));
    } catch (const std::exception& e) {
        LOG_ERROR(aqTools, "%s failed: %s", qUtf8Printable(request.name), e.what());
        result = ToolResult::executionFailed(QString::fromUtf8(e.what()));
    }

    if (result.isError()) {
        LOG_INFO(aqTools, "%s -> %s (%lld ms)", qUtf8Printable(request.name),
                 qUtf8Printable(toolErrorCodeToString(*result.errorCode())),
                 static_cast<long long>(timer.elapsed()));
    } else {
        LOG_INFO(aqTools, "%s -> ok (%lld ms)", qUtf8Printable(request.name),
                 static_cast<long long>(timer.elapsed()));
    }
    return result;
}

ToolResult ToolDispatcher::route(const ToolCallRequest& request) const
{
    const ToolArguments args(request.arguments);
    const QString& name = request.name;

    if (name == QLatin1String("search_airports")) {
        return searchAirports(args);
    }
    if (name == QLatin1String("get_airport_details")) {
        return getAirportDetails(args);
    }
    if (name == QLatin1String("find_airports_near_route")) {
        return findAirportsNearRoute(args);
    }
    if (name == QLatin1String("find_airports_near_location")) {
        return findAirportsNearLocation(args);
    }
    if (name == QLatin1String("get_border_crossing_airports")) {
        return getBorderCrossingAirports(args);
    }
    if (name == QLatin1String("list_rules_for_country")) {
        return listRulesForCountry(args);
    }
    if (name == QLatin1String("compare_rules_between_countries")) {
        return compareRulesBetweenCountries(args);
    }
    if (name == QLatin1String("find_airports_by_notification")) {
        return findAirportsByNotification(args);
    }
    return ToolResult::unknownTool(name);
}

void ToolDispatcher::prepareFilters(const ToolArguments& args, PreparedFilters& prepared,
                                    bool withNotifications) const
{
    if (const std::optional<QJsonObject> filters = args.object("filters")) {
        prepared.spec = FilterSpec::fromJson(*filters);
    }
    if (const std::optional<int> maxHours = args.integer({"max_hours_notice", "max_hours"})) {
        prepared.spec.maxHoursNotice = maxHours;
    }

    if (prepared.spec.pointOfEntry.has_value()) {
        prepared.borderCrossings = m_sources.airports->borderCrossingIcaos();
    }

    if (!m_sources.notifications) {
        // maxHoursNotice then rejects every airport (no qualifying set)
        return;
    }
    if (!withNotifications && !prepared.spec.maxHoursNotice.has_value()) {
        return;
    }
    prepared.notifications = m_sources.notifications->groupByIcao();

    if (prepared.spec.maxHoursNotice.has_value()) {
        const int maxHours = *prepared.spec.maxHoursNotice;
        for (auto it = prepared.notifications.constBegin(); it != prepared.notifications.constEnd(); ++it) {
            if (NotificationClassifier::qualifiesForMaxHours(it.value(), maxHours)) {
                prepared.qualifying.insert(it.key());
            }
        }
        if (m_settings.includeAirportsWithoutNotification) {
            for (const Airport& airport : m_sources.airports->allAirports()) {
                if (!prepared.notifications.contains(airport.icao)) {
                    prepared.qualifying.insert(airport.icao);
                }
            }
        }
        prepared.hasQualifying = true;
    }
}

// ── search_airports ─────────────────────────────────────────

ToolResult ToolDispatcher::searchAirports(const ToolArguments& args) const
{
    const std::optional<QString> query = args.string({"query", "city", "name", "icao"});
    if (!query.has_value()) {
        return ToolResult::missingArgument(QStringLiteral("query"));
    }
    const int limit = std::clamp(args.integer({"limit"}).value_or(m_settings.searchLimit),
                                 1, kMaxSearchLimit);

    PreparedFilters filters;
    prepareFilters(args, filters);

    std::vector<Airport> airports;
    if (filters.spec.hasFilters()) {
        const int everything = static_cast<int>(m_sources.airports->allAirports().size());
        airports = FilterEngine::apply(m_engine->searchByText(*query, everything),
                                       filters.spec, filters.context());
        truncateTo(airports, limit);
    } else {
        airports = m_engine->searchByText(*query, limit);
    }

    return ToolResult::success(ResponseFormatter::searchResults(query->trimmed(), airports));
}

// ── get_airport_details ─────────────────────────────────────

ToolResult ToolDispatcher::getAirportDetails(const ToolArguments& args) const
{
    const std::optional<QString> icao = args.string({"icao", "icao_code", "airport"});
    if (!icao.has_value()) {
        return ToolResult::missingArgument(QStringLiteral("icao"));
    }

    const Airport airport = m_engine->detail(icao->trimmed());

    AirportDetailExtras extras;
    extras.borderCrossing = m_engine->isBorderCrossing(airport.icao);
    if (m_sources.notifications) {
        extras.notification = m_sources.notifications->recordFor(airport.icao);
    }
    return ToolResult::success(ResponseFormatter::airportDetails(airport, extras));
}

// ── find_airports_near_route ────────────────────────────────

ToolResult ToolDispatcher::findAirportsNearRoute(const ToolArguments& args) const
{
    const std::optional<QString> from = args.string({"from", "from_location", "from_icao"});
    if (!from.has_value()) {
        return ToolResult::missingArgument(QStringLiteral("from"));
    }
    const std::optional<QString> to = args.string({"to", "to_location", "to_icao"});
    if (!to.has_value()) {
        return ToolResult::missingArgument(QStringLiteral("to"));
    }
    const double corridorNm = args.number({"max_distance_nm", "corridor_nm"})
                                  .value_or(m_settings.defaultRadiusNm);

    QStringList notes;
    std::optional<AnchorAirport> origin;
    if (std::optional<ToolResult> failed = resolveRouteEndpoint(from->trimmed(), notes, origin)) {
        return *failed;
    }
    std::optional<AnchorAirport> destination;
    if (std::optional<ToolResult> failed = resolveRouteEndpoint(to->trimmed(), notes, destination)) {
        return *failed;
    }

    PreparedFilters filters;
    prepareFilters(args, filters);

    const RouteResult route = m_engine->alongRoute(origin->airport.icao,
                                                   destination->airport.icao, corridorNm);
    std::vector<RouteAirport> airports = FilterEngine::applyTo(
        route.airports, filters.spec, filters.context(),
        [](const RouteAirport& entry) -> const Airport& { return entry.airport; });
    truncateTo(airports, m_settings.maxListedAirports);

    return ToolResult::success(ResponseFormatter::routeResults(route.from.icao, route.to.icao,
                                                               corridorNm, notes, airports));
}

std::optional<ToolResult> ToolDispatcher::resolveRouteEndpoint(const QString& text, QStringList& notes,
                                                               std::optional<AnchorAirport>& anchor) const
{
    const std::optional<ResolvedLocation> location = m_resolver->resolve(text);
    if (!location.has_value()) {
        return ToolResult::locationNotFound(text);
    }
    anchor = m_resolver->anchorAirport(*location, m_settings.anchorSearchRadiusNm);
    if (!anchor.has_value()) {
        return ToolResult::error(ToolErrorCode::LocationNotFound,
                                 QStringLiteral("No airport within %1 nm of %2")
                                     .arg(ResponseFormatter::formatNumber(m_settings.anchorSearchRadiusNm),
                                          location->canonicalName));
    }
    if (anchor->substituted) {
        notes.append(ResponseFormatter::substitutionNote(text, location->canonicalName,
                                                         anchor->airport, anchor->distanceNm));
    }
    return std::nullopt;
}

// ── find_airports_near_location ─────────────────────────────

ToolResult ToolDispatcher::findAirportsNearLocation(const ToolArguments& args) const
{
    const std::optional<QString> text = args.string({"location_query", "location", "query"});
    if (!text.has_value()) {
        return ToolResult::missingArgument(QStringLiteral("location_query"));
    }
    const double radiusNm = args.number({"max_distance_nm", "radius_nm"})
                                .value_or(m_settings.defaultRadiusNm);

    LocationQuery query;
    query.text = text->trimmed();
    query.countryHint = upperCountry(args.string({"country_hint", "country"}));

    const std::optional<ResolvedLocation> location = m_resolver->resolve(query);
    if (!location.has_value()) {
        return ToolResult::locationNotFound(query.text);
    }
    LOG_DEBUG(aqTools, "'%s' resolved via %s to %s", qUtf8Printable(query.text),
              qUtf8Printable(locationSourceToString(location->source)),
              qUtf8Printable(location->canonicalName));

    PreparedFilters filters;
    prepareFilters(args, filters, true);

    std::vector<AirportDistance> airports = FilterEngine::applyTo(
        m_engine->withinRadius(location->coordinate, radiusNm), filters.spec, filters.context(),
        [](const AirportDistance& entry) -> const Airport& { return entry.airport; });
    truncateTo(airports, m_settings.maxListedAirports);

    return ToolResult::success(ResponseFormatter::nearLocationResults(
        query.text, radiusNm, filters.spec.maxHoursNotice, airports, filters.notifications));
}

// ── get_border_crossing_airports ────────────────────────────

ToolResult ToolDispatcher::getBorderCrossingAirports(const ToolArguments& args) const
{
    const std::optional<QString> country = upperCountry(args.string({"country", "country_code"}));
    const int limit = std::max(1, args.integer({"limit"}).value_or(m_settings.borderCrossingLimit));

    const QSet<QString> borderCrossings = m_sources.airports->borderCrossingIcaos();
    std::vector<Airport> airports = m_engine->byField([&](const Airport& airport) {
        if (!borderCrossings.contains(airport.icao)) {
            return false;
        }
        return !country.has_value() || airport.country.compare(*country, Qt::CaseInsensitive) == 0;
    });
    truncateTo(airports, limit);

    return ToolResult::success(ResponseFormatter::borderCrossingResults(country, airports));
}

// ── list_rules_for_country ──────────────────────────────────

ToolResult ToolDispatcher::listRulesForCountry(const ToolArguments& args) const
{
    if (!m_rules) {
        return ToolResult::dataSourceUnavailable(QStringLiteral("Rules data"));
    }
    const std::optional<QString> country = upperCountry(args.string({"country", "country_code"}));
    if (!country.has_value()) {
        return ToolResult::missingArgument(QStringLiteral("country"));
    }
    const QString category = args.string({"category"}).value_or(QString()).trimmed();

    const std::vector<RuleAnswer> answers = m_rules->byCountry(*country, category);
    if (answers.empty()) {
        return ToolResult::error(ToolErrorCode::NoResults,
                                 QStringLiteral("No rules found for country: %1").arg(*country));
    }
    return ToolResult::success(ResponseFormatter::rulesForCountry(*country, answers));
}

// ── compare_rules_between_countries ─────────────────────────

ToolResult ToolDispatcher::compareRulesBetweenCountries(const ToolArguments& args) const
{
    if (!m_rules) {
        return ToolResult::dataSourceUnavailable(QStringLiteral("Rules data"));
    }
    const std::optional<QString> countryA = upperCountry(args.string({"country1", "country_a"}));
    if (!countryA.has_value()) {
        return ToolResult::missingArgument(QStringLiteral("country1"));
    }
    const std::optional<QString> countryB = upperCountry(args.string({"country2", "country_b"}));
    if (!countryB.has_value()) {
        return ToolResult::missingArgument(QStringLiteral("country2"));
    }
    const QString category = args.string({"category"}).value_or(QString()).trimmed();

    const std::vector<RuleComparison> rows = m_rules->compare(*countryA, *countryB, category);
    if (rows.empty()) {
        return ToolResult::error(ToolErrorCode::NoResults,
                                 QStringLiteral("No rules found for %1 or %2").arg(*countryA, *countryB));
    }
    return ToolResult::success(ResponseFormatter::rulesComparison(*countryA, *countryB, rows));
}

// ── find_airports_by_notification ───────────────────────────

ToolResult ToolDispatcher::findAirportsByNotification(const ToolArguments& args) const
{
    if (!m_sources.notifications) {
        return ToolResult::dataSourceUnavailable(QStringLiteral("Notification data"));
    }
    const std::optional<int> maxHours = args.integer({"max_hours", "max_hours_notice"});
    const std::optional<QString> country = upperCountry(args.string({"country", "country_code"}));
    const int limit = std::max(1, args.integer({"limit"}).value_or(m_settings.notificationLimit));

    std::vector<NotificationListEntry> entries;
    for (const NotificationRecord& record : m_sources.notifications->queryByMaxHours(maxHours)) {
        if (maxHours.has_value() && !NotificationClassifier::qualifiesForMaxHours(record, *maxHours)) {
            continue;
        }
        std::optional<Airport> airport = m_sources.airports->lookupByCode(record.icao);
        if (country.has_value()
            && (!airport.has_value() || airport->country.compare(*country, Qt::CaseInsensitive) != 0)) {
            continue;
        }
        entries.push_back(NotificationListEntry{record, std::move(airport)});
        if (entries.size() >= static_cast<size_t>(limit)) {
            break;
        }
    }

    if (entries.empty()) {
        QString message = QStringLiteral("No airports found with notification requirements");
        if (maxHours.has_value()) {
            message += QStringLiteral(" of at most %1h").arg(*maxHours);
        }
        if (country.has_value()) {
            message += QStringLiteral(" in %1").arg(*country);
        }
        return ToolResult::error(ToolErrorCode::NoResults, message);
    }
    return ToolResult::success(ResponseFormatter::notificationResults(maxHours, country, entries));
}

} // namespace aq
