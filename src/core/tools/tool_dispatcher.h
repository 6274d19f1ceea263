#pragma once

#include "core/query/airport_query_engine.h"
#include "core/query/filter_engine.h"
#include "core/query/location_resolver.h"
#include "core/rules/rules_lookup.h"
#include "core/shared/settings.h"
#include "core/store/data_sources.h"
#include "core/tools/tool_call.h"

#include <QHash>
#include <QSet>
#include <atomic>
#include <memory>
#include <vector>

namespace aq {

struct ToolInfo {
    QString name;
    QString description;
};

// ToolDispatcher -- routes tool calls to their handlers.
//
// Lifecycle: construct, initialize() once with the data sources, then
// dispatch() from any number of threads. Calls made before a successful
// initialize() fail with NotInitialized without touching any store.
// No exception escapes dispatch(); every failure becomes an Error result.
class ToolDispatcher {
public:
    explicit ToolDispatcher(Settings settings = {});
    ~ToolDispatcher();

    ToolDispatcher(const ToolDispatcher&) = delete;
    ToolDispatcher& operator=(const ToolDispatcher&) = delete;

    // Takes ownership of the sources. Returns false, staying uninitialized,
    // when there is no airport store or the dispatcher is already ready.
    bool initialize(DataSources sources);
    bool isReady() const { return m_ready.load(std::memory_order_acquire); }

    ToolResult dispatch(const ToolCallRequest& request) const;

    // parseToolCall + dispatch. MalformedToolCall when no call is found.
    ToolResult dispatchText(const QString& text) const;

    static const std::vector<ToolInfo>& availableTools();

    const Settings& settings() const { return m_settings; }

private:
    // Filter spec plus the auxiliary sets its predicates consult.
    struct PreparedFilters {
        FilterSpec spec;
        QSet<QString> borderCrossings;
        QSet<QString> qualifying;
        bool hasQualifying = false;
        QHash<QString, NotificationRecord> notifications;

        FilterContext context() const {
            return FilterContext{&borderCrossings, hasQualifying ? &qualifying : nullptr};
        }
    };

    ToolResult route(const ToolCallRequest& request) const;

    ToolResult searchAirports(const ToolArguments& args) const;
    ToolResult getAirportDetails(const ToolArguments& args) const;
    ToolResult findAirportsNearRoute(const ToolArguments& args) const;
    ToolResult findAirportsNearLocation(const ToolArguments& args) const;
    ToolResult getBorderCrossingAirports(const ToolArguments& args) const;
    ToolResult listRulesForCountry(const ToolArguments& args) const;
    ToolResult compareRulesBetweenCountries(const ToolArguments& args) const;
    ToolResult findAirportsByNotification(const ToolArguments& args) const;

    // Resolves a route endpoint to an airport. Returns the error result when
    // it cannot; otherwise fills anchor and appends any substitution note.
    std::optional<ToolResult> resolveRouteEndpoint(const QString& text, QStringList& notes,
                                                   std::optional<AnchorAirport>& anchor) const;

    // Decodes "filters" and folds in a top-level max_hours_notice.
    // Notification records are loaded when a notice filter is active or
    // withNotifications is set.
    void prepareFilters(const ToolArguments& args, PreparedFilters& prepared,
                        bool withNotifications = false) const;

    Settings m_settings;
    DataSources m_sources;
    std::unique_ptr<AirportQueryEngine> m_engine;
    std::unique_ptr<LocationResolver> m_resolver;
    std::unique_ptr<RulesLookup> m_rules;
    std::atomic<bool> m_ready{false};
};

} // namespace aq
