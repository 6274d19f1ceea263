#include "core/store/data_sources.h"
#include "core/store/sqlite_airport_store.h"
#include "core/store/sqlite_gazetteer_store.h"
#include "core/store/sqlite_notification_store.h"
#include "core/shared/logging.h"

namespace aq {

DataSources DataSources::open(const Settings& settings)
{
    DataSources sources;

    std::optional<SqliteAirportStore> airportStore = SqliteAirportStore::open(settings.airportsDbPath);
    if (airportStore.has_value()) {
        sources.airports = std::make_unique<SqliteAirportStore>(std::move(*airportStore));
    } else {
        LOG_ERROR(aqStore, "Airport database unavailable: %s", qUtf8Printable(settings.airportsDbPath));
    }

    std::optional<SqliteGazetteerStore> gazetteer = SqliteGazetteerStore::open(settings.gazetteerDbPath);
    if (gazetteer.has_value()) {
        sources.gazetteer = std::make_unique<SqliteGazetteerStore>(std::move(*gazetteer));
    } else {
        LOG_WARN(aqStore, "Gazetteer unavailable, place names resolve through airports only");
    }

    std::optional<SqliteNotificationStore> notifications =
        SqliteNotificationStore::open(settings.notificationsDbPath);
    if (notifications.has_value()) {
        sources.notifications = std::make_unique<SqliteNotificationStore>(std::move(*notifications));
    } else {
        LOG_WARN(aqStore, "Notification database unavailable");
    }

    sources.rules = RulesDocument::loadFromFile(settings.rulesJsonPath);
    if (!sources.rules.has_value()) {
        LOG_WARN(aqStore, "Rules document unavailable");
    }

    return sources;
}

} // namespace aq
