#pragma once

#include "core/store/notification_store.h"
#include "core/store/sqlite_connection.h"

#include <optional>

namespace aq {

// SqliteNotificationStore -- reads ga_notification_requirements from
// ga_notifications.db. Rows at or below the confidence floor are ignored;
// when an ICAO has several rows the most confident one is reported.
class SqliteNotificationStore : public NotificationStore {
public:
    static std::optional<SqliteNotificationStore> open(const QString& dbPath);

    static constexpr double kMinConfidence = 0.5;

    std::vector<NotificationRecord> queryByMaxHours(std::optional<int> maxHours) const override;
    QHash<QString, NotificationRecord> groupByIcao() const override;
    std::optional<NotificationRecord> recordFor(const QString& icao) const override;

private:
    explicit SqliteNotificationStore(SqliteConnection connection)
        : m_connection(std::move(connection)) {}

    SqliteConnection m_connection;
    bool m_hasConfidence = false;
};

} // namespace aq
