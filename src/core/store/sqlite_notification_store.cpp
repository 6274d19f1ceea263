#include "core/store/sqlite_notification_store.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace aq {

namespace {

// Shared projection: icao, notification_type, hours_notice, summary,
// operating_hours_start, operating_hours_end.
NotificationRecord readRecord(const Statement& stmt)
{
    NotificationRecord record;
    record.icao = stmt.text(0).trimmed().toUpper();
    record.type = notificationTypeFromString(stmt.text(1));
    record.hoursNotice = stmt.optionalInteger(2);
    record.summary = stmt.optionalText(3);
    record.operatingHoursStart = stmt.optionalText(4);
    record.operatingHoursEnd = stmt.optionalText(5);
    return record;
}

QByteArray confidenceClause(bool hasConfidence)
{
    if (!hasConfidence) {
        return QByteArray("1 = 1");
    }
    return QByteArray("(confidence IS NULL OR confidence > ")
           + QByteArray::number(SqliteNotificationStore::kMinConfidence) + ")";
}

QByteArray confidenceOrder(bool hasConfidence)
{
    return hasConfidence ? QByteArray("COALESCE(confidence, 0) DESC, ") : QByteArray();
}

} // namespace

std::optional<SqliteNotificationStore> SqliteNotificationStore::open(const QString& dbPath)
{
    std::optional<SqliteConnection> connection = SqliteConnection::openReadOnly(dbPath);
    if (!connection.has_value()) {
        return std::nullopt;
    }
    if (!connection->tableExists("ga_notification_requirements")) {
        LOG_ERROR(aqStore, "No ga_notification_requirements table in %s", qUtf8Printable(dbPath));
        return std::nullopt;
    }

    const bool hasConfidence = connection->columnExists("ga_notification_requirements", "confidence");
    SqliteNotificationStore store(std::move(*connection));
    store.m_hasConfidence = hasConfidence;
    return store;
}

std::vector<NotificationRecord> SqliteNotificationStore::queryByMaxHours(std::optional<int> maxHours) const
{
    // Bound the per-ICAO record groupByIcao() reports, so every tool sees the
    // same record for an airport
    std::vector<NotificationRecord> records;
    const QHash<QString, NotificationRecord> grouped = groupByIcao();
    for (const NotificationRecord& record : grouped) {
        if (!record.hoursNotice.has_value() || *record.hoursNotice <= 0) {
            continue;
        }
        if (maxHours.has_value() && *record.hoursNotice > *maxHours) {
            continue;
        }
        records.push_back(record);
    }

    std::sort(records.begin(), records.end(),
              [](const NotificationRecord& a, const NotificationRecord& b) {
                  if (*a.hoursNotice != *b.hoursNotice) {
                      return *a.hoursNotice < *b.hoursNotice;
                  }
                  return a.icao < b.icao;
              });
    return records;
}

QHash<QString, NotificationRecord> SqliteNotificationStore::groupByIcao() const
{
    QByteArray sql = R"(
        SELECT icao, notification_type, hours_notice, summary,
               operating_hours_start, operating_hours_end
        FROM ga_notification_requirements
        WHERE )";
    sql += confidenceClause(m_hasConfidence);
    sql += " ORDER BY icao ASC, " + confidenceOrder(m_hasConfidence) + "rowid ASC";

    Statement stmt(m_connection, sql.constData());

    QHash<QString, NotificationRecord> grouped;
    while (stmt.next()) {
        NotificationRecord record = readRecord(stmt);
        if (record.icao.isEmpty() || grouped.contains(record.icao)) {
            continue;
        }
        grouped.insert(record.icao, std::move(record));
    }
    LOG_DEBUG(aqStore, "Grouped notification records for %d airports",
              static_cast<int>(grouped.size()));
    return grouped;
}

std::optional<NotificationRecord> SqliteNotificationStore::recordFor(const QString& icao) const
{
    QByteArray sql = R"(
        SELECT icao, notification_type, hours_notice, summary,
               operating_hours_start, operating_hours_end
        FROM ga_notification_requirements
        WHERE icao = ?1 COLLATE NOCASE AND )";
    sql += confidenceClause(m_hasConfidence);
    sql += " ORDER BY " + confidenceOrder(m_hasConfidence) + "rowid ASC LIMIT 1";

    Statement stmt(m_connection, sql.constData());
    stmt.bindText(1, icao.trimmed());
    if (!stmt.next()) {
        return std::nullopt;
    }
    return readRecord(stmt);
}

} // namespace aq
