#pragma once

#include "core/query/airport_query_engine.h"
#include "core/rules/rules_lookup.h"
#include "core/shared/types.h"

#include <QHash>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

namespace aq {

struct AirportDetailExtras {
    bool borderCrossing = false;
    std::optional<NotificationRecord> notification;
};

struct NotificationListEntry {
    NotificationRecord record;
    std::optional<Airport> airport;  // absent when the ICAO is not in the airport set
};

// ResponseFormatter -- renders tool results as line-oriented text.
//
// Every airport line contains "<ICAO> (<name>) - <lat>°, <lon>°" with four
// decimals. Map renderers extract coordinates from that pattern, so the
// layout is a compatibility contract.
class ResponseFormatter {
public:
    // "<ICAO> (<name>) - <lat>°, <lon>°"
    static QString airportLine(const Airport& airport);

    // "Note: '<q>' resolved to <name>; using nearest airport <ICAO> (<name>), <d> nm away."
    static QString substitutionNote(const QString& query, const QString& resolvedName,
                                    const Airport& anchor, double distanceNm);

    static QString searchResults(const QString& query, const std::vector<Airport>& airports);

    static QString airportDetails(const Airport& airport, const AirportDetailExtras& extras);

    static QString routeResults(const QString& fromLabel, const QString& toLabel,
                                double corridorWidthNm, const QStringList& notes,
                                const std::vector<RouteAirport>& airports);

    static QString nearLocationResults(const QString& query, double radiusNm,
                                       std::optional<int> maxHoursNotice,
                                       const std::vector<AirportDistance>& airports,
                                       const QHash<QString, NotificationRecord>& notifications);

    static QString borderCrossingResults(const std::optional<QString>& country,
                                         const std::vector<Airport>& airports);

    static QString rulesForCountry(const QString& country, const std::vector<RuleAnswer>& answers);

    static QString rulesComparison(const QString& countryA, const QString& countryB,
                                   const std::vector<RuleComparison>& rows);

    static QString notificationResults(std::optional<int> maxHours,
                                       const std::optional<QString>& country,
                                       const std::vector<NotificationListEntry>& entries);

    // 50 -> "50", 12.5 -> "12.5"
    static QString formatNumber(double value);
};

} // namespace aq
