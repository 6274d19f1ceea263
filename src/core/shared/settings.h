#pragma once

#include <QString>

namespace aq {

struct Settings {
    // Data files. Empty paths resolve against dataDir.
    QString dataDir;
    QString airportsDbPath;
    QString gazetteerDbPath;
    QString notificationsDbPath;
    QString rulesJsonPath;

    // Result caps
    int searchLimit = 10;
    int maxListedAirports = 20;
    int borderCrossingLimit = 50;
    int notificationLimit = 20;

    // Spatial defaults (nautical miles)
    double defaultRadiusNm = 50.0;
    double anchorSearchRadiusNm = 100.0;

    // When a max-hours-notice filter is active, keep airports that have no
    // notification record at all instead of dropping them.
    bool includeAirportsWithoutNotification = false;
};

} // namespace aq
