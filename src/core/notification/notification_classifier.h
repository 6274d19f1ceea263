#pragma once

#include "core/shared/types.h"

#include <QString>

namespace aq {

enum class NotificationBucket {
    H24,
    Easy,
    Moderate,
    Hassle,
    Difficult,
    Unknown,
};

QString notificationBucketToString(NotificationBucket bucket);

class NotificationClassifier {
public:
    // Classify a record by walking the rule table top to bottom:
    //   h24 -> H24, not_available -> Difficult, on_request -> Moderate,
    //   business_day -> Hassle, as_ad_hours -> Easy,
    //   hours without notice -> Easy, no notice -> Unknown,
    //   <=12h Easy, 13-24h Moderate, 25-48h Hassle, >48h Difficult.
    // The first matching rule wins. Total over every record.
    static NotificationBucket classify(const NotificationRecord& record);

    // Legend color (hex). Shared with the map renderers; do not change.
    static QString color(NotificationBucket bucket);

    static QString displayName(NotificationBucket bucket);

    // H24 sorts first, Unknown last.
    static int sortOrder(NotificationBucket bucket);

    // True when the record has a positive notice of at most maxHours and
    // lands in a bucket no worse than a plain maxHours notice would.
    static bool qualifiesForMaxHours(const NotificationRecord& record, int maxHours);
};

} // namespace aq
