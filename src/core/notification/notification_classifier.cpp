#include "core/notification/notification_classifier.h"

#include <array>

namespace aq {

namespace {

struct ClassificationRule {
    bool (*matches)(const NotificationRecord&);
    NotificationBucket bucket;
};

// Evaluated in order; the first match decides.
const std::array<ClassificationRule, 11> kRules = {{
    {[](const NotificationRecord& r) { return r.isH24(); },
     NotificationBucket::H24},
    {[](const NotificationRecord& r) { return r.type == NotificationType::NotAvailable; },
     NotificationBucket::Difficult},
    {[](const NotificationRecord& r) { return r.isOnRequest(); },
     NotificationBucket::Moderate},
    {[](const NotificationRecord& r) { return r.type == NotificationType::BusinessDay; },
     NotificationBucket::Hassle},
    {[](const NotificationRecord& r) { return r.type == NotificationType::AsAdHours; },
     NotificationBucket::Easy},
    {[](const NotificationRecord& r) {
         return r.type == NotificationType::Hours && !r.hoursNotice.has_value();
     },
     NotificationBucket::Easy},
    {[](const NotificationRecord& r) { return !r.hoursNotice.has_value(); },
     NotificationBucket::Unknown},
    {[](const NotificationRecord& r) { return *r.hoursNotice <= 12; },
     NotificationBucket::Easy},
    {[](const NotificationRecord& r) { return *r.hoursNotice <= 24; },
     NotificationBucket::Moderate},
    {[](const NotificationRecord& r) { return *r.hoursNotice <= 48; },
     NotificationBucket::Hassle},
    {[](const NotificationRecord&) { return true; },
     NotificationBucket::Difficult},
}};

} // namespace

QString notificationBucketToString(NotificationBucket bucket)
{
    switch (bucket) {
    case NotificationBucket::H24:       return QStringLiteral("h24");
    case NotificationBucket::Easy:      return QStringLiteral("easy");
    case NotificationBucket::Moderate:  return QStringLiteral("moderate");
    case NotificationBucket::Hassle:    return QStringLiteral("hassle");
    case NotificationBucket::Difficult: return QStringLiteral("difficult");
    case NotificationBucket::Unknown:   return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

NotificationBucket NotificationClassifier::classify(const NotificationRecord& record)
{
    for (const ClassificationRule& rule : kRules) {
        if (rule.matches(record)) {
            return rule.bucket;
        }
    }
    return NotificationBucket::Unknown;
}

QString NotificationClassifier::color(NotificationBucket bucket)
{
    switch (bucket) {
    case NotificationBucket::H24:
    case NotificationBucket::Easy:      return QStringLiteral("#28a745");
    case NotificationBucket::Moderate:  return QStringLiteral("#ffc107");
    case NotificationBucket::Hassle:    return QStringLiteral("#007bff");
    case NotificationBucket::Difficult: return QStringLiteral("#dc3545");
    case NotificationBucket::Unknown:   return QStringLiteral("#95a5a6");
    }
    return QStringLiteral("#95a5a6");
}

QString NotificationClassifier::displayName(NotificationBucket bucket)
{
    switch (bucket) {
    case NotificationBucket::H24:       return QStringLiteral("24/7");
    case NotificationBucket::Easy:      return QStringLiteral("Easy (≤12h)");
    case NotificationBucket::Moderate:  return QStringLiteral("Moderate (13-24h)");
    case NotificationBucket::Hassle:    return QStringLiteral("Hassle (25-48h)");
    case NotificationBucket::Difficult: return QStringLiteral("Difficult (>48h)");
    case NotificationBucket::Unknown:   return QStringLiteral("Unknown");
    }
    return QStringLiteral("Unknown");
}

int NotificationClassifier::sortOrder(NotificationBucket bucket)
{
    switch (bucket) {
    case NotificationBucket::H24:       return 0;
    case NotificationBucket::Easy:      return 1;
    case NotificationBucket::Moderate:  return 2;
    case NotificationBucket::Hassle:    return 3;
    case NotificationBucket::Difficult: return 4;
    case NotificationBucket::Unknown:   return 5;
    }
    return 5;
}

bool NotificationClassifier::qualifiesForMaxHours(const NotificationRecord& record, int maxHours)
{
    if (!record.hoursNotice.has_value() || *record.hoursNotice <= 0
        || *record.hoursNotice > maxHours) {
        return false;
    }

    NotificationRecord ceiling;
    ceiling.type = NotificationType::Hours;
    ceiling.hoursNotice = maxHours;

    // H24 records carry no bound of their own; they list under no ceiling
    const int order = sortOrder(classify(record));
    return order >= sortOrder(NotificationBucket::Easy) && order <= sortOrder(classify(ceiling));
}

} // namespace aq
