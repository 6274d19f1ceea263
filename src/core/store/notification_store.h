#pragma once

#include "core/shared/types.h"

#include <QHash>
#include <QString>
#include <optional>
#include <vector>

namespace aq {

// Per-airport notification requirements. At most one record is reported
// per ICAO. Methods throw DataSourceError on read failure.
class NotificationStore {
public:
    virtual ~NotificationStore() = default;

    // The preferred records (as groupByIcao) that carry a positive
    // hours_notice, bounded by maxHours when given, ordered by hours_notice
    // then ICAO.
    virtual std::vector<NotificationRecord> queryByMaxHours(std::optional<int> maxHours) const = 0;

    // The preferred record for every ICAO that has one.
    virtual QHash<QString, NotificationRecord> groupByIcao() const = 0;

    virtual std::optional<NotificationRecord> recordFor(const QString& icao) const = 0;
};

} // namespace aq
