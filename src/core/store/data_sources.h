#pragma once

#include "core/rules/rules_document.h"
#include "core/shared/settings.h"
#include "core/store/airport_store.h"
#include "core/store/gazetteer_store.h"
#include "core/store/notification_store.h"

#include <memory>

namespace aq {

// DataSources -- the set of read-only stores a dispatcher owns.
// Only the airport store is required; a null member means that source is
// unavailable and the tools depending on it report DataSourceUnavailable.
struct DataSources {
    std::unique_ptr<AirportStore> airports;
    std::unique_ptr<GazetteerStore> gazetteer;
    std::unique_ptr<NotificationStore> notifications;
    std::optional<RulesDocument> rules;

    // Open every configured source. Missing optional sources are logged.
    static DataSources open(const Settings& settings);

    bool hasAirports() const { return airports != nullptr; }
};

} // namespace aq
