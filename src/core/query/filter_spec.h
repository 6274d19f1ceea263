#pragma once

#include <QJsonObject>
#include <QString>
#include <optional>

namespace aq {

// FilterSpec -- independently optional airport predicates. An unset field
// places no constraint; set fields combine with AND.
struct FilterSpec {
    std::optional<QString> country;            // ISO-2
    std::optional<bool> hasProcedures;
    std::optional<bool> hasAipData;
    std::optional<bool> hasHardRunway;
    std::optional<bool> hasLightedRunway;
    std::optional<bool> pointOfEntry;          // border crossing airport
    std::optional<int> minRunwayLengthFt;
    std::optional<int> maxRunwayLengthFt;
    std::optional<bool> hasIls;
    std::optional<bool> hasRnav;
    std::optional<bool> hasPrecisionApproach;
    std::optional<bool> hasAvgas;              // only `true` constrains
    std::optional<bool> hasJetA;               // only `true` constrains
    std::optional<double> maxLandingFee;
    std::optional<QString> aipField;
    std::optional<bool> excludeLargeAirports;  // only `true` constrains
    std::optional<int> maxHoursNotice;

    // Decode the "filters" argument object (snake_case wire keys).
    // Unknown keys and values of the wrong type are ignored.
    static FilterSpec fromJson(const QJsonObject& json);
    QJsonObject toJson() const;

    int activeFilterCount() const;
    bool hasFilters() const { return activeFilterCount() > 0; }

    // Human-readable summary, "No filters" when empty.
    QString describe() const;
};

} // namespace aq
