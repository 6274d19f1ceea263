#include "core/query/filter_spec.h"
#include "core/shared/json_value.h"

#include <QStringList>

namespace aq {

namespace {

void describeFlag(QStringList& parts, const std::optional<bool>& flag,
                  const char* whenTrue, const char* whenFalse)
{
    if (!flag.has_value()) {
        return;
    }
    parts.append(QString::fromUtf8(*flag ? whenTrue : whenFalse));
}

void insertFlag(QJsonObject& json, const char* key, const std::optional<bool>& flag)
{
    if (flag.has_value()) {
        json.insert(QLatin1String(key), *flag);
    }
}

void insertInt(QJsonObject& json, const char* key, const std::optional<int>& value)
{
    if (value.has_value()) {
        json.insert(QLatin1String(key), *value);
    }
}

} // namespace

FilterSpec FilterSpec::fromJson(const QJsonObject& json)
{
    const auto value = [&json](const char* key) { return json.value(QLatin1String(key)); };

    FilterSpec spec;
    if (const std::optional<QString> country = jsonString(value("country"))) {
        spec.country = country->toUpper();
    }
    spec.hasProcedures = jsonBool(value("has_procedures"));
    spec.hasAipData = jsonBool(value("has_aip_data"));
    spec.hasHardRunway = jsonBool(value("has_hard_runway"));
    spec.hasLightedRunway = jsonBool(value("has_lighted_runway"));
    spec.pointOfEntry = jsonBool(value("point_of_entry"));
    spec.minRunwayLengthFt = jsonInt(value("min_runway_length_ft"));
    spec.maxRunwayLengthFt = jsonInt(value("max_runway_length_ft"));
    spec.hasIls = jsonBool(value("has_ils"));
    spec.hasRnav = jsonBool(value("has_rnav"));
    spec.hasPrecisionApproach = jsonBool(value("has_precision_approach"));
    spec.hasAvgas = jsonBool(value("has_avgas"));
    spec.hasJetA = jsonBool(value("has_jet_a"));
    spec.maxLandingFee = jsonDouble(value("max_landing_fee"));
    spec.aipField = jsonString(value("aip_field"));
    spec.excludeLargeAirports = jsonBool(value("exclude_large_airports"));
    spec.maxHoursNotice = jsonInt(value("max_hours_notice"));
    return spec;
}

QJsonObject FilterSpec::toJson() const
{
    QJsonObject json;
    if (country) json.insert(QStringLiteral("country"), *country);
    insertFlag(json, "has_procedures", hasProcedures);
    insertFlag(json, "has_aip_data", hasAipData);
    insertFlag(json, "has_hard_runway", hasHardRunway);
    insertFlag(json, "has_lighted_runway", hasLightedRunway);
    insertFlag(json, "point_of_entry", pointOfEntry);
    insertInt(json, "min_runway_length_ft", minRunwayLengthFt);
    insertInt(json, "max_runway_length_ft", maxRunwayLengthFt);
    insertFlag(json, "has_ils", hasIls);
    insertFlag(json, "has_rnav", hasRnav);
    insertFlag(json, "has_precision_approach", hasPrecisionApproach);
    insertFlag(json, "has_avgas", hasAvgas);
    insertFlag(json, "has_jet_a", hasJetA);
    if (maxLandingFee) json.insert(QStringLiteral("max_landing_fee"), *maxLandingFee);
    if (aipField) json.insert(QStringLiteral("aip_field"), *aipField);
    insertFlag(json, "exclude_large_airports", excludeLargeAirports);
    insertInt(json, "max_hours_notice", maxHoursNotice);
    return json;
}

int FilterSpec::activeFilterCount() const
{
    int count = 0;
    if (country) ++count;
    if (hasProcedures) ++count;
    if (hasAipData) ++count;
    if (hasHardRunway) ++count;
    if (hasLightedRunway) ++count;
    if (pointOfEntry) ++count;
    if (minRunwayLengthFt) ++count;
    if (maxRunwayLengthFt) ++count;
    if (hasIls) ++count;
    if (hasRnav) ++count;
    if (hasPrecisionApproach) ++count;
    if (hasAvgas.value_or(false)) ++count;
    if (hasJetA.value_or(false)) ++count;
    if (maxLandingFee) ++count;
    if (aipField) ++count;
    if (excludeLargeAirports.value_or(false)) ++count;
    if (maxHoursNotice) ++count;
    return count;
}

QString FilterSpec::describe() const
{
    QStringList parts;
    if (country) parts.append(QStringLiteral("Country: %1").arg(*country));
    describeFlag(parts, hasProcedures, "Has procedures", "No procedures");
    describeFlag(parts, hasAipData, "Has AIP data", "No AIP data");
    describeFlag(parts, hasHardRunway, "Hard runway", "No hard runway");
    describeFlag(parts, hasLightedRunway, "Lighted runway", "No lighted runway");
    describeFlag(parts, pointOfEntry, "Border crossing", "Not a border crossing");
    if (minRunwayLengthFt) parts.append(QStringLiteral("Runway ≥ %1ft").arg(*minRunwayLengthFt));
    if (maxRunwayLengthFt) parts.append(QStringLiteral("Runway ≤ %1ft").arg(*maxRunwayLengthFt));
    describeFlag(parts, hasIls, "Has ILS", "No ILS");
    describeFlag(parts, hasRnav, "Has RNAV", "No RNAV");
    describeFlag(parts, hasPrecisionApproach, "Precision approach", "No precision approach");
    if (hasAvgas.value_or(false)) parts.append(QStringLiteral("AVGAS"));
    if (hasJetA.value_or(false)) parts.append(QStringLiteral("Jet A"));
    if (maxLandingFee) {
        parts.append(QStringLiteral("Landing fee ≤ %1").arg(*maxLandingFee, 0, 'f', 2));
    }
    if (aipField) parts.append(QStringLiteral("AIP field: %1").arg(*aipField));
    if (excludeLargeAirports.value_or(false)) parts.append(QStringLiteral("Excluding large airports"));
    if (maxHoursNotice) parts.append(QStringLiteral("Notice ≤ %1h").arg(*maxHoursNotice));

    return parts.isEmpty() ? QStringLiteral("No filters") : parts.join(QStringLiteral(", "));
}

} // namespace aq
