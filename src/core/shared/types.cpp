#include "core/shared/types.h"

#include <algorithm>

namespace aq {

namespace {

bool containsAny(const QString& lower, const std::initializer_list<const char*>& needles)
{
    for (const char* needle : needles) {
        if (lower.contains(QLatin1String(needle))) {
            return true;
        }
    }
    return false;
}

bool isApproach(const Procedure& procedure)
{
    return procedure.type == ProcedureType::Approach
        || procedure.type == ProcedureType::Unknown;
}

} // namespace

QString airportTypeToString(AirportType type)
{
    switch (type) {
    case AirportType::Large:        return QStringLiteral("large_airport");
    case AirportType::Medium:       return QStringLiteral("medium_airport");
    case AirportType::Small:        return QStringLiteral("small_airport");
    case AirportType::Heliport:     return QStringLiteral("heliport");
    case AirportType::SeaplaneBase: return QStringLiteral("seaplane_base");
    case AirportType::Balloonport:  return QStringLiteral("balloonport");
    case AirportType::Closed:       return QStringLiteral("closed");
    case AirportType::Unknown:      return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

AirportType airportTypeFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("large_airport"))  return AirportType::Large;
    if (lower == QLatin1String("medium_airport")) return AirportType::Medium;
    if (lower == QLatin1String("small_airport"))  return AirportType::Small;
    if (lower == QLatin1String("heliport"))       return AirportType::Heliport;
    if (lower == QLatin1String("seaplane_base"))  return AirportType::SeaplaneBase;
    if (lower == QLatin1String("balloonport"))    return AirportType::Balloonport;
    if (lower == QLatin1String("closed"))         return AirportType::Closed;
    return AirportType::Unknown;
}

QString procedureTypeToString(ProcedureType type)
{
    switch (type) {
    case ProcedureType::Approach:  return QStringLiteral("approach");
    case ProcedureType::Departure: return QStringLiteral("departure");
    case ProcedureType::Arrival:   return QStringLiteral("arrival");
    case ProcedureType::Unknown:   return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

ProcedureType procedureTypeFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("approach"))  return ProcedureType::Approach;
    if (lower == QLatin1String("departure") || lower == QLatin1String("sid")) {
        return ProcedureType::Departure;
    }
    if (lower == QLatin1String("arrival") || lower == QLatin1String("star")) {
        return ProcedureType::Arrival;
    }
    return ProcedureType::Unknown;
}

PrecisionCategory precisionCategoryFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("precision")) return PrecisionCategory::Precision;
    if (lower == QLatin1String("non-precision") || lower == QLatin1String("non_precision")
        || lower == QLatin1String("rnav")) {
        return PrecisionCategory::NonPrecision;
    }
    return PrecisionCategory::Unknown;
}

bool Runway::isHardSurface() const
{
    const QString lower = surface.trimmed().toLower();
    if (lower.isEmpty()) {
        return false;
    }
    return containsAny(lower, {"asp", "con", "bit", "pem", "tar", "paved", "hard", "macadam"});
}

std::optional<int> Airport::longestRunwayFt() const
{
    std::optional<int> longest;
    for (const Runway& runway : runways) {
        if (runway.closed) {
            continue;
        }
        if (!longest || runway.lengthFt > *longest) {
            longest = runway.lengthFt;
        }
    }
    return longest;
}

bool Airport::hasHardRunway() const
{
    return std::any_of(runways.begin(), runways.end(), [](const Runway& runway) {
        return !runway.closed && runway.isHardSurface();
    });
}

bool Airport::hasLightedRunway() const
{
    return std::any_of(runways.begin(), runways.end(), [](const Runway& runway) {
        return !runway.closed && runway.lighted;
    });
}

bool Airport::hasIls() const
{
    return std::any_of(procedures.begin(), procedures.end(), [](const Procedure& p) {
        return isApproach(p) && p.approachType.toUpper().contains(QLatin1String("ILS"));
    });
}

bool Airport::hasRnav() const
{
    return std::any_of(procedures.begin(), procedures.end(), [](const Procedure& p) {
        if (!isApproach(p)) {
            return false;
        }
        const QString upper = p.approachType.toUpper();
        return upper.contains(QLatin1String("RNAV")) || upper.contains(QLatin1String("RNP"))
            || upper.contains(QLatin1String("GNSS")) || upper.contains(QLatin1String("GPS"));
    });
}

bool Airport::hasPrecisionApproach() const
{
    return std::any_of(procedures.begin(), procedures.end(), [](const Procedure& p) {
        if (!isApproach(p)) {
            return false;
        }
        if (p.precision == PrecisionCategory::Precision) {
            return true;
        }
        // Older datasets leave the category blank; ILS/GLS/PAR are precision by definition
        if (p.precision == PrecisionCategory::Unknown) {
            const QString upper = p.approachType.toUpper();
            return upper.contains(QLatin1String("ILS")) || upper.contains(QLatin1String("GLS"))
                || upper.contains(QLatin1String("PAR"));
        }
        return false;
    });
}

bool Airport::hasAvgas() const
{
    return std::any_of(fuels.begin(), fuels.end(), [](const FuelAvailability& fuel) {
        const QString lower = fuel.fuelType.toLower();
        return fuel.available
            && (lower.contains(QLatin1String("avgas")) || lower.contains(QLatin1String("100ll")));
    });
}

bool Airport::hasJetA() const
{
    return std::any_of(fuels.begin(), fuels.end(), [](const FuelAvailability& fuel) {
        const QString lower = fuel.fuelType.toLower();
        return fuel.available
            && (lower.contains(QLatin1String("jeta1")) || lower.contains(QLatin1String("jet a")));
    });
}

std::optional<QString> Airport::aipValue(const QString& field) const
{
    for (const AipEntry& entry : aipEntries) {
        if (entry.value.trimmed().isEmpty()) {
            continue;
        }
        if (entry.field.compare(field, Qt::CaseInsensitive) == 0
            || entry.standardField.compare(field, Qt::CaseInsensitive) == 0) {
            return entry.value;
        }
    }
    return std::nullopt;
}

QString notificationTypeToString(NotificationType type)
{
    switch (type) {
    case NotificationType::H24:          return QStringLiteral("h24");
    case NotificationType::Hours:        return QStringLiteral("hours");
    case NotificationType::OnRequest:    return QStringLiteral("on_request");
    case NotificationType::BusinessDay:  return QStringLiteral("business_day");
    case NotificationType::AsAdHours:    return QStringLiteral("as_ad_hours");
    case NotificationType::NotAvailable: return QStringLiteral("not_available");
    case NotificationType::Unknown:      return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

NotificationType notificationTypeFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("h24"))           return NotificationType::H24;
    if (lower == QLatin1String("hours"))         return NotificationType::Hours;
    if (lower == QLatin1String("on_request"))    return NotificationType::OnRequest;
    if (lower == QLatin1String("business_day"))  return NotificationType::BusinessDay;
    if (lower == QLatin1String("as_ad_hours"))   return NotificationType::AsAdHours;
    if (lower == QLatin1String("not_available")) return NotificationType::NotAvailable;
    return NotificationType::Unknown;
}

std::optional<QString> NotificationRecord::operatingHours() const
{
    if (!operatingHoursStart || !operatingHoursEnd) {
        return std::nullopt;
    }
    if (operatingHoursStart->isEmpty() && operatingHoursEnd->isEmpty()) {
        return std::nullopt;
    }
    return *operatingHoursStart + QLatin1Char('-') + *operatingHoursEnd;
}

} // namespace aq
