#include "core/tools/response_formatter.h"
#include "core/notification/notification_classifier.h"

#include <cmath>

namespace aq {

namespace {

constexpr int kMaxAipLines = 15;

QString placeSuffix(const Airport& airport)
{
    if (!airport.city.isEmpty() && !airport.country.isEmpty()) {
        return QStringLiteral(" (%1, %2)").arg(airport.city, airport.country);
    }
    if (!airport.city.isEmpty()) {
        return QStringLiteral(" (%1)").arg(airport.city);
    }
    if (!airport.country.isEmpty()) {
        return QStringLiteral(" (%1)").arg(airport.country);
    }
    return {};
}

QString runwayLine(const Runway& runway)
{
    QString ident = runway.le.ident;
    if (!runway.he.ident.isEmpty()) {
        ident += QLatin1Char('/') + runway.he.ident;
    }
    if (ident.isEmpty()) {
        ident = QStringLiteral("?");
    }

    QString line = QStringLiteral("  - %1: %2ft x %3ft").arg(ident).arg(runway.lengthFt).arg(runway.widthFt);

    QStringList traits;
    if (!runway.surface.isEmpty()) traits.append(runway.surface);
    if (runway.lighted) traits.append(QStringLiteral("lighted"));
    if (runway.closed) traits.append(QStringLiteral("closed"));
    if (!traits.isEmpty()) {
        line += QStringLiteral(" (%1)").arg(traits.join(QStringLiteral(", ")));
    }
    return line;
}

QString procedureSummary(const std::vector<Procedure>& procedures)
{
    QStringList approachTypes;
    int approaches = 0;
    int departures = 0;
    int arrivals = 0;
    for (const Procedure& procedure : procedures) {
        switch (procedure.type) {
        case ProcedureType::Approach:
        case ProcedureType::Unknown:
            ++approaches;
            if (!procedure.approachType.isEmpty()
                && !approachTypes.contains(procedure.approachType.toUpper())) {
                approachTypes.append(procedure.approachType.toUpper());
            }
            break;
        case ProcedureType::Departure:
            ++departures;
            break;
        case ProcedureType::Arrival:
            ++arrivals;
            break;
        }
    }

    QString summary = QStringLiteral("%1 approach, %2 departure, %3 arrival")
                          .arg(approaches).arg(departures).arg(arrivals);
    if (!approachTypes.isEmpty()) {
        summary += QStringLiteral(" (%1)").arg(approachTypes.join(QStringLiteral(", ")));
    }
    return summary;
}

// " - <h>h notice [<bucket>], <summary> (hours: <start>-<end>)", each part as data permits.
QString notificationSuffix(const NotificationRecord& record, bool withBucket)
{
    QString suffix;
    if (record.hoursNotice.has_value()) {
        suffix += QStringLiteral(" - %1h notice").arg(*record.hoursNotice);
    }
    if (withBucket) {
        suffix += QStringLiteral(" [%1]").arg(
            notificationBucketToString(NotificationClassifier::classify(record)));
    }
    if (record.summary.has_value() && !record.summary->trimmed().isEmpty()) {
        suffix += QStringLiteral(", ") + record.summary->trimmed();
    }
    if (const std::optional<QString> hours = record.operatingHours()) {
        suffix += QStringLiteral(" (hours: %1)").arg(*hours);
    }
    return suffix;
}

} // namespace

QString ResponseFormatter::formatNumber(double value)
{
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e9) {
        return QString::number(static_cast<long long>(value));
    }
    return QString::number(value, 'f', 1);
}

QString ResponseFormatter::airportLine(const Airport& airport)
{
    return QStringLiteral("%1 (%2) - ").arg(airport.icao, airport.name)
         + QString::asprintf("%.4f°, %.4f°", airport.coordinate.latitude, airport.coordinate.longitude);
}

QString ResponseFormatter::substitutionNote(const QString& query, const QString& resolvedName,
                                            const Airport& anchor, double distanceNm)
{
    return QStringLiteral("Note: '%1' resolved to %2; using nearest airport %3 (%4), %5 nm away.")
        .arg(query, resolvedName, anchor.icao, anchor.name,
             QString::number(distanceNm, 'f', 1));
}

QString ResponseFormatter::searchResults(const QString& query, const std::vector<Airport>& airports)
{
    if (airports.empty()) {
        return QStringLiteral("No airports found matching '%1'.").arg(query);
    }

    QString output = QStringLiteral("Found %1 airport(s) matching '%2':\n")
                         .arg(static_cast<int>(airports.size()))
                         .arg(query);
    for (const Airport& airport : airports) {
        output += QStringLiteral("- ") + airportLine(airport) + placeSuffix(airport) + QLatin1Char('\n');
    }
    return output;
}

QString ResponseFormatter::airportDetails(const Airport& airport, const AirportDetailExtras& extras)
{
    QString output = airportLine(airport) + QLatin1Char('\n');

    if (!airport.city.isEmpty() || !airport.country.isEmpty()) {
        QStringList place;
        if (!airport.city.isEmpty()) place.append(airport.city);
        if (!airport.country.isEmpty()) place.append(airport.country);
        output += QStringLiteral("Location: %1\n").arg(place.join(QStringLiteral(", ")));
    }
    output += QStringLiteral("Elevation: %1 ft\n").arg(airport.elevationFt);
    output += QStringLiteral("Type: %1\n").arg(airportTypeToString(airport.type));

    if (!airport.runways.empty()) {
        output += QStringLiteral("Runways:\n");
        for (const Runway& runway : airport.runways) {
            output += runwayLine(runway) + QLatin1Char('\n');
        }
    }

    if (!airport.procedures.empty()) {
        output += QStringLiteral("Procedures: %1\n").arg(procedureSummary(airport.procedures));
    }

    output += QStringLiteral("Border crossing: %1\n")
                  .arg(extras.borderCrossing ? QStringLiteral("Yes") : QStringLiteral("No"));

    if (extras.notification.has_value()) {
        const NotificationRecord& record = *extras.notification;
        const NotificationBucket bucket = NotificationClassifier::classify(record);
        QString line = QStringLiteral("Notification: %1").arg(NotificationClassifier::displayName(bucket));
        line += notificationSuffix(record, false);
        output += line + QLatin1Char('\n');
    }

    if (!airport.fuels.empty()) {
        QStringList available;
        for (const FuelAvailability& fuel : airport.fuels) {
            if (fuel.available) {
                available.append(fuel.fuelType);
            }
        }
        output += QStringLiteral("Fuel: %1\n")
                      .arg(available.isEmpty() ? QStringLiteral("none available")
                                               : available.join(QStringLiteral(", ")));
    }

    if (airport.landingFee.has_value()) {
        output += QStringLiteral("Landing fee: %1 %2\n")
                      .arg(QString::number(airport.landingFee->amount, 'f', 2),
                           airport.landingFee->currency);
    }

    int aipLines = 0;
    for (const AipEntry& entry : airport.aipEntries) {
        if (entry.value.trimmed().isEmpty()) {
            continue;
        }
        if (aipLines == 0) {
            output += QStringLiteral("AIP:\n");
        }
        if (aipLines == kMaxAipLines) {
            output += QStringLiteral("  ...\n");
            break;
        }
        const QString field = entry.standardField.isEmpty() ? entry.field : entry.standardField;
        output += QStringLiteral("  - %1: %2\n").arg(field, entry.value.simplified());
        ++aipLines;
    }

    return output;
}

QString ResponseFormatter::routeResults(const QString& fromLabel, const QString& toLabel,
                                        double corridorWidthNm, const QStringList& notes,
                                        const std::vector<RouteAirport>& airports)
{
    QString output = QStringLiteral("Airports along route %1 → %2 (within %3 nm):\n")
                         .arg(fromLabel, toLabel, formatNumber(corridorWidthNm));
    for (const QString& note : notes) {
        output += note + QLatin1Char('\n');
    }
    if (airports.empty()) {
        output += QStringLiteral("No airports found matching the criteria.\n");
        return output;
    }
    for (const RouteAirport& entry : airports) {
        output += QStringLiteral("- ") + airportLine(entry.airport)
                + QStringLiteral(" - %1 nm off route, %2 nm along\n")
                      .arg(QString::number(entry.segmentDistanceNm, 'f', 1),
                           QString::number(entry.alongTrackDistanceNm, 'f', 1));
    }
    return output;
}

QString ResponseFormatter::nearLocationResults(const QString& query, double radiusNm,
                                               std::optional<int> maxHoursNotice,
                                               const std::vector<AirportDistance>& airports,
                                               const QHash<QString, NotificationRecord>& notifications)
{
    QString output = QStringLiteral("Airports near %1 (within %2 nm)").arg(query, formatNumber(radiusNm));
    if (maxHoursNotice.has_value()) {
        output += QStringLiteral(" with max %1h notice").arg(*maxHoursNotice);
    }
    output += QStringLiteral(":\n");

    if (airports.empty()) {
        output += QStringLiteral("No airports found matching the criteria.\n");
        return output;
    }

    for (const AirportDistance& entry : airports) {
        output += QStringLiteral("- ") + airportLine(entry.airport)
                + QStringLiteral(" - %1 nm").arg(QString::number(entry.distanceNm, 'f', 1));

        const auto it = notifications.constFind(entry.airport.icao);
        if (it != notifications.constEnd() && it->hoursNotice.has_value()) {
            output += QStringLiteral(" - %1h notice").arg(*it->hoursNotice);
            if (it->summary.has_value() && !it->summary->trimmed().isEmpty()) {
                output += QStringLiteral(", ") + it->summary->trimmed();
            }
        }
        output += QLatin1Char('\n');
    }
    return output;
}

QString ResponseFormatter::borderCrossingResults(const std::optional<QString>& country,
                                                 const std::vector<Airport>& airports)
{
    QString output = QStringLiteral("Border Crossing Airports");
    if (country.has_value()) {
        output += QStringLiteral(" in %1").arg(*country);
    }
    output += QStringLiteral(":\n");

    if (airports.empty()) {
        output += QStringLiteral("No airports found matching the criteria.\n");
        return output;
    }
    for (const Airport& airport : airports) {
        output += QStringLiteral("- ") + airportLine(airport) + placeSuffix(airport) + QLatin1Char('\n');
    }
    return output;
}

QString ResponseFormatter::rulesForCountry(const QString& country, const std::vector<RuleAnswer>& answers)
{
    QString output = QStringLiteral("Aviation Rules for %1:\n").arg(country);
    for (const RuleAnswer& answer : answers) {
        output += QStringLiteral("- %1: %2\n").arg(answer.question, answer.answer);
    }
    return output;
}

QString ResponseFormatter::rulesComparison(const QString& countryA, const QString& countryB,
                                           const std::vector<RuleComparison>& rows)
{
    QString output = QStringLiteral("Rule Comparison: %1 vs %2\n\n").arg(countryA, countryB);
    for (const RuleComparison& row : rows) {
        output += QStringLiteral("**%1**\n").arg(row.question);
        output += QStringLiteral("- %1: %2\n").arg(countryA, row.answerA);
        output += QStringLiteral("- %1: %2\n\n").arg(countryB, row.answerB);
    }
    return output;
}

QString ResponseFormatter::notificationResults(std::optional<int> maxHours,
                                               const std::optional<QString>& country,
                                               const std::vector<NotificationListEntry>& entries)
{
    QString output = QStringLiteral("Airports with notification requirements");
    if (maxHours.has_value()) {
        output += QStringLiteral(" (max %1h notice)").arg(*maxHours);
    }
    if (country.has_value()) {
        output += QStringLiteral(" in %1").arg(*country);
    }
    output += QStringLiteral(":\n\n");

    for (const NotificationListEntry& entry : entries) {
        output += QStringLiteral("- ");
        output += entry.airport.has_value() ? airportLine(*entry.airport) : entry.record.icao;
        output += notificationSuffix(entry.record, true);
        output += QLatin1Char('\n');
    }
    return output;
}

} // namespace aq
