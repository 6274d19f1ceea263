#pragma once

#include <QString>
#include <QStringList>
#include <cstdint>
#include <optional>
#include <vector>

namespace aq {

// WGS84 position in decimal degrees.
struct Coordinate {
    double latitude = 0.0;
    double longitude = 0.0;
};

enum class AirportType {
    Large,
    Medium,
    Small,
    Heliport,
    SeaplaneBase,
    Balloonport,
    Closed,
    Unknown,
};

QString airportTypeToString(AirportType type);
AirportType airportTypeFromString(const QString& str);

enum class ProcedureType {
    Approach,
    Departure,
    Arrival,
    Unknown,
};

QString procedureTypeToString(ProcedureType type);
ProcedureType procedureTypeFromString(const QString& str);

enum class PrecisionCategory {
    Precision,
    NonPrecision,
    Unknown,
};

PrecisionCategory precisionCategoryFromString(const QString& str);

struct RunwayEnd {
    QString ident;
    std::optional<Coordinate> coordinate;
    std::optional<double> headingTrue;
};

struct Runway {
    int lengthFt = 0;
    int widthFt = 0;
    QString surface;
    bool lighted = false;
    bool closed = false;
    RunwayEnd le;
    RunwayEnd he;

    // Asphalt, concrete, bitumen and other paved surface codes.
    bool isHardSurface() const;
};

struct Procedure {
    QString name;
    ProcedureType type = ProcedureType::Unknown;
    QString approachType;
    PrecisionCategory precision = PrecisionCategory::Unknown;
};

// Aeronautical Information Publication field/value pair.
struct AipEntry {
    QString section;
    QString field;
    QString value;
    QString standardField;
};

struct FuelAvailability {
    QString fuelType;
    bool available = false;
};

// Landing fee for the 1000 kg MTOW reference aircraft.
struct LandingFee {
    double amount = 0.0;
    QString currency;
};

struct Airport {
    QString icao;
    QString name;
    QString city;
    QString country;  // ISO-2
    Coordinate coordinate;
    int elevationFt = 0;
    AirportType type = AirportType::Unknown;

    std::vector<Runway> runways;
    std::vector<Procedure> procedures;
    std::vector<AipEntry> aipEntries;

    // Enrichment, empty when the dataset carries none for this airport
    std::vector<FuelAvailability> fuels;
    std::optional<LandingFee> landingFee;

    // Longest runway that is not closed; nullopt when no runway data exists.
    std::optional<int> longestRunwayFt() const;
    bool hasHardRunway() const;
    bool hasLightedRunway() const;
    bool hasProcedures() const { return !procedures.empty(); }
    bool hasAipData() const { return !aipEntries.empty(); }
    bool hasIls() const;
    bool hasRnav() const;
    bool hasPrecisionApproach() const;
    bool hasAvgas() const;
    bool hasJetA() const;

    // First non-empty value whose field or standardized field matches, case-insensitive.
    std::optional<QString> aipValue(const QString& field) const;
};

// Notification requirement kinds as stored in ga_notifications.db
enum class NotificationType {
    H24,
    Hours,
    OnRequest,
    BusinessDay,
    AsAdHours,
    NotAvailable,
    Unknown,
};

QString notificationTypeToString(NotificationType type);
NotificationType notificationTypeFromString(const QString& str);

struct NotificationRecord {
    QString icao;
    NotificationType type = NotificationType::Unknown;
    std::optional<int> hoursNotice;
    std::optional<QString> summary;
    std::optional<QString> operatingHoursStart;
    std::optional<QString> operatingHoursEnd;

    bool isH24() const { return type == NotificationType::H24; }
    bool isOnRequest() const { return type == NotificationType::OnRequest; }

    // "start-end" when both ends of the window are known.
    std::optional<QString> operatingHours() const;
};

// Gazetteer row (GeoNames-derived city table).
struct GeocodeEntry {
    QString name;
    Coordinate coordinate;
    QString countryCode;
    int64_t population = 0;
    QStringList alternateNames;
};

} // namespace aq
