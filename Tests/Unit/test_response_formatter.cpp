#include <QtTest/QtTest>
#include "core/tools/response_formatter.h"

#include <QRegularExpression>

using aq::Airport;
using aq::NotificationRecord;
using aq::NotificationType;
using aq::ResponseFormatter;

namespace {

Airport makeAirport(const char* icao, const char* name, const char* city, const char* country,
                    double lat, double lon)
{
    Airport airport;
    airport.icao = QString::fromUtf8(icao);
    airport.name = QString::fromUtf8(name);
    airport.city = QString::fromUtf8(city);
    airport.country = QString::fromUtf8(country);
    airport.coordinate = aq::Coordinate{lat, lon};
    return airport;
}

Airport bigginHill()
{
    Airport airport = makeAirport("EGKB", "London Biggin Hill", "London", "GB", 51.3308, 0.0325);
    airport.elevationFt = 598;
    airport.type = aq::AirportType::Medium;

    aq::Runway runway;
    runway.lengthFt = 5932;
    runway.widthFt = 148;
    runway.surface = QStringLiteral("ASP");
    runway.lighted = true;
    runway.le.ident = QStringLiteral("03");
    runway.he.ident = QStringLiteral("21");
    airport.runways.push_back(runway);

    aq::Procedure procedure;
    procedure.name = QStringLiteral("RNAV 21");
    procedure.type = aq::ProcedureType::Approach;
    procedure.approachType = QStringLiteral("RNAV (GNSS)");
    airport.procedures.push_back(procedure);

    airport.fuels.push_back(aq::FuelAvailability{QStringLiteral("AVGAS"), true});
    airport.fuels.push_back(aq::FuelAvailability{QStringLiteral("JET A1"), true});
    airport.landingFee = aq::LandingFee{25.0, QStringLiteral("GBP")};
    return airport;
}

NotificationRecord makeRecord(const char* icao, NotificationType type, std::optional<int> hours,
                              const char* summary)
{
    NotificationRecord record;
    record.icao = QString::fromUtf8(icao);
    record.type = type;
    record.hoursNotice = hours;
    if (summary) {
        record.summary = QString::fromUtf8(summary);
    }
    return record;
}

} // namespace

class TestResponseFormatter : public QObject {
    Q_OBJECT

private slots:
    void testAirportLineFormat();
    void testAirportLineMatchesCoordinatePattern();
    void testFormatNumber();
    void testSubstitutionNote();
    void testSearchResults();
    void testSearchNoResults();
    void testAirportDetails();
    void testAirportDetailsMinimal();
    void testAirportDetailsAipLines();
    void testRouteResults();
    void testRouteNoResults();
    void testNearLocationResults();
    void testBorderCrossingResults();
    void testRules();
    void testNotificationResults();
};

void TestResponseFormatter::testAirportLineFormat()
{
    const Airport heathrow = makeAirport("EGLL", "London Heathrow", "London", "GB", 51.4706, -0.4619);
    QCOMPARE(ResponseFormatter::airportLine(heathrow),
             QStringLiteral("EGLL (London Heathrow) - 51.4706°, -0.4619°"));

    // Always four decimals
    const Airport round = makeAirport("LFXX", "Round", "", "", 45.0, 2.5);
    QCOMPARE(ResponseFormatter::airportLine(round), QStringLiteral("LFXX (Round) - 45.0000°, 2.5000°"));
}

void TestResponseFormatter::testAirportLineMatchesCoordinatePattern()
{
    static const QRegularExpression pattern(
        QStringLiteral("([A-Z]{4}) \\(([^)]+)\\) - (-?\\d+\\.\\d{4})°, (-?\\d+\\.\\d{4})°"));

    const QString text = ResponseFormatter::searchResults(
        QStringLiteral("Paris"),
        {makeAirport("LFPB", "Paris Le Bourget", "Paris", "FR", 48.9694, 2.4414),
         makeAirport("LFPO", "Paris Orly", "Paris", "FR", 48.7233, 2.3794)});

    QRegularExpressionMatchIterator it = pattern.globalMatch(text);
    QStringList icaos;
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        icaos.append(match.captured(1));
        if (match.captured(1) == QLatin1String("LFPO")) {
            QCOMPARE(match.captured(2), QStringLiteral("Paris Orly"));
            QCOMPARE(match.captured(3).toDouble(), 48.7233);
            QCOMPARE(match.captured(4).toDouble(), 2.3794);
        }
    }
    QCOMPARE(icaos, QStringList({QStringLiteral("LFPB"), QStringLiteral("LFPO")}));
}

void TestResponseFormatter::testFormatNumber()
{
    QCOMPARE(ResponseFormatter::formatNumber(50.0), QStringLiteral("50"));
    QCOMPARE(ResponseFormatter::formatNumber(12.5), QStringLiteral("12.5"));
    QCOMPARE(ResponseFormatter::formatNumber(0.0), QStringLiteral("0"));
}

void TestResponseFormatter::testSubstitutionNote()
{
    const Airport lebourget = makeAirport("LFPB", "Paris Le Bourget", "Paris", "FR", 48.9694, 2.4414);
    QCOMPARE(ResponseFormatter::substitutionNote(QStringLiteral("Paris"), QStringLiteral("Paris"),
                                                 lebourget, 7.63),
             QStringLiteral("Note: 'Paris' resolved to Paris; using nearest airport LFPB "
                            "(Paris Le Bourget), 7.6 nm away."));
}

void TestResponseFormatter::testSearchResults()
{
    const QString text = ResponseFormatter::searchResults(
        QStringLiteral("Heathrow"),
        {makeAirport("EGLL", "London Heathrow", "London", "GB", 51.4706, -0.4619)});
    QCOMPARE(text, QStringLiteral("Found 1 airport(s) matching 'Heathrow':\n"
                                  "- EGLL (London Heathrow) - 51.4706°, -0.4619° (London, GB)\n"));
}

void TestResponseFormatter::testSearchNoResults()
{
    QCOMPARE(ResponseFormatter::searchResults(QStringLiteral("Atlantis"), {}),
             QStringLiteral("No airports found matching 'Atlantis'."));
}

void TestResponseFormatter::testAirportDetails()
{
    aq::AirportDetailExtras extras;
    extras.borderCrossing = true;
    NotificationRecord record = makeRecord("EGKB", NotificationType::BusinessDay, 24,
                                           "Previous working day");
    record.operatingHoursStart = QStringLiteral("0800");
    record.operatingHoursEnd = QStringLiteral("1700");
    extras.notification = record;

    const QString text = ResponseFormatter::airportDetails(bigginHill(), extras);
    QCOMPARE(text, QStringLiteral(
        "EGKB (London Biggin Hill) - 51.3308°, 0.0325°\n"
        "Location: London, GB\n"
        "Elevation: 598 ft\n"
        "Type: medium_airport\n"
        "Runways:\n"
        "  - 03/21: 5932ft x 148ft (ASP, lighted)\n"
        "Procedures: 1 approach, 0 departure, 0 arrival (RNAV (GNSS))\n"
        "Border crossing: Yes\n"
        "Notification: Hassle (25-48h) - 24h notice, Previous working day (hours: 0800-1700)\n"
        "Fuel: AVGAS, JET A1\n"
        "Landing fee: 25.00 GBP\n"));
}

void TestResponseFormatter::testAirportDetailsMinimal()
{
    Airport bare = makeAirport("EGZZ", "Bare Field", "", "", 52.0, -1.0);
    bare.type = aq::AirportType::Small;
    bare.fuels.push_back(aq::FuelAvailability{QStringLiteral("100LL"), false});

    const QString text = ResponseFormatter::airportDetails(bare, aq::AirportDetailExtras{});
    QVERIFY(text.startsWith(QStringLiteral("EGZZ (Bare Field) - 52.0000°, -1.0000°\n")));
    QVERIFY(!text.contains(QStringLiteral("Location:")));
    QVERIFY(!text.contains(QStringLiteral("Runways:")));
    QVERIFY(!text.contains(QStringLiteral("Notification:")));
    QVERIFY(text.contains(QStringLiteral("Border crossing: No\n")));
    QVERIFY(text.contains(QStringLiteral("Fuel: none available\n")));
    QVERIFY(!text.contains(QStringLiteral("Landing fee")));
}

void TestResponseFormatter::testAirportDetailsAipLines()
{
    Airport airport = makeAirport("LFPO", "Paris Orly", "Paris", "FR", 48.7233, 2.3794);
    airport.aipEntries.push_back(aq::AipEntry{QStringLiteral("AD 2.3"),
                                              QStringLiteral("Customs and immigration"),
                                              QStringLiteral("H24"), QStringLiteral("customs")});
    airport.aipEntries.push_back(aq::AipEntry{QStringLiteral("AD 2.3"), QStringLiteral("Blank"),
                                              QStringLiteral("  "), QString()});
    airport.aipEntries.push_back(aq::AipEntry{QStringLiteral("AD 2.2"), QStringLiteral("Remarks"),
                                              QStringLiteral("PPR\n  for   GA"), QString()});
    for (int i = 0; i < 20; ++i) {
        airport.aipEntries.push_back(aq::AipEntry{QStringLiteral("AD 2.20"),
                                                  QStringLiteral("Local rule %1").arg(i),
                                                  QStringLiteral("value"), QString()});
    }

    const QString text = ResponseFormatter::airportDetails(airport, aq::AirportDetailExtras{});
    QVERIFY(text.contains(QStringLiteral("AIP:\n  - customs: H24\n  - Remarks: PPR for GA\n")));
    QVERIFY(!text.contains(QStringLiteral("Blank")));
    QVERIFY(text.endsWith(QStringLiteral("  ...\n")));
    QCOMPARE(text.count(QStringLiteral("  - Local rule")), 13);
}

void TestResponseFormatter::testRouteResults()
{
    aq::RouteAirport orly{makeAirport("LFPO", "Paris Orly", "Paris", "FR", 48.7233, 2.3794), 0.0, 0.0};
    aq::RouteAirport augsburg{makeAirport("EDMA", "Augsburg", "Augsburg", "DE", 48.4253, 10.9317),
                              0.36, 340.04};

    const QString text = ResponseFormatter::routeResults(
        QStringLiteral("LFPO"), QStringLiteral("EDDM"), 20.0,
        {QStringLiteral("Note: example")}, {orly, augsburg});
    QCOMPARE(text, QStringLiteral(
        "Airports along route LFPO → EDDM (within 20 nm):\n"
        "Note: example\n"
        "- LFPO (Paris Orly) - 48.7233°, 2.3794° - 0.0 nm off route, 0.0 nm along\n"
        "- EDMA (Augsburg) - 48.4253°, 10.9317° - 0.4 nm off route, 340.0 nm along\n"));
}

void TestResponseFormatter::testRouteNoResults()
{
    const QString text = ResponseFormatter::routeResults(
        QStringLiteral("LFPO"), QStringLiteral("EDDM"), 12.5, {}, {});
    QCOMPARE(text, QStringLiteral("Airports along route LFPO → EDDM (within 12.5 nm):\n"
                                  "No airports found matching the criteria.\n"));
}

void TestResponseFormatter::testNearLocationResults()
{
    aq::AirportDistance lebourget{makeAirport("LFPB", "Paris Le Bourget", "Paris", "FR", 48.9694, 2.4414),
                                  7.63};
    aq::AirportDistance toussus{makeAirport("LFPN", "Toussus-le-Noble", "Toussus-le-Noble", "FR",
                                            48.7519, 2.1061),
                                11.59};
    QHash<QString, NotificationRecord> notifications;
    notifications.insert(QStringLiteral("LFPN"),
                         makeRecord("LFPN", NotificationType::Hours, 24, "PPR 24h by email"));

    const QString text = ResponseFormatter::nearLocationResults(
        QStringLiteral("Paris"), 20.0, 24, {lebourget, toussus}, notifications);
    QCOMPARE(text, QStringLiteral(
        "Airports near Paris (within 20 nm) with max 24h notice:\n"
        "- LFPB (Paris Le Bourget) - 48.9694°, 2.4414° - 7.6 nm\n"
        "- LFPN (Toussus-le-Noble) - 48.7519°, 2.1061° - 11.6 nm - 24h notice, PPR 24h by email\n"));

    QCOMPARE(ResponseFormatter::nearLocationResults(QStringLiteral("Paris"), 5.0, std::nullopt, {}, {}),
             QStringLiteral("Airports near Paris (within 5 nm):\n"
                            "No airports found matching the criteria.\n"));
}

void TestResponseFormatter::testBorderCrossingResults()
{
    const QString text = ResponseFormatter::borderCrossingResults(
        QStringLiteral("CH"), {makeAirport("LSZH", "Zurich", "Zurich", "CH", 47.4647, 8.5492)});
    QCOMPARE(text, QStringLiteral("Border Crossing Airports in CH:\n"
                                  "- LSZH (Zurich) - 47.4647°, 8.5492° (Zurich, CH)\n"));

    QCOMPARE(ResponseFormatter::borderCrossingResults(std::nullopt, {}),
             QStringLiteral("Border Crossing Airports:\n"
                            "No airports found matching the criteria.\n"));
}

void TestResponseFormatter::testRules()
{
    const QString rules = ResponseFormatter::rulesForCountry(
        QStringLiteral("GB"),
        {aq::RuleAnswer{QStringLiteral("Is night VFR permitted?"), QStringLiteral("General"),
                        QStringLiteral("Yes, with a night rating")}});
    QCOMPARE(rules, QStringLiteral("Aviation Rules for GB:\n"
                                   "- Is night VFR permitted?: Yes, with a night rating\n"));

    const QString comparison = ResponseFormatter::rulesComparison(
        QStringLiteral("FR"), QStringLiteral("GB"),
        {aq::RuleComparison{QStringLiteral("Is night VFR permitted?"), QStringLiteral("General"),
                            QStringLiteral("N/A"), QStringLiteral("Yes, with a night rating")}});
    QCOMPARE(comparison, QStringLiteral("Rule Comparison: FR vs GB\n\n"
                                        "**Is night VFR permitted?**\n"
                                        "- FR: N/A\n"
                                        "- GB: Yes, with a night rating\n\n"));
}

void TestResponseFormatter::testNotificationResults()
{
    NotificationRecord augsburg = makeRecord("EDMA", NotificationType::Hours, 6, "PPR by phone");
    augsburg.operatingHoursStart = QStringLiteral("0700");
    augsburg.operatingHoursEnd = QStringLiteral("1900");

    std::vector<aq::NotificationListEntry> entries;
    entries.push_back(aq::NotificationListEntry{
        augsburg, makeAirport("EDMA", "Augsburg", "Augsburg", "DE", 48.4253, 10.9317)});
    entries.push_back(aq::NotificationListEntry{
        makeRecord("ZZZZ", NotificationType::Hours, 10, "Private strip"), std::nullopt});

    const QString text = ResponseFormatter::notificationResults(12, std::nullopt, entries);
    QCOMPARE(text, QStringLiteral(
        "Airports with notification requirements (max 12h notice):\n\n"
        "- EDMA (Augsburg) - 48.4253°, 10.9317° - 6h notice [easy], PPR by phone (hours: 0700-1900)\n"
        "- ZZZZ - 10h notice [easy], Private strip\n"));

    QVERIFY(ResponseFormatter::notificationResults(std::nullopt, QStringLiteral("FR"), {})
                .startsWith(QStringLiteral("Airports with notification requirements in FR:\n\n")));
}

QTEST_MAIN(TestResponseFormatter)
#include "test_response_formatter.moc"
