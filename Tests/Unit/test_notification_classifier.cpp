#include <QtTest/QtTest>
#include "core/notification/notification_classifier.h"

using aq::NotificationBucket;
using aq::NotificationClassifier;
using aq::NotificationRecord;
using aq::NotificationType;

Q_DECLARE_METATYPE(aq::NotificationType)
Q_DECLARE_METATYPE(aq::NotificationBucket)

namespace {

NotificationRecord makeRecord(NotificationType type, std::optional<int> hours = std::nullopt)
{
    NotificationRecord record;
    record.icao = QStringLiteral("TEST");
    record.type = type;
    record.hoursNotice = hours;
    return record;
}

} // namespace

class TestNotificationClassifier : public QObject {
    Q_OBJECT

private slots:
    void testReferenceFixtures_data();
    void testReferenceFixtures();
    void testFirstMatchingRuleWins();
    void testBucketBoundaries();
    void testColorsAndNames();
    void testSortOrder();
    void testQualifiesForMaxHours();
    void testBucketStrings();
};

void TestNotificationClassifier::testReferenceFixtures_data()
{
    QTest::addColumn<NotificationType>("type");
    QTest::addColumn<int>("hours");  // -1 = absent
    QTest::addColumn<NotificationBucket>("expected");

    QTest::newRow("h24")           << NotificationType::H24          << -1 << NotificationBucket::H24;
    QTest::newRow("not_available") << NotificationType::NotAvailable << -1 << NotificationBucket::Difficult;
    QTest::newRow("on_request")    << NotificationType::OnRequest    << -1 << NotificationBucket::Moderate;
    QTest::newRow("business_day")  << NotificationType::BusinessDay  << -1 << NotificationBucket::Hassle;
    QTest::newRow("as_ad_hours")   << NotificationType::AsAdHours    << -1 << NotificationBucket::Easy;
    QTest::newRow("hours/null")    << NotificationType::Hours        << -1 << NotificationBucket::Easy;
    QTest::newRow("hours/6")       << NotificationType::Hours        <<  6 << NotificationBucket::Easy;
    QTest::newRow("hours/18")      << NotificationType::Hours        << 18 << NotificationBucket::Moderate;
    QTest::newRow("hours/36")      << NotificationType::Hours        << 36 << NotificationBucket::Hassle;
    QTest::newRow("hours/72")      << NotificationType::Hours        << 72 << NotificationBucket::Difficult;
    QTest::newRow("unknown/null")  << NotificationType::Unknown      << -1 << NotificationBucket::Unknown;
}

void TestNotificationClassifier::testReferenceFixtures()
{
    QFETCH(NotificationType, type);
    QFETCH(int, hours);
    QFETCH(NotificationBucket, expected);

    const std::optional<int> notice = hours < 0 ? std::nullopt : std::optional<int>(hours);
    QCOMPARE(NotificationClassifier::classify(makeRecord(type, notice)), expected);
}

void TestNotificationClassifier::testFirstMatchingRuleWins()
{
    // Type rules take precedence over the hours thresholds
    QCOMPARE(NotificationClassifier::classify(makeRecord(NotificationType::H24, 72)),
             NotificationBucket::H24);
    QCOMPARE(NotificationClassifier::classify(makeRecord(NotificationType::BusinessDay, 2)),
             NotificationBucket::Hassle);
    QCOMPARE(NotificationClassifier::classify(makeRecord(NotificationType::OnRequest, 100)),
             NotificationBucket::Moderate);
    QCOMPARE(NotificationClassifier::classify(makeRecord(NotificationType::NotAvailable, 1)),
             NotificationBucket::Difficult);

    // Unknown type with a notice falls through to the thresholds
    QCOMPARE(NotificationClassifier::classify(makeRecord(NotificationType::Unknown, 10)),
             NotificationBucket::Easy);
}

void TestNotificationClassifier::testBucketBoundaries()
{
    const auto bucketFor = [](int hours) {
        return NotificationClassifier::classify(makeRecord(NotificationType::Hours, hours));
    };
    QCOMPARE(bucketFor(0), NotificationBucket::Easy);
    QCOMPARE(bucketFor(12), NotificationBucket::Easy);
    QCOMPARE(bucketFor(13), NotificationBucket::Moderate);
    QCOMPARE(bucketFor(24), NotificationBucket::Moderate);
    QCOMPARE(bucketFor(25), NotificationBucket::Hassle);
    QCOMPARE(bucketFor(48), NotificationBucket::Hassle);
    QCOMPARE(bucketFor(49), NotificationBucket::Difficult);
}

void TestNotificationClassifier::testColorsAndNames()
{
    QCOMPARE(NotificationClassifier::color(NotificationBucket::H24), QStringLiteral("#28a745"));
    QCOMPARE(NotificationClassifier::color(NotificationBucket::Easy), QStringLiteral("#28a745"));
    QCOMPARE(NotificationClassifier::color(NotificationBucket::Moderate), QStringLiteral("#ffc107"));
    QCOMPARE(NotificationClassifier::color(NotificationBucket::Hassle), QStringLiteral("#007bff"));
    QCOMPARE(NotificationClassifier::color(NotificationBucket::Difficult), QStringLiteral("#dc3545"));
    QCOMPARE(NotificationClassifier::color(NotificationBucket::Unknown), QStringLiteral("#95a5a6"));

    QCOMPARE(NotificationClassifier::displayName(NotificationBucket::H24), QStringLiteral("24/7"));
    QCOMPARE(NotificationClassifier::displayName(NotificationBucket::Easy), QStringLiteral("Easy (≤12h)"));
    QCOMPARE(NotificationClassifier::displayName(NotificationBucket::Difficult),
             QStringLiteral("Difficult (>48h)"));
}

void TestNotificationClassifier::testSortOrder()
{
    const NotificationBucket ordered[] = {
        NotificationBucket::H24, NotificationBucket::Easy, NotificationBucket::Moderate,
        NotificationBucket::Hassle, NotificationBucket::Difficult, NotificationBucket::Unknown,
    };
    for (int i = 1; i < 6; ++i) {
        QVERIFY(NotificationClassifier::sortOrder(ordered[i - 1])
                < NotificationClassifier::sortOrder(ordered[i]));
    }
}

void TestNotificationClassifier::testQualifiesForMaxHours()
{
    // 12h ceiling admits only the easy bucket
    QVERIFY(NotificationClassifier::qualifiesForMaxHours(makeRecord(NotificationType::Hours, 6), 12));
    QVERIFY(NotificationClassifier::qualifiesForMaxHours(makeRecord(NotificationType::Hours, 12), 12));
    QVERIFY(!NotificationClassifier::qualifiesForMaxHours(makeRecord(NotificationType::Hours, 13), 12));
    QVERIFY(!NotificationClassifier::qualifiesForMaxHours(makeRecord(NotificationType::OnRequest, 2), 12));
    QVERIFY(!NotificationClassifier::qualifiesForMaxHours(makeRecord(NotificationType::BusinessDay, 4), 12));

    // 24h ceiling admits moderate too, not hassle
    QVERIFY(NotificationClassifier::qualifiesForMaxHours(makeRecord(NotificationType::OnRequest, 2), 24));
    QVERIFY(!NotificationClassifier::qualifiesForMaxHours(makeRecord(NotificationType::BusinessDay, 24), 24));
    QVERIFY(NotificationClassifier::qualifiesForMaxHours(makeRecord(NotificationType::BusinessDay, 24), 48));

    // No positive notice never qualifies
    QVERIFY(!NotificationClassifier::qualifiesForMaxHours(makeRecord(NotificationType::H24), 48));
    QVERIFY(!NotificationClassifier::qualifiesForMaxHours(makeRecord(NotificationType::Hours, 0), 48));

    // An H24 record with a stated notice stays out of every bounded listing
    QVERIFY(!NotificationClassifier::qualifiesForMaxHours(makeRecord(NotificationType::H24, 2), 12));
    QVERIFY(!NotificationClassifier::qualifiesForMaxHours(makeRecord(NotificationType::H24, 2), 48));
}

void TestNotificationClassifier::testBucketStrings()
{
    QCOMPARE(aq::notificationBucketToString(NotificationBucket::H24), QStringLiteral("h24"));
    QCOMPARE(aq::notificationBucketToString(NotificationBucket::Easy), QStringLiteral("easy"));
    QCOMPARE(aq::notificationBucketToString(NotificationBucket::Unknown), QStringLiteral("unknown"));
}

QTEST_MAIN(TestNotificationClassifier)
#include "test_notification_classifier.moc"
