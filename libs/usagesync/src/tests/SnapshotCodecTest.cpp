#include <QtTest/QtTest>
#include <QJsonDocument>
#include <QJsonObject>

#include "usagesync/snapshotcodec.h"

class SnapshotCodecTest : public QObject
{
    Q_OBJECT

private:
    static UsageSnapshot sampleSnapshot() {
        UsageSnapshot snapshot;
        snapshot.sessionPercentage = 45.5;
        snapshot.sessionResetAt = QDateTime(QDate(2026, 3, 4), QTime(15, 59, 0, 250), Qt::UTC);
        snapshot.weeklyPercentage = 32.0;
        snapshot.weeklyResetAt = QDateTime(QDate(2026, 3, 9), QTime(12, 59), Qt::UTC);
        snapshot.setModelPercentage(UsageSnapshot::OpusModel, 12.0);
        snapshot.setModelPercentage(UsageSnapshot::SonnetModel, 7.25);
        snapshot.capturedAt = QDateTime(QDate(2026, 3, 4), QTime(11, 0, 1, 123), Qt::UTC);
        snapshot.sessionTokensUsed = 120000;
        snapshot.sessionLimit = 500000;
        snapshot.timeZoneId = "Europe/Berlin";
        return snapshot;
    }

private slots:
    void testRoundTripWithoutExtraUsage() {
        UsageSnapshot original = sampleSnapshot();

        UsageSnapshot decoded;
        QCOMPARE(SnapshotCodec::decodeSnapshot(SnapshotCodec::encodeSnapshot(original), decoded), DecodeError::None);
        QVERIFY(!decoded.extraUsage.isValid());
        QVERIFY(decoded == original);
    }

    void testRoundTripWithExtraUsage() {
        UsageSnapshot original = sampleSnapshot();
        original.extraUsage.amountUsed = 225;
        original.extraUsage.amountLimit = 1000;
        original.extraUsage.currencyCode = "USD";

        UsageSnapshot decoded;
        QCOMPARE(SnapshotCodec::decodeSnapshot(SnapshotCodec::encodeSnapshot(original), decoded), DecodeError::None);
        QVERIFY(decoded.extraUsage.isValid());
        QCOMPARE(decoded.extraUsage.amountUsed, 225.0);
        QCOMPARE(decoded.extraUsage.currencyCode, QString("USD"));
        QVERIFY(decoded == original);
    }

    void testEncodedDatesAreUtcIsoWithMilliseconds() {
        QJsonObject object = SnapshotCodec::snapshotToJson(sampleSnapshot());
        QCOMPARE(object.value("capturedAt").toString(), QString("2026-03-04T11:00:01.123Z"));
        QCOMPARE(object.value("schemaVersion").toInt(), SnapshotCodec::SchemaVersion);
        QVERIFY(!object.contains("extraUsage"));
    }

    void testMinimalPayloadDecodes() {
        UsageSnapshot decoded;
        QByteArray payload = R"({"sessionPercentage": 10, "weeklyPercentage": 20})";

        QCOMPARE(SnapshotCodec::decodeSnapshot(payload, decoded), DecodeError::None);
        QCOMPARE(decoded.sessionPercentage, 10.0);
        QCOMPARE(decoded.weeklyPercentage, 20.0);
        QVERIFY(!decoded.extraUsage.isValid());
        QCOMPARE(decoded.modelPercentage(UsageSnapshot::OpusModel), 0.0);
        QVERIFY(decoded.perModelPercentage.contains(UsageSnapshot::SonnetModel));
    }

    void testUnknownFieldsIgnored() {
        UsageSnapshot decoded;
        QByteArray payload = R"({"sessionPercentage": 1, "weeklyPercentage": 2, "futureField": {"x": 1}, "schemaVersion": 9})";
        QCOMPARE(SnapshotCodec::decodeSnapshot(payload, decoded), DecodeError::None);
        QCOMPARE(decoded.weeklyPercentage, 2.0);
    }

    void testPartialExtraUsageDecodesAsAbsent() {
        UsageSnapshot decoded;
        QByteArray payload = R"({"sessionPercentage": 1, "weeklyPercentage": 2, "extraUsage": {"amountUsed": 5}})";
        QCOMPARE(SnapshotCodec::decodeSnapshot(payload, decoded), DecodeError::None);
        QVERIFY(!decoded.extraUsage.isValid());
    }

    void testMalformedPayloads_data() {
        QTest::addColumn<QByteArray>("payload");

        QByteArray encoded = SnapshotCodec::encodeSnapshot(sampleSnapshot());

        QTest::newRow("empty") << QByteArray();
        QTest::newRow("not json") << QByteArray("garbage");
        QTest::newRow("array") << QByteArray("[1, 2]");
        QTest::newRow("torn write") << encoded.left(encoded.size() / 2);
        QTest::newRow("missing weekly") << QByteArray(R"({"sessionPercentage": 1})");
        QTest::newRow("string percentage") << QByteArray(R"({"sessionPercentage": "1", "weeklyPercentage": 2})");
        QTest::newRow("bad date") << QByteArray(R"({"sessionPercentage": 1, "weeklyPercentage": 2, "capturedAt": "yesterday"})");
        QTest::newRow("bad model map") << QByteArray(R"({"sessionPercentage": 1, "weeklyPercentage": 2, "perModelPercentage": 3})");
        QTest::newRow("token count out of range") << QByteArray(R"({"sessionPercentage": 1, "weeklyPercentage": 2, "sessionLimit": 1e300})");
        QTest::newRow("date out of range") << QByteArray(R"({"sessionPercentage": 1, "weeklyPercentage": 2, "capturedAt": 1e300})");
    }

    void testMalformedPayloads() {
        QFETCH(QByteArray, payload);

        UsageSnapshot decoded;
        decoded.sessionPercentage = 99;
        QCOMPARE(SnapshotCodec::decodeSnapshot(payload, decoded), DecodeError::Malformed);
        QCOMPARE(decoded.sessionPercentage, 99.0);
    }

    void testCompatPayload() {
        QJsonObject compat;
        compat["sessionPercentage"] = 45.0;
        compat["sessionResetTime"] = 700000000.0;
        compat["weeklyPercentage"] = 32.0;
        compat["weeklyResetTime"] = "2026-03-09T12:59:00Z";
        compat["opusWeeklyPercentage"] = 11.0;
        compat["sonnetWeeklyPercentage"] = 4.0;
        compat["costUsed"] = 225.0;
        compat["costLimit"] = 1000.0;
        compat["costCurrency"] = "EUR";
        compat["lastUpdated"] = 700000000.5;
        compat["userTimezone"] = QJsonObject{ { "identifier", "America/New_York" } };

        UsageSnapshot decoded;
        QByteArray payload = QJsonDocument(compat).toJson();
        QCOMPARE(SnapshotCodec::decodeCompatSnapshot(payload, decoded), DecodeError::None);

        QCOMPARE(decoded.sessionResetAt.toMSecsSinceEpoch(), Q_INT64_C(1678307200000));
        QCOMPARE(decoded.capturedAt.toMSecsSinceEpoch(), Q_INT64_C(1678307200500));
        QCOMPARE(decoded.weeklyResetAt, QDateTime(QDate(2026, 3, 9), QTime(12, 59), Qt::UTC));
        QCOMPARE(decoded.modelPercentage(UsageSnapshot::OpusModel), 11.0);
        QCOMPARE(decoded.modelPercentage(UsageSnapshot::SonnetModel), 4.0);
        QVERIFY(decoded.extraUsage.isValid());
        QCOMPARE(decoded.extraUsage.amountLimit, 1000.0);
        QCOMPARE(decoded.extraUsage.currencyCode, QString("EUR"));
        QCOMPARE(decoded.timeZoneId, QString("America/New_York"));
    }

    void testCompatWithoutCostFields() {
        UsageSnapshot decoded;
        QByteArray payload = R"({"sessionPercentage": 5, "weeklyPercentage": 6, "costUsed": 10})";
        QCOMPARE(SnapshotCodec::decodeCompatSnapshot(payload, decoded), DecodeError::None);
        QVERIFY(!decoded.extraUsage.isValid());
    }

    void testCompatDecoderAcceptsCanonical() {
        UsageSnapshot original = sampleSnapshot();
        UsageSnapshot decoded;
        QCOMPARE(SnapshotCodec::decodeCompatSnapshot(SnapshotCodec::encodeSnapshot(original), decoded), DecodeError::None);
        QVERIFY(decoded == original);
    }

    void testSettingsTolerateBadFields() {
        QByteArray payload = R"({"refreshInterval": "soon", "smallWidgetMetric": "weekly",
                                 "widgetColorMode": "rainbow", "statuslineColorMode": "colored",
                                 "statuslineUse24HourTime": true, "unknown": 1})";

        UsageSettings settings;
        QCOMPARE(SnapshotCodec::decodeSettings(payload, settings), DecodeError::None);
        QCOMPARE(settings.refreshIntervalSecs, 30);
        QCOMPARE(settings.smallWidgetMetric, DisplayMetric::Weekly);
        QCOMPARE(settings.widgetColorMode, ColorMode::MultiColor);
        QCOMPARE(settings.statuslineColorMode, ColorMode::MultiColor);
        QCOMPARE(settings.statuslineUse24HourTime, true);
    }

    void testSettingsRejectOutOfRangeInterval() {
        UsageSettings settings;
        QCOMPARE(SnapshotCodec::decodeSettings(R"({"refreshInterval": 1e12})", settings), DecodeError::None);
        QCOMPARE(settings.refreshIntervalSecs, UsageSettings::DefaultRefreshIntervalSecs);

        QCOMPARE(SnapshotCodec::decodeSettings(R"({"refreshInterval": 90000})", settings), DecodeError::None);
        QCOMPARE(settings.refreshIntervalSecs, UsageSettings::DefaultRefreshIntervalSecs);

        UsageSettings applied;
        QVERIFY(!applied.applyField("refreshInterval", "5000000"));
        QVERIFY(applied.applyField("refreshInterval", "86400"));
        QCOMPARE(applied.refreshIntervalSecs, UsageSettings::MaxRefreshIntervalSecs);
    }

    void testCompatRejectsOutOfRangeDate() {
        UsageSnapshot decoded;
        QByteArray payload = R"({"sessionPercentage": 1, "weeklyPercentage": 2, "lastUpdated": 1e300})";
        QCOMPARE(SnapshotCodec::decodeCompatSnapshot(payload, decoded), DecodeError::Malformed);
    }

    void testSettingsRoundTrip() {
        UsageSettings settings;
        settings.refreshIntervalSecs = 120;
        settings.mediumRightMetric = DisplayMetric::Extra;
        settings.widgetColorMode = ColorMode::SingleColor;
        settings.widgetSingleColorHex = "#112233";
        settings.extraUsageFormat = ExtraUsageFormat::Both;
        settings.statuslineShowBranch = false;
        settings.statuslineColorMode = ColorMode::Monochrome;

        UsageSettings decoded;
        QCOMPARE(SnapshotCodec::decodeSettings(SnapshotCodec::encodeSettings(settings), decoded), DecodeError::None);
        QVERIFY(decoded == settings);

        QCOMPARE(SnapshotCodec::decodeSettings("{broken", decoded), DecodeError::Malformed);
    }

    void testProfilesRoundTrip() {
        Profile work("Work");
        work.credentials.sessionKey = "sk-work";
        work.credentials.organizationId = "org-1";
        work.refreshIntervalSecs = 60;
        work.cachedUsage = sampleSnapshot();

        Profile personal("Personal");
        personal.autoRotateEnabled = true;
        personal.isSelectedForDisplay = false;

        QList<Profile> decoded;
        QByteArray encoded = SnapshotCodec::encodeProfiles({ work, personal });
        QCOMPARE(SnapshotCodec::decodeProfiles(encoded, decoded), DecodeError::None);
        QCOMPARE(decoded.size(), 2);
        QVERIFY(decoded.at(0) == work);
        QVERIFY(decoded.at(1) == personal);
        QVERIFY(decoded.at(0).credentials.hasClaudeAi());
        QVERIFY(!decoded.at(1).hasUsageCredentials());
    }

    void testProfilesWithInvalidEntryAreMalformed() {
        QList<Profile> decoded;
        QByteArray payload = R"([{"id": "not-a-uuid", "name": "x"}])";
        QCOMPARE(SnapshotCodec::decodeProfiles(payload, decoded), DecodeError::Malformed);
        QCOMPARE(SnapshotCodec::decodeProfiles("{}", decoded), DecodeError::Malformed);
        QCOMPARE(SnapshotCodec::decodeProfiles("[]", decoded), DecodeError::None);
        QVERIFY(decoded.isEmpty());
    }

    void testApiUsageRoundTrip() {
        ApiUsage usage;
        usage.currentSpendCents = 1250;
        usage.prepaidCreditsCents = 3750;
        usage.currency = "USD";
        usage.resetsAt = QDateTime(QDate(2026, 4, 1), QTime(0, 0), Qt::UTC);

        ApiUsage decoded;
        QCOMPARE(SnapshotCodec::decodeApiUsage(SnapshotCodec::encodeApiUsage(usage), decoded), DecodeError::None);
        QCOMPARE(decoded.currentSpendCents, Q_INT64_C(1250));
        QCOMPARE(decoded.prepaidCreditsCents, Q_INT64_C(3750));
        QCOMPARE(decoded.resetsAt, usage.resetsAt);
    }
};

QTEST_MAIN(SnapshotCodecTest)
#include "SnapshotCodecTest.moc"
