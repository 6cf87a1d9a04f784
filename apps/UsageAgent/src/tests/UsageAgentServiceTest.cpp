#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "service/UsageAgentService.h"
#include "core/CommandUsageFetcher.h"

// Hands out queued snapshots and records the credentials it was given
class MockUsageFetcher : public UsageFetcher
{
public:
    bool fetchUsageData(UsageSnapshot& snapshot, QString& error) override {
        ++m_calls;
        m_lastSessionKey = m_credentials.sessionKey;
        if (m_queue.isEmpty()) {
            error = "remote unavailable";
            return false;
        }
        snapshot = m_queue.takeFirst();
        return true;
    }

    void enqueue(const UsageSnapshot& snapshot) { m_queue.append(snapshot); }
    int calls() const { return m_calls; }
    QString lastSessionKey() const { return m_lastSessionKey; }

private:
    QList<UsageSnapshot> m_queue;
    int m_calls = 0;
    QString m_lastSessionKey;
};

class UsageAgentServiceTest : public QObject
{
    Q_OBJECT

private:
    static UsageSnapshot snapshotAt(double session, const QDateTime& capturedAt) {
        UsageSnapshot snapshot;
        snapshot.sessionPercentage = session;
        snapshot.weeklyPercentage = session / 2;
        snapshot.capturedAt = capturedAt;
        return snapshot;
    }

private slots:
    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());

        StoreConfig config;
        config.setSharedDirectory(m_tempDir->path() + "/shared");
        config.setKeyValuePath(m_tempDir->path() + "/usage.ini");
        m_store.reset(new SnapshotStore(config));
        m_profiles.reset(new ProfileStore(*m_store));
        m_fetcher.reset(new MockUsageFetcher());
        m_service.reset(new UsageAgentService(*m_store, *m_profiles, m_fetcher.data()));
        QVERIFY(m_service->initialize());
    }

    void cleanup() {
        m_service.reset();
        m_fetcher.reset();
        m_profiles.reset();
        m_store.reset();
        m_tempDir.reset();
    }

    void testInitializeRequiresFetcher() {
        UsageAgentService service(*m_store, *m_profiles, nullptr);
        QVERIFY(!service.initialize());
        QVERIFY(!service.start());
    }

    void testPollPublishesToLegacyScope() {
        QSignalSpy publishedSpy(m_service.data(), &UsageAgentService::snapshotPublished);
        m_fetcher->enqueue(snapshotAt(42, QDateTime::currentDateTimeUtc()));

        QVERIFY(m_service->pollNow());
        QCOMPARE(publishedSpy.count(), 1);
        QVERIFY(publishedSpy.at(0).at(0).value<QUuid>().isNull());

        UsageSnapshot loaded;
        QVERIFY(m_store->loadSnapshot(QUuid(), loaded));
        QCOMPARE(loaded.sessionPercentage, 42.0);
    }

    void testPollUsesActiveProfile() {
        Profile work("Work");
        work.credentials.sessionKey = "sk-work";
        work.credentials.organizationId = "org";
        work.refreshIntervalSecs = 120;
        QCOMPARE(m_profiles->add(work), StorageError::None);
        QCOMPARE(m_profiles->setActive(work.id), StorageError::None);

        UsageSnapshot fetched = snapshotAt(64, QDateTime::currentDateTimeUtc());
        m_fetcher->enqueue(fetched);
        QVERIFY(m_service->pollNow());
        QCOMPARE(m_fetcher->lastSessionKey(), QString("sk-work"));

        UsageSnapshot loaded;
        QVERIFY(m_store->loadSnapshot(work.id, loaded));
        QCOMPARE(loaded.sessionPercentage, 64.0);
        QVERIFY(!m_store->loadSnapshot(QUuid(), loaded));

        Profile reloaded;
        QCOMPARE(m_profiles->get(work.id, reloaded), StorageError::None);
        QVERIFY(reloaded.cachedUsage == fetched);

        QCOMPARE(m_service->pollIntervalMs(), 120000);
    }

    void testFetchFailureKeepsLastSnapshot() {
        QSignalSpy failedSpy(m_service.data(), &UsageAgentService::fetchFailed);
        m_fetcher->enqueue(snapshotAt(10, QDateTime::currentDateTimeUtc()));
        QVERIFY(m_service->pollNow());

        QVERIFY(!m_service->pollNow());
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy.at(0).at(0).toString(), QString("remote unavailable"));

        UsageSnapshot loaded;
        QVERIFY(m_store->loadSnapshot(QUuid(), loaded));
        QCOMPARE(loaded.sessionPercentage, 10.0);
    }

    void testStaleFetchIsNotPublished() {
        const QDateTime t1 = QDateTime::currentDateTimeUtc();
        m_fetcher->enqueue(snapshotAt(30, t1));
        m_fetcher->enqueue(snapshotAt(35, t1.addSecs(-30)));

        QSignalSpy publishedSpy(m_service.data(), &UsageAgentService::snapshotPublished);
        QVERIFY(m_service->pollNow());
        QVERIFY(!m_service->pollNow());
        QCOMPARE(publishedSpy.count(), 1);
    }

    void testPollIntervalSources() {
        QCOMPARE(m_service->pollIntervalMs(), 30000);

        UsageSettings settings;
        settings.refreshIntervalSecs = 45;
        QVERIFY(m_store->saveSettings(QUuid(), settings));
        QCOMPARE(m_service->pollIntervalMs(), 45000);

        m_service->setPollIntervalOverride(10);
        QCOMPARE(m_service->pollIntervalMs(), 10000);
    }

    void testPollIntervalIsBounded() {
        const int dayMs = UsageSettings::MaxRefreshIntervalSecs * 1000;

        // Out-of-range settings fall back to the default interval
        UsageSettings settings;
        settings.refreshIntervalSecs = 5000000;
        QVERIFY(m_store->saveSettings(QUuid(), settings));
        QCOMPARE(m_service->pollIntervalMs(), 30000);

        Profile work("Work");
        work.refreshIntervalSecs = 5000000;
        QCOMPARE(m_profiles->add(work), StorageError::None);
        QCOMPARE(m_profiles->setActive(work.id), StorageError::None);
        QCOMPARE(m_service->pollIntervalMs(), dayMs);

        m_service->setPollIntervalOverride(3000000);
        QCOMPARE(m_service->pollIntervalMs(), dayMs);
    }

    void testStartStop() {
        QVERIFY(m_service->start());
        QVERIFY(m_service->isRunning());
        QVERIFY(m_service->stop());
        QVERIFY(!m_service->isRunning());
    }

    void testCommandFetcherWithoutCommand() {
        CommandUsageFetcher fetcher(QString(), QStringList(), 1000);
        UsageSnapshot snapshot;
        QString error;
        QVERIFY(!fetcher.fetchUsageData(snapshot, error));
        QVERIFY(!error.isEmpty());
    }

#ifdef Q_OS_UNIX
    void testCommandFetcherDecodesStdout() {
        const QString payload = R"({"sessionPercentage": 12, "weeklyPercentage": 34, "lastUpdated": "2026-03-04T10:00:00Z"})";
        CommandUsageFetcher fetcher("/bin/sh", { "-c", "printf '%s' '" + payload + "'" }, 5000);

        UsageSnapshot snapshot;
        QString error;
        QVERIFY2(fetcher.fetchUsageData(snapshot, error), qPrintable(error));
        QCOMPARE(snapshot.sessionPercentage, 12.0);
        QCOMPARE(snapshot.capturedAt, QDateTime(QDate(2026, 3, 4), QTime(10, 0), Qt::UTC));
    }

    void testCommandFetcherReportsExitCode() {
        CommandUsageFetcher fetcher("/bin/sh", { "-c", "echo denied >&2; exit 3" }, 5000);

        UsageSnapshot snapshot;
        QString error;
        QVERIFY(!fetcher.fetchUsageData(snapshot, error));
        QVERIFY(error.contains("3"));
        QVERIFY(error.contains("denied"));
    }
#endif

private:
    QScopedPointer<QTemporaryDir> m_tempDir;
    QScopedPointer<SnapshotStore> m_store;
    QScopedPointer<ProfileStore> m_profiles;
    QScopedPointer<MockUsageFetcher> m_fetcher;
    QScopedPointer<UsageAgentService> m_service;
};

QTEST_MAIN(UsageAgentServiceTest)
#include "UsageAgentServiceTest.moc"
