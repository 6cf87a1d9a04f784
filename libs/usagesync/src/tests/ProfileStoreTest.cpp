#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "usagesync/profilestore.h"
#include "usagesync/snapshotcodec.h"

class ProfileStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());

        StoreConfig config;
        config.setSharedDirectory(m_tempDir->path() + "/shared");
        config.setKeyValuePath(m_tempDir->path() + "/usage.ini");
        m_store.reset(new SnapshotStore(config));
        m_profiles.reset(new ProfileStore(*m_store));
    }

    void cleanup() {
        m_profiles.reset();
        m_store.reset();
        m_tempDir.reset();
    }

    void testEmptyStore() {
        QList<Profile> profiles;
        QCOMPARE(m_profiles->load(profiles), ProfileStore::LoadResult::Empty);
        QVERIFY(m_profiles->list().isEmpty());

        Profile active;
        QVERIFY(!m_profiles->getActive(active));
        QCOMPARE(m_profiles->get(QUuid::createUuid(), active), StorageError::NotFound);
    }

    void testAddGetUpdate() {
        QSignalSpy changedSpy(m_profiles.data(), &ProfileStore::profilesChanged);

        Profile work("Work");
        QCOMPARE(m_profiles->add(work), StorageError::None);
        QCOMPARE(m_profiles->add(work), StorageError::WriteFailed);
        QCOMPARE(m_profiles->add(Profile("Personal")), StorageError::None);
        QCOMPARE(changedSpy.count(), 2);

        QList<Profile> profiles;
        QCOMPARE(m_profiles->load(profiles), ProfileStore::LoadResult::Loaded);
        QCOMPARE(profiles.size(), 2);

        Profile loaded;
        QCOMPARE(m_profiles->get(work.id, loaded), StorageError::None);
        QVERIFY(loaded == work);

        loaded.name = "Work (renamed)";
        loaded.refreshIntervalSecs = 120;
        QCOMPARE(m_profiles->update(loaded), StorageError::None);
        QCOMPARE(m_profiles->update(Profile("Ghost")), StorageError::NotFound);

        Profile reloaded;
        QCOMPARE(m_profiles->get(work.id, reloaded), StorageError::None);
        QCOMPARE(reloaded.name, QString("Work (renamed)"));
        QCOMPARE(reloaded.refreshIntervalSecs, 120);
    }

    void testActiveProfile() {
        QSignalSpy activeSpy(m_profiles.data(), &ProfileStore::activeProfileChanged);

        Profile work("Work");
        QCOMPARE(m_profiles->add(work), StorageError::None);

        QCOMPARE(m_profiles->setActive(QUuid::createUuid()), StorageError::NotFound);
        QCOMPARE(activeSpy.count(), 0);

        QCOMPARE(m_profiles->setActive(work.id), StorageError::None);
        QCOMPARE(activeSpy.count(), 1);
        QCOMPARE(activeSpy.at(0).at(0).value<QUuid>(), work.id);

        Profile active;
        QVERIFY(m_profiles->getActive(active));
        QCOMPARE(active.id, work.id);
        QCOMPARE(m_profiles->activeProfileId(), work.id);
    }

    void testDanglingActiveIdIsUnset() {
        QCOMPARE(m_store->keyValueTier()->setValue("activeProfileId",
                                                   QUuid::createUuid().toString(QUuid::WithoutBraces)),
                 StorageError::None);

        Profile active;
        QVERIFY(!m_profiles->getActive(active));
        QVERIFY(m_profiles->activeProfileId().isNull());
    }

    void testRemoveErasesProfileData() {
        Profile work("Work");
        work.credentials.sessionKey = "sk-secret";
        work.credentials.organizationId = "org";
        QCOMPARE(m_profiles->add(work), StorageError::None);
        QCOMPARE(m_profiles->setActive(work.id), StorageError::None);

        UsageSnapshot snapshot;
        snapshot.sessionPercentage = 40;
        snapshot.capturedAt = QDateTime::currentDateTimeUtc();
        QCOMPARE(m_store->saveSnapshot(work.id, snapshot), SaveResult::Saved);

        UsageSettings settings;
        settings.smallWidgetMetric = DisplayMetric::Weekly;
        QVERIFY(m_profiles->saveSettings(work.id, settings));

        QCOMPARE(m_profiles->remove(work.id), StorageError::None);
        QCOMPARE(m_profiles->remove(work.id), StorageError::NotFound);

        Profile removed;
        QCOMPARE(m_profiles->get(work.id, removed), StorageError::NotFound);
        QVERIFY(!m_profiles->getActive(removed));

        ProfileCredentials credentials;
        QVERIFY(!m_profiles->credentials(work.id, credentials));

        UsageSnapshot loaded;
        QVERIFY(!m_store->loadSnapshot(work.id, loaded));
        QVERIFY(*m_profiles->loadSettings(work.id) == UsageSettings());
    }

    void testCorruptCollectionIsNotOverwritten() {
        const QByteArray corrupt("[{\"id\": \"broken\"");
        QCOMPARE(m_store->keyValueTier()->write("profiles_v3", corrupt), StorageError::None);

        QList<Profile> profiles;
        QCOMPARE(m_profiles->load(profiles), ProfileStore::LoadResult::Failed);

        QCOMPARE(m_profiles->add(Profile("New")), StorageError::DecodeError);
        QCOMPARE(m_profiles->save(QList<Profile>()), StorageError::DecodeError);

        QByteArray stored;
        QCOMPARE(m_store->keyValueTier()->read("profiles_v3", stored), StorageError::None);
        QCOMPARE(stored, corrupt);

        Profile fresh("Fresh");
        QCOMPARE(m_profiles->save({ fresh }, ProfileStore::SaveMode::ForceOverwrite), StorageError::None);
        QCOMPARE(m_profiles->load(profiles), ProfileStore::LoadResult::Loaded);
        QCOMPARE(profiles.size(), 1);
        QCOMPARE(profiles.first().name, QString("Fresh"));
    }

    void testCredentialsAndCachedUsage() {
        Profile work("Work");
        QCOMPARE(m_profiles->add(work), StorageError::None);

        ProfileCredentials credentials;
        credentials.apiSessionKey = "api-key";
        credentials.apiOrganizationId = "api-org";
        QCOMPARE(m_profiles->updateCredentials(work.id, credentials), StorageError::None);

        ProfileCredentials loaded;
        QVERIFY(m_profiles->credentials(work.id, loaded));
        QVERIFY(loaded == credentials);
        QVERIFY(loaded.hasApiConsole());
        QVERIFY(!loaded.hasClaudeAi());

        UsageSnapshot snapshot;
        snapshot.sessionPercentage = 88;
        snapshot.weeklyPercentage = 51;
        snapshot.capturedAt = QDateTime(QDate(2026, 3, 4), QTime(8, 30), Qt::UTC);
        QCOMPARE(m_profiles->updateCachedUsage(work.id, snapshot), StorageError::None);
        QCOMPARE(m_profiles->updateCachedUsage(QUuid::createUuid(), snapshot), StorageError::NotFound);

        Profile reloaded;
        QCOMPARE(m_profiles->get(work.id, reloaded), StorageError::None);
        QVERIFY(reloaded.cachedUsage == snapshot);
        QVERIFY(reloaded.hasUsageCredentials());
    }

    void testSettingsRequireExistingProfile() {
        UsageSettings settings;
        settings.extraUsageFormat = ExtraUsageFormat::Currency;
        QVERIFY(!m_profiles->saveSettings(QUuid::createUuid(), settings));

        Profile work("Work");
        QCOMPARE(m_profiles->add(work), StorageError::None);
        QVERIFY(m_profiles->saveSettings(work.id, settings));
        QCOMPARE(m_profiles->loadSettings(work.id)->extraUsageFormat, ExtraUsageFormat::Currency);

        // Per-profile settings do not leak into the legacy scope
        QCOMPARE(m_store->loadSettings(QUuid())->extraUsageFormat, ExtraUsageFormat::Percentage);
    }

    void testDisplayMode() {
        QCOMPARE(m_profiles->displayMode(), ProfileDisplayMode::Single);
        QVERIFY(m_profiles->setDisplayMode(ProfileDisplayMode::Multi));
        QCOMPARE(m_profiles->displayMode(), ProfileDisplayMode::Multi);
    }

private:
    QScopedPointer<QTemporaryDir> m_tempDir;
    QScopedPointer<SnapshotStore> m_store;
    QScopedPointer<ProfileStore> m_profiles;
};

QTEST_MAIN(ProfileStoreTest)
#include "ProfileStoreTest.moc"
