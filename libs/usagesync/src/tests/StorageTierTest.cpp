#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <memory>

#include "usagesync/sharedfiletier.h"
#include "usagesync/keyvaluetier.h"

class StorageTierTest : public QObject
{
    Q_OBJECT

private slots:
    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());
    }

    void cleanup() {
        m_tempDir.reset();
    }

    void testFileTierReadMissing() {
        SharedFileTier tier(m_tempDir->path());
        QByteArray data;
        QCOMPARE(tier.read("snapshot", data), StorageError::NotFound);
        QCOMPARE(tier.remove("snapshot"), StorageError::NotFound);
    }

    void testFileTierReplacesWholeContent() {
        SharedFileTier tier(m_tempDir->path());
        QCOMPARE(tier.write("snapshot", QByteArray(4096, 'x')), StorageError::None);
        QCOMPARE(tier.write("snapshot", QByteArray("{}")), StorageError::None);

        QByteArray data;
        QCOMPARE(tier.read("snapshot", data), StorageError::None);
        QCOMPARE(data, QByteArray("{}"));
        QVERIFY(QFile::exists(m_tempDir->path() + "/snapshot.json"));
    }

    void testFileTierNestedKeys() {
        SharedFileTier tier(m_tempDir->path() + "/shared");
        QCOMPARE(tier.write("profiles/abc/snapshot", QByteArray("1")), StorageError::None);
        QVERIFY(QFile::exists(m_tempDir->path() + "/shared/profiles/abc/snapshot.json"));

        QCOMPARE(tier.remove("profiles/abc/snapshot"), StorageError::None);
        QByteArray data;
        QCOMPARE(tier.read("profiles/abc/snapshot", data), StorageError::NotFound);
    }

    void testFileTierWriteFailure() {
        QFile blocker(m_tempDir->path() + "/blocker");
        QVERIFY(blocker.open(QIODevice::WriteOnly));
        blocker.close();

        SharedFileTier tier(m_tempDir->path() + "/blocker/shared");
        QCOMPARE(tier.write("snapshot", QByteArray("1")), StorageError::WriteFailed);
    }

    void testKeyValueTierVisibleAcrossInstances() {
        const QString path = m_tempDir->path() + "/kv.ini";
        std::unique_ptr<KeyValueTier> writer(KeyValueTier::createIni(path));
        std::unique_ptr<KeyValueTier> reader(KeyValueTier::createIni(path));

        QByteArray data;
        QCOMPARE(reader->read("claudeUsageData", data), StorageError::NotFound);

        QCOMPARE(writer->write("claudeUsageData", QByteArray("{\"a\":1}")), StorageError::None);
        QCOMPARE(reader->read("claudeUsageData", data), StorageError::None);
        QCOMPARE(data, QByteArray("{\"a\":1}"));
    }

    void testKeyValueTierPrimitiveValues() {
        std::unique_ptr<KeyValueTier> tier(KeyValueTier::createIni(m_tempDir->path() + "/kv.ini"));

        QCOMPARE(tier->setValue("statuslineUse24HourTime", true), StorageError::None);
        QVariant value;
        QCOMPARE(tier->value("statuslineUse24HourTime", value), StorageError::None);
        QCOMPARE(value.toString(), QString("true"));
        QVERIFY(tier->contains("statuslineUse24HourTime"));
        QCOMPARE(tier->value("missing", value), StorageError::NotFound);
    }

    void testKeyValueTierRemoveGroup() {
        std::unique_ptr<KeyValueTier> tier(KeyValueTier::createIni(m_tempDir->path() + "/kv.ini"));

        QCOMPARE(tier->write("profiles/abc/claudeUsageData", QByteArray("1")), StorageError::None);
        QCOMPARE(tier->write("profiles/abc/widgetSettings", QByteArray("2")), StorageError::None);
        QCOMPARE(tier->write("profiles/def/widgetSettings", QByteArray("3")), StorageError::None);

        QCOMPARE(tier->remove("profiles/abc"), StorageError::None);

        QByteArray data;
        QCOMPARE(tier->read("profiles/abc/claudeUsageData", data), StorageError::NotFound);
        QCOMPARE(tier->read("profiles/abc/widgetSettings", data), StorageError::NotFound);
        QCOMPARE(tier->read("profiles/def/widgetSettings", data), StorageError::None);
        QCOMPARE(tier->remove("profiles/abc"), StorageError::NotFound);
    }

private:
    QScopedPointer<QTemporaryDir> m_tempDir;
};

QTEST_MAIN(StorageTierTest)
#include "StorageTierTest.moc"
