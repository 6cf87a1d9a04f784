#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "logger/logger.h"

Q_DECLARE_METATYPE(Logger::LogLevel)

class LoggerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        Logger::instance()->enableConsoleOutput(false);
    }

    void testLevelFromString_data() {
        QTest::addColumn<QString>("name");
        QTest::addColumn<Logger::LogLevel>("level");
        QTest::addColumn<bool>("valid");

        QTest::newRow("debug") << QString("debug") << Logger::Debug << true;
        QTest::newRow("mixed case") << QString(" Warning ") << Logger::Warning << true;
        QTest::newRow("short warn") << QString("warn") << Logger::Warning << true;
        QTest::newRow("error") << QString("ERROR") << Logger::Error << true;
        QTest::newRow("unknown") << QString("verbose") << Logger::Info << false;
    }

    void testLevelFromString() {
        QFETCH(QString, name);
        QFETCH(Logger::LogLevel, level);
        QFETCH(bool, valid);

        bool ok = !valid;
        QCOMPARE(Logger::levelFromString(name, &ok), level);
        QCOMPARE(ok, valid);
    }

    void testFileOutputAndFiltering() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.filePath("logs/agent.log");

        Logger* logger = Logger::instance();
        QVERIFY(logger->setLogFile(path));
        QCOMPARE(logger->getLogFilePath(), path);

        logger->setProcessTag("agent");
        logger->setLogLevel(Logger::Info);
        LOG_DEBUG("hidden debug line");
        LOG_WARNING("visible warning line");

        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly | QIODevice::Text));
        QString contents = QString::fromUtf8(file.readAll());

        QVERIFY(!contents.contains("hidden debug line"));
        QVERIFY(contents.contains("visible warning line"));
        QVERIFY(contents.contains("[WARNING]"));
        QVERIFY(contents.contains("[agent]"));
        QVERIFY(contents.contains("LoggerTest::testFileOutputAndFiltering"));

        logger->setProcessTag(QString());
    }

    void testUnwritableLogFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        // A regular file where the log directory should be
        QString blocker = dir.filePath("blocker");
        QFile file(blocker);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.close();

        QVERIFY(!Logger::instance()->setLogFile(blocker + "/agent.log"));
    }
};

QTEST_MAIN(LoggerTest)
#include "LoggerTest.moc"
