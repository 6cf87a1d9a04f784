#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QJsonDocument>
#include <QStandardPaths>
#include <QTextStream>

#include "logger/logger.h"
#include "usagesync/snapshotcodec.h"
#include "usagesync/snapshotstore.h"
#include "usagesync/profilestore.h"
#include "usagesync/refreshscheduler.h"

// One host invocation: render once, print the timeline entry and exit.
// Always exits 0 so the host shows the "no data" model instead of an error.
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("usage-tile");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Usage Sync Tile");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption familyOption("family", "Tile family (small, medium, large)", "family", "small");
    QCommandLineOption profileOption("profile", "Profile id to render (default: active profile)", "id");
    QCommandLineOption configOption("config", "Store configuration file", "path");
    QCommandLineOption logFileOption("logfile", "Specify log file path", "path");
    QCommandLineOption logLevelOption("loglevel", "Set log level (debug, info, warning, error)", "level", "warning");

    parser.addOption(familyOption);
    parser.addOption(profileOption);
    parser.addOption(configOption);
    parser.addOption(logFileOption);
    parser.addOption(logLevelOption);

    parser.process(app);

    Logger::instance()->setProcessTag("tile");
    // stdout carries the render model
    Logger::instance()->enableConsoleOutput(false);

    QString logPath = parser.value(logFileOption);
    if (logPath.isEmpty()) {
        QString logDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        QDir().mkpath(logDir);
        logPath = logDir + "/usage_tile.log";
    }
    Logger::instance()->setLogFile(logPath);

    bool levelOk = false;
    Logger::LogLevel level = Logger::levelFromString(parser.value(logLevelOption), &levelOk);
    Logger::instance()->setLogLevel(levelOk ? level : Logger::Warning);

    RefreshScheduler::TileFamily family = RefreshScheduler::TileFamily::Small;
    if (!RefreshScheduler::familyFromString(parser.value(familyOption), family)) {
        LOG_WARNING(QString("Unknown tile family '%1', rendering small").arg(parser.value(familyOption)));
    }

    StoreConfig config = parser.isSet(configOption) ? StoreConfig::fromFile(parser.value(configOption))
                                                    : StoreConfig::fromEnvironment();
    SnapshotStore store(config);

    QUuid profileId;
    if (parser.isSet(profileOption)) {
        profileId = QUuid(parser.value(profileOption));
    } else {
        ProfileStore profiles(store);
        profileId = profiles.activeProfileId();
    }

    RenderModelBuilder builder(store);
    RefreshScheduler scheduler(builder, family);
    TimelineEntry entry = scheduler.invoke(profileId, QDateTime::currentDateTime());

    QJsonObject output;
    output["model"] = entry.model.toJson();
    output["nextRefresh"] = SnapshotCodec::dateToString(entry.nextRefresh);
    QTextStream(stdout) << QJsonDocument(output).toJson(QJsonDocument::Indented);

    return 0;
}
