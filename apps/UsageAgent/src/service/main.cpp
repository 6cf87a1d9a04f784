#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>
#include <QTextStream>

#include "logger/logger.h"
#include "usagesync/snapshotcodec.h"
#include "usagesync/snapshotstore.h"
#include "usagesync/profilestore.h"
#include "usagesync/rendermodel.h"
#include "../managers/AgentConfigManager.h"
#include "../core/CommandUsageFetcher.h"
#include "UsageAgentService.h"

static QUuid selectedProfile(const QCommandLineParser& parser, const QCommandLineOption& option,
                             const ProfileStore& profiles)
{
    if (parser.isSet(option)) {
        return QUuid(parser.value(option));
    }
    return profiles.activeProfileId();
}

static int publishFile(SnapshotStore& store, ProfileStore& profiles, const QUuid& profileId, const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR(QString("Cannot open %1: %2").arg(path, file.errorString()));
        return 1;
    }

    UsageSnapshot snapshot;
    if (SnapshotCodec::decodeCompatSnapshot(file.readAll(), snapshot) != DecodeError::None) {
        LOG_ERROR(QString("%1 does not contain a usage snapshot").arg(path));
        return 1;
    }
    if (snapshot.isNull()) {
        snapshot.capturedAt = QDateTime::currentDateTimeUtc();
    }

    SaveResult result = store.saveSnapshot(profileId, snapshot);
    if (result == SaveResult::WriteFailed) {
        return 1;
    }
    if (result == SaveResult::Saved && !profileId.isNull()
        && profiles.updateCachedUsage(profileId, snapshot) != StorageError::None) {
        LOG_WARNING("Snapshot published but not cached on the profile");
    }
    return 0;
}

static int applySettings(SnapshotStore& store, const QUuid& profileId, const QStringList& assignments)
{
    UsageSettings settings = *store.loadSettings(profileId);

    for (const QString& assignment : assignments) {
        int separator = assignment.indexOf('=');
        if (separator <= 0) {
            LOG_ERROR(QString("Expected field=value, got '%1'").arg(assignment));
            return 1;
        }
        if (!settings.applyField(assignment.left(separator).trimmed(), assignment.mid(separator + 1))) {
            LOG_ERROR(QString("Rejected setting '%1'").arg(assignment));
            return 1;
        }
    }

    return store.saveSettings(profileId, settings) ? 0 : 1;
}

static int listProfiles(const ProfileStore& profiles)
{
    QList<Profile> list;
    if (profiles.load(list) == ProfileStore::LoadResult::Failed) {
        LOG_ERROR("Stored profiles could not be read");
        return 1;
    }

    const QUuid activeId = profiles.activeProfileId();
    QJsonArray array;
    for (const Profile& profile : list) {
        QJsonObject entry;
        entry["id"] = profile.id.toString(QUuid::WithoutBraces);
        entry["name"] = profile.name;
        entry["active"] = profile.id == activeId;
        entry["hasCredentials"] = profile.hasUsageCredentials();
        if (!profile.cachedUsage.isNull()) {
            entry["sessionPercentage"] = profile.cachedUsage.sessionPercentage;
            entry["weeklyPercentage"] = profile.cachedUsage.weeklyPercentage;
        }
        array.append(entry);
    }

    QTextStream(stdout) << QJsonDocument(array).toJson(QJsonDocument::Indented);
    return 0;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("usage-agent");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Usage Sync Agent");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption consoleOption("console", "Run the poll loop in the foreground");
    QCommandLineOption onceOption("once", "Poll once, publish and exit");
    QCommandLineOption configOption("config", "Agent configuration file", "path");
    QCommandLineOption fetchCommandOption("fetch-command", "Command printing a usage payload", "program");
    QCommandLineOption publishOption("publish", "Publish the snapshot stored in a JSON file", "file");
    QCommandLineOption profileOption("profile", "Profile id to act on (default: active profile)", "id");
    QCommandLineOption setOption("set", "Change a setting, repeatable", "field=value");
    QCommandLineOption addProfileOption("add-profile", "Create a profile", "name");
    QCommandLineOption removeProfileOption("remove-profile", "Delete a profile and its data", "id");
    QCommandLineOption activateOption("activate", "Make a profile the active one", "id");
    QCommandLineOption listProfilesOption("list-profiles", "Print all profiles as JSON");
    QCommandLineOption renderOption("render", "Print the render model of the selected profile");
    QCommandLineOption logFileOption("logfile", "Specify log file path", "path");
    QCommandLineOption logLevelOption("loglevel", "Set log level (debug, info, warning, error)", "level", "info");

    parser.addOption(consoleOption);
    parser.addOption(onceOption);
    parser.addOption(configOption);
    parser.addOption(fetchCommandOption);
    parser.addOption(publishOption);
    parser.addOption(profileOption);
    parser.addOption(setOption);
    parser.addOption(addProfileOption);
    parser.addOption(removeProfileOption);
    parser.addOption(activateOption);
    parser.addOption(listProfilesOption);
    parser.addOption(renderOption);
    parser.addOption(logFileOption);
    parser.addOption(logLevelOption);

    parser.process(app);

    Logger::instance()->setProcessTag("agent");

    if (parser.isSet(logFileOption)) {
        Logger::instance()->setLogFile(parser.value(logFileOption));
    } else {
        QString logDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        QDir().mkpath(logDir);
        Logger::instance()->setLogFile(logDir + "/usage_agent.log");
    }

    bool levelOk = false;
    Logger::LogLevel level = Logger::levelFromString(parser.value(logLevelOption), &levelOk);
    Logger::instance()->setLogLevel(levelOk ? level : Logger::Info);

    LOG_INFO("Usage agent starting...");

    AgentConfigManager configManager;
    if (!configManager.initialize(parser.value(configOption)) || !configManager.loadLocalConfig()) {
        LOG_ERROR("Failed to load agent configuration");
        return 1;
    }

    // Command line level wins over the configured one
    if (parser.isSet(logLevelOption) && levelOk) {
        Logger::instance()->setLogLevel(level);
    }

    SnapshotStore store(configManager.storeConfig());
    ProfileStore profiles(store);

    if (parser.isSet(addProfileOption)) {
        Profile profile(parser.value(addProfileOption));
        if (profiles.add(profile) != StorageError::None) {
            return 1;
        }
        if (profiles.activeProfileId().isNull() && profiles.setActive(profile.id) != StorageError::None) {
            return 1;
        }
        QTextStream(stdout) << profile.id.toString(QUuid::WithoutBraces) << Qt::endl;
        return 0;
    }

    if (parser.isSet(removeProfileOption)) {
        return profiles.remove(QUuid(parser.value(removeProfileOption))) == StorageError::None ? 0 : 1;
    }

    if (parser.isSet(activateOption)) {
        return profiles.setActive(QUuid(parser.value(activateOption))) == StorageError::None ? 0 : 1;
    }

    if (parser.isSet(listProfilesOption)) {
        return listProfiles(profiles);
    }

    const QUuid profileId = selectedProfile(parser, profileOption, profiles);

    if (parser.isSet(setOption)) {
        return applySettings(store, profileId, parser.values(setOption));
    }

    if (parser.isSet(publishOption)) {
        return publishFile(store, profiles, profileId, parser.value(publishOption));
    }

    if (parser.isSet(renderOption)) {
        RenderModelBuilder builder(store);
        RenderModel model = builder.build(profileId, QDateTime::currentDateTime());
        QTextStream(stdout) << QJsonDocument(model.toJson()).toJson(QJsonDocument::Indented);
        return 0;
    }

    QString program = parser.isSet(fetchCommandOption) ? parser.value(fetchCommandOption)
                                                       : configManager.fetchCommand();
    CommandUsageFetcher fetcher(program, configManager.fetchArguments(), configManager.fetchTimeoutMs());

    UsageAgentService service(store, profiles, &fetcher);
    if (!service.initialize()) {
        LOG_ERROR("Failed to initialize service");
        return 1;
    }
    service.setPollIntervalOverride(configManager.pollIntervalSecs());

    if (parser.isSet(onceOption)) {
        return service.pollNow() ? 0 : 1;
    }

    if (!parser.isSet(consoleOption)) {
        parser.showHelp(1);
    }

    LOG_INFO("Running in console mode");
    if (!service.start()) {
        LOG_ERROR("Failed to start service");
        return 1;
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        LOG_INFO("Application shutting down...");
        service.stop();
    });

    return app.exec();
}
