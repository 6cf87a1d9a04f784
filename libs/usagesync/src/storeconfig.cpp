#include "usagesync/storeconfig.h"
#include "usagesync/settingscache.h"
#include "logger/logger.h"
#include <QProcessEnvironment>
#include <QSettings>
#include <QStandardPaths>

static const char* DefaultOrganization = "UsageSync";
static const char* DefaultSuite = "group.usagesync";

static bool parseFlag(const QString& value, bool fallback)
{
    const QString lowered = value.trimmed().toLower();
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    return fallback;
}

StoreConfig::StoreConfig()
    : m_sharedDirectory(defaultSharedDirectory())
    , m_organization(DefaultOrganization)
    , m_suiteName(DefaultSuite)
    , m_settingsTtlMs(SettingsCache::DefaultTtlMs)
    , m_mirrorSnapshotToKeyValue(true)
{
}

QString StoreConfig::defaultSharedDirectory()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return base + "/" + DefaultSuite;
}

void StoreConfig::setSuiteName(const QString& organization, const QString& suite)
{
    m_organization = organization;
    m_suiteName = suite;
}

StoreConfig StoreConfig::fromEnvironment()
{
    StoreConfig config;
    auto env = QProcessEnvironment::systemEnvironment();

    config.m_sharedDirectory = env.value("USAGE_SYNC_SHARED_DIR", config.m_sharedDirectory);
    config.m_keyValuePath = env.value("USAGE_SYNC_KV_PATH");

    bool ok = false;
    int ttl = env.value("USAGE_SYNC_SETTINGS_TTL_MS").toInt(&ok);
    if (ok && ttl >= 0) {
        config.m_settingsTtlMs = ttl;
    } else if (env.contains("USAGE_SYNC_SETTINGS_TTL_MS")) {
        LOG_WARNING("Ignoring invalid USAGE_SYNC_SETTINGS_TTL_MS");
    }

    config.m_mirrorSnapshotToKeyValue = parseFlag(env.value("USAGE_SYNC_MIRROR_SNAPSHOT"),
                                                  config.m_mirrorSnapshotToKeyValue);
    return config;
}

StoreConfig StoreConfig::fromFile(const QString& configPath)
{
    StoreConfig config;
    QSettings settings(configPath, QSettings::IniFormat);

    settings.beginGroup("Store");
    config.m_sharedDirectory = settings.value("sharedDirectory", config.m_sharedDirectory).toString();
    config.m_keyValuePath = settings.value("keyValuePath", "").toString();
    config.m_organization = settings.value("organization", config.m_organization).toString();
    config.m_suiteName = settings.value("suiteName", config.m_suiteName).toString();
    config.m_settingsTtlMs = qMax(0, settings.value("settingsTtlMs", config.m_settingsTtlMs).toInt());
    config.m_mirrorSnapshotToKeyValue = settings.value("mirrorSnapshot", config.m_mirrorSnapshotToKeyValue).toBool();
    settings.endGroup();

    return config;
}
