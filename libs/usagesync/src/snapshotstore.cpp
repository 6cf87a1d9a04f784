#include "usagesync/snapshotstore.h"
#include "usagesync/snapshotcodec.h"
#include "logger/logger.h"

// Shared file keys
static const char* SnapshotFileKey = "snapshot";
static const char* SettingsFileKey = "settings";

// Key-value keys
static const char* SnapshotKey = "claudeUsageData";
static const char* SettingsKey = "widgetSettings";
static const char* ApiUsageKey = "apiUsageData";

static KeyValueTier* createKeyValueTier(const StoreConfig& config)
{
    if (config.keyValuePath().isEmpty()) {
        return KeyValueTier::createNative(config.organization(), config.suiteName());
    }
    return KeyValueTier::createIni(config.keyValuePath());
}

SnapshotStore::SnapshotStore(const StoreConfig& config)
    : m_config(config)
    , m_files(new SharedFileTier(config.sharedDirectory()))
    , m_keyValue(createKeyValueTier(config))
{
    LOG_INFO(QString("Snapshot store using %1 and %2")
             .arg(m_files->directory(), m_keyValue->location()));
}

SnapshotStore::SnapshotStore(const StoreConfig& config, SettingsCache::Clock clock)
    : m_config(config)
    , m_files(new SharedFileTier(config.sharedDirectory()))
    , m_keyValue(createKeyValueTier(config))
    , m_settingsCache(std::move(clock))
{
}

SnapshotStore::~SnapshotStore() = default;

QString SnapshotStore::scopePrefix(const QUuid& profileId)
{
    if (profileId.isNull()) {
        return QString();
    }
    return "profiles/" + profileId.toString(QUuid::WithoutBraces) + "/";
}

bool SnapshotStore::loadSnapshot(const QUuid& profileId, UsageSnapshot& snapshot) const
{
    const QString prefix = scopePrefix(profileId);
    QByteArray data;

    StorageError result = m_files->read(prefix + SnapshotFileKey, data);
    if (result == StorageError::None) {
        if (SnapshotCodec::decodeSnapshot(data, snapshot) == DecodeError::None) {
            return true;
        }
        LOG_WARNING(QString("Shared snapshot for scope '%1' failed to decode, trying key-value tier").arg(prefix));
    } else {
        LOG_DEBUG(QString("No shared snapshot for scope '%1': %2").arg(prefix, storageErrorToString(result)));
    }

    result = m_keyValue->read(prefix + SnapshotKey, data);
    if (result != StorageError::None) {
        LOG_DEBUG(QString("No key-value snapshot for scope '%1': %2").arg(prefix, storageErrorToString(result)));
        return false;
    }

    if (SnapshotCodec::decodeCompatSnapshot(data, snapshot) != DecodeError::None) {
        LOG_WARNING(QString("Key-value snapshot for scope '%1' failed to decode").arg(prefix));
        return false;
    }
    return true;
}

SaveResult SnapshotStore::saveSnapshot(const QUuid& profileId, const UsageSnapshot& snapshot)
{
    const QString prefix = scopePrefix(profileId);

    UsageSnapshot existing;
    if (loadSnapshot(profileId, existing) && !existing.isNull() && snapshot.capturedAt < existing.capturedAt) {
        LOG_INFO(QString("Discarding snapshot captured at %1, stored snapshot is newer (%2)")
                 .arg(SnapshotCodec::dateToString(snapshot.capturedAt),
                      SnapshotCodec::dateToString(existing.capturedAt)));
        return SaveResult::DiscardedStale;
    }

    const QByteArray data = SnapshotCodec::encodeSnapshot(snapshot);

    bool fileSaved = m_files->write(prefix + SnapshotFileKey, data) == StorageError::None;
    bool keyValueSaved = false;
    if (m_config.mirrorSnapshotToKeyValue()) {
        keyValueSaved = m_keyValue->write(prefix + SnapshotKey, data) == StorageError::None;
    }

    if (!fileSaved && !keyValueSaved) {
        LOG_ERROR(QString("Snapshot for scope '%1' could not be written to any tier").arg(prefix));
        return SaveResult::WriteFailed;
    }

    LOG_DEBUG(QString("Saved snapshot for scope '%1' (session %2%, weekly %3%)")
              .arg(prefix).arg(snapshot.sessionPercentage).arg(snapshot.weeklyPercentage));
    return SaveResult::Saved;
}

QSharedPointer<const UsageSettings> SnapshotStore::loadSettings(const QUuid& profileId)
{
    QSharedPointer<const UsageSettings> settings = m_settingsCache.getOrLoad(
        scopePrefix(profileId) + SettingsKey,
        [this, profileId]() { return readSettings(profileId); },
        m_config.settingsTtlMs());

    if (settings.isNull()) {
        return QSharedPointer<const UsageSettings>(new UsageSettings());
    }
    return settings;
}

QSharedPointer<const UsageSettings> SnapshotStore::readSettings(const QUuid& profileId) const
{
    const QString prefix = scopePrefix(profileId);
    UsageSettings settings;
    bool sawUnreadableData = false;
    QByteArray data;

    if (m_keyValue->read(prefix + SettingsKey, data) == StorageError::None) {
        if (SnapshotCodec::decodeSettings(data, settings) == DecodeError::None) {
            return QSharedPointer<const UsageSettings>(new UsageSettings(settings));
        }
        LOG_WARNING(QString("Key-value settings for scope '%1' failed to decode").arg(prefix));
        sawUnreadableData = true;
    }

    if (m_files->read(prefix + SettingsFileKey, data) == StorageError::None) {
        if (SnapshotCodec::decodeSettings(data, settings) == DecodeError::None) {
            return QSharedPointer<const UsageSettings>(new UsageSettings(settings));
        }
        LOG_WARNING(QString("Shared settings for scope '%1' failed to decode").arg(prefix));
        sawUnreadableData = true;
    }

    if (profileId.isNull() && readLegacySettingFields(settings)) {
        return QSharedPointer<const UsageSettings>(new UsageSettings(settings));
    }

    if (sawUnreadableData) {
        // Not cached, so the next read retries once the writer has finished
        return QSharedPointer<const UsageSettings>();
    }

    LOG_DEBUG(QString("No settings stored for scope '%1', using defaults").arg(prefix));
    return QSharedPointer<const UsageSettings>(new UsageSettings());
}

bool SnapshotStore::readLegacySettingFields(UsageSettings& settings) const
{
    UsageSettings legacy;
    bool found = false;

    const QStringList fields = legacy.fieldValues().keys();
    for (const QString& field : fields) {
        QVariant stored;
        if (m_keyValue->value(field, stored) != StorageError::None) {
            continue;
        }
        found = true;
        if (!legacy.applyField(field, stored.toString())) {
            LOG_WARNING(QString("Legacy setting '%1' has an unreadable value, keeping default").arg(field));
        }
    }

    if (found) {
        settings = legacy;
    }
    return found;
}

bool SnapshotStore::writeLegacySettingFields(const UsageSettings& settings)
{
    bool ok = true;
    const QVariantMap fields = settings.fieldValues();
    for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
        if (m_keyValue->setValue(it.key(), it.value()) != StorageError::None) {
            ok = false;
        }
    }
    return ok;
}

bool SnapshotStore::saveSettings(const QUuid& profileId, const UsageSettings& settings)
{
    const QString prefix = scopePrefix(profileId);
    const QByteArray data = SnapshotCodec::encodeSettings(settings);

    bool keyValueSaved = m_keyValue->write(prefix + SettingsKey, data) == StorageError::None;
    bool fileSaved = m_files->write(prefix + SettingsFileKey, data) == StorageError::None;
    if (profileId.isNull() && !writeLegacySettingFields(settings)) {
        LOG_WARNING("Some legacy setting fields could not be written");
    }

    // The writer must observe its own write on the next read
    m_settingsCache.invalidate(prefix + SettingsKey);

    if (!keyValueSaved && !fileSaved) {
        LOG_ERROR(QString("Settings for scope '%1' could not be written to any tier").arg(prefix));
        return false;
    }
    return true;
}

bool SnapshotStore::loadApiUsage(const QUuid& profileId, ApiUsage& usage) const
{
    const QString key = scopePrefix(profileId) + ApiUsageKey;
    QByteArray data;

    StorageError result = m_keyValue->read(key, data);
    if (result != StorageError::None) {
        LOG_DEBUG(QString("No API usage stored at '%1'").arg(key));
        return false;
    }

    if (SnapshotCodec::decodeApiUsage(data, usage) != DecodeError::None) {
        LOG_WARNING(QString("API usage at '%1' failed to decode").arg(key));
        return false;
    }
    return true;
}

bool SnapshotStore::saveApiUsage(const QUuid& profileId, const ApiUsage& usage)
{
    return m_keyValue->write(scopePrefix(profileId) + ApiUsageKey,
                             SnapshotCodec::encodeApiUsage(usage)) == StorageError::None;
}

bool SnapshotStore::removeProfileData(const QUuid& profileId)
{
    if (profileId.isNull()) {
        LOG_WARNING("Refusing to remove the legacy scope");
        return false;
    }

    const QString prefix = scopePrefix(profileId);
    bool ok = true;

    const char* fileKeys[] = { SnapshotFileKey, SettingsFileKey };
    for (const char* key : fileKeys) {
        if (m_files->remove(prefix + key) == StorageError::WriteFailed) {
            ok = false;
        }
    }

    // Removing the group prefix drops every key of the profile
    QString group = prefix;
    group.chop(1);
    if (m_keyValue->remove(group) == StorageError::WriteFailed) {
        ok = false;
    }

    m_settingsCache.invalidate(prefix + SettingsKey);

    if (ok) {
        LOG_INFO(QString("Removed stored data of profile %1").arg(profileId.toString()));
    }
    return ok;
}
