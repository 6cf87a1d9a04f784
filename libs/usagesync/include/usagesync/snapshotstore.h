#pragma once
#include <QSharedPointer>
#include <QUuid>
#include <memory>
#include "usagesnapshot.h"
#include "usagesettings.h"
#include "storeconfig.h"
#include "settingscache.h"
#include "sharedfiletier.h"
#include "keyvaluetier.h"

enum class SaveResult {
    Saved,
    DiscardedStale,  // older than the snapshot already stored
    WriteFailed      // no tier accepted the write
};

/**
 * @brief Read and write facade over the persistence tiers
 *
 * Snapshots are read from the shared file first and from the key-value tier
 * second; the first tier that decodes wins. Settings are read through a short
 * TTL cache. A null profile id addresses the legacy single-profile scope.
 *
 * Construct one instance per process and hand it to its users.
 */
class SnapshotStore {
public:
    explicit SnapshotStore(const StoreConfig& config);
    SnapshotStore(const StoreConfig& config, SettingsCache::Clock clock);
    ~SnapshotStore();

    bool loadSnapshot(const QUuid& profileId, UsageSnapshot& snapshot) const;
    SaveResult saveSnapshot(const QUuid& profileId, const UsageSnapshot& snapshot);

    // Never null: falls back to the default bundle
    QSharedPointer<const UsageSettings> loadSettings(const QUuid& profileId);
    bool saveSettings(const QUuid& profileId, const UsageSettings& settings);

    bool loadApiUsage(const QUuid& profileId, ApiUsage& usage) const;
    bool saveApiUsage(const QUuid& profileId, const ApiUsage& usage);

    // Erases every tier entry of a profile's scope
    bool removeProfileData(const QUuid& profileId);

    const StoreConfig& config() const { return m_config; }
    KeyValueTier* keyValueTier() const { return m_keyValue.get(); }
    SharedFileTier* fileTier() const { return m_files.get(); }

    static QString scopePrefix(const QUuid& profileId);

private:
    QSharedPointer<const UsageSettings> readSettings(const QUuid& profileId) const;
    bool readLegacySettingFields(UsageSettings& settings) const;
    bool writeLegacySettingFields(const UsageSettings& settings);

    StoreConfig m_config;
    std::unique_ptr<SharedFileTier> m_files;
    std::unique_ptr<KeyValueTier> m_keyValue;
    SettingsCache m_settingsCache;
};
