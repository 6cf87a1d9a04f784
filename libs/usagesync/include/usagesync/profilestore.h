#pragma once
#include <QObject>
#include <QList>
#include <QSharedPointer>
#include <QUuid>
#include <functional>
#include "profile.h"
#include "snapshotstore.h"

enum class ProfileDisplayMode {
    Single,  // only the active profile is shown
    Multi    // every profile selected for display is shown
};

/**
 * @brief Owns the collection of tracked accounts
 *
 * The collection is stored as one encoded entry in the key-value tier. Reads
 * distinguish "no profiles yet" from "collection present but unreadable"; any
 * mutation of an unreadable collection is refused unless the caller saves with
 * SaveMode::ForceOverwrite.
 */
class ProfileStore : public QObject
{
    Q_OBJECT
public:
    enum class LoadResult {
        Loaded,
        Empty,
        Failed
    };

    enum class SaveMode {
        Normal,
        ForceOverwrite
    };

    explicit ProfileStore(SnapshotStore& store, QObject *parent = nullptr);

    LoadResult load(QList<Profile>& profiles) const;
    QList<Profile> list() const;
    StorageError get(const QUuid& id, Profile& profile) const;
    StorageError save(const QList<Profile>& profiles, SaveMode mode = SaveMode::Normal);

    StorageError add(const Profile& profile);
    StorageError update(const Profile& profile);
    StorageError remove(const QUuid& id);

    StorageError setActive(const QUuid& id);
    bool getActive(Profile& profile) const;
    // Null when unset or when the stored id no longer matches a profile
    QUuid activeProfileId() const;

    StorageError updateCredentials(const QUuid& id, const ProfileCredentials& credentials);
    bool credentials(const QUuid& id, ProfileCredentials& credentials) const;
    StorageError updateCachedUsage(const QUuid& id, const UsageSnapshot& snapshot);

    QSharedPointer<const UsageSettings> loadSettings(const QUuid& id);
    bool saveSettings(const QUuid& id, const UsageSettings& settings);

    ProfileDisplayMode displayMode() const;
    bool setDisplayMode(ProfileDisplayMode mode);

signals:
    void profilesChanged();
    void activeProfileChanged(const QUuid& id);

private:
    typedef std::function<StorageError(QList<Profile>&)> Mutation;
    StorageError mutate(const Mutation& mutation);

    SnapshotStore& m_store;
    KeyValueTier* m_keyValue;
};
