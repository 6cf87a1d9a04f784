#include "usagesync/profilestore.h"
#include "usagesync/snapshotcodec.h"
#include "logger/logger.h"

static const char* ProfilesKey = "profiles_v3";
static const char* ActiveProfileKey = "activeProfileId";
static const char* DisplayModeKey = "profileDisplayMode";

static int indexOf(const QList<Profile>& profiles, const QUuid& id)
{
    for (int i = 0; i < profiles.size(); ++i) {
        if (profiles.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

ProfileStore::ProfileStore(SnapshotStore& store, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_keyValue(store.keyValueTier())
{
}

ProfileStore::LoadResult ProfileStore::load(QList<Profile>& profiles) const
{
    QByteArray data;
    StorageError result = m_keyValue->read(ProfilesKey, data);
    if (result == StorageError::NotFound) {
        profiles.clear();
        return LoadResult::Empty;
    }
    if (result != StorageError::None) {
        LOG_WARNING(QString("Failed to read profiles: %1").arg(storageErrorToString(result)));
        return LoadResult::Failed;
    }

    if (SnapshotCodec::decodeProfiles(data, profiles) != DecodeError::None) {
        LOG_WARNING("Stored profile collection failed to decode");
        return LoadResult::Failed;
    }
    return profiles.isEmpty() ? LoadResult::Empty : LoadResult::Loaded;
}

QList<Profile> ProfileStore::list() const
{
    QList<Profile> profiles;
    if (load(profiles) == LoadResult::Failed) {
        return QList<Profile>();
    }
    return profiles;
}

StorageError ProfileStore::get(const QUuid& id, Profile& profile) const
{
    QList<Profile> profiles;
    if (load(profiles) == LoadResult::Failed) {
        return StorageError::DecodeError;
    }

    int index = indexOf(profiles, id);
    if (index < 0) {
        return StorageError::NotFound;
    }
    profile = profiles.at(index);
    return StorageError::None;
}

StorageError ProfileStore::save(const QList<Profile>& profiles, SaveMode mode)
{
    if (mode == SaveMode::Normal) {
        QList<Profile> existing;
        if (load(existing) == LoadResult::Failed) {
            LOG_ERROR("Refusing to overwrite an unreadable profile collection");
            return StorageError::DecodeError;
        }
    } else {
        LOG_WARNING(QString("Force-overwriting profile collection with %1 profiles").arg(profiles.size()));
    }

    StorageError result = m_keyValue->write(ProfilesKey, SnapshotCodec::encodeProfiles(profiles));
    if (result != StorageError::None) {
        LOG_ERROR("Failed to write profile collection");
        return result;
    }

    emit profilesChanged();
    return StorageError::None;
}

StorageError ProfileStore::mutate(const Mutation& mutation)
{
    QList<Profile> profiles;
    if (load(profiles) == LoadResult::Failed) {
        LOG_ERROR("Profile collection is unreadable, change not applied");
        return StorageError::DecodeError;
    }

    StorageError result = mutation(profiles);
    if (result != StorageError::None) {
        return result;
    }
    return save(profiles);
}

StorageError ProfileStore::add(const Profile& profile)
{
    if (profile.id.isNull()) {
        LOG_WARNING("Cannot add a profile without an id");
        return StorageError::WriteFailed;
    }

    StorageError result = mutate([&profile](QList<Profile>& profiles) {
        if (indexOf(profiles, profile.id) >= 0) {
            LOG_WARNING(QString("Profile %1 already exists").arg(profile.id.toString()));
            return StorageError::WriteFailed;
        }
        profiles.append(profile);
        return StorageError::None;
    });

    if (result == StorageError::None) {
        LOG_INFO(QString("Added profile '%1' (%2)").arg(profile.name, profile.id.toString()));
    }
    return result;
}

StorageError ProfileStore::update(const Profile& profile)
{
    return mutate([&profile](QList<Profile>& profiles) {
        int index = indexOf(profiles, profile.id);
        if (index < 0) {
            return StorageError::NotFound;
        }
        profiles[index] = profile;
        return StorageError::None;
    });
}

StorageError ProfileStore::remove(const QUuid& id)
{
    bool wasActive = activeProfileId() == id;

    StorageError result = mutate([&id](QList<Profile>& profiles) {
        int index = indexOf(profiles, id);
        if (index < 0) {
            return StorageError::NotFound;
        }
        profiles.removeAt(index);
        return StorageError::None;
    });
    if (result != StorageError::None) {
        return result;
    }

    // Credentials and cached usage went with the record; the scoped tier data goes here
    if (!m_store.removeProfileData(id)) {
        LOG_WARNING(QString("Some stored data of profile %1 could not be removed").arg(id.toString()));
    }

    if (wasActive) {
        if (m_keyValue->remove(ActiveProfileKey) == StorageError::WriteFailed) {
            LOG_WARNING("Failed to clear the active profile id");
        }
        emit activeProfileChanged(QUuid());
    }

    LOG_INFO(QString("Removed profile %1").arg(id.toString()));
    return StorageError::None;
}

StorageError ProfileStore::setActive(const QUuid& id)
{
    Profile profile;
    StorageError result = get(id, profile);
    if (result != StorageError::None) {
        LOG_WARNING(QString("Cannot activate profile %1: %2").arg(id.toString(), storageErrorToString(result)));
        return result;
    }

    result = m_keyValue->setValue(ActiveProfileKey, id.toString(QUuid::WithoutBraces));
    if (result != StorageError::None) {
        return result;
    }

    profile.lastUsedAt = QDateTime::currentDateTimeUtc();
    if (update(profile) != StorageError::None) {
        LOG_WARNING(QString("Could not record last use of profile %1").arg(id.toString()));
    }

    LOG_INFO(QString("Active profile is now '%1'").arg(profile.name));
    emit activeProfileChanged(id);
    return StorageError::None;
}

QUuid ProfileStore::activeProfileId() const
{
    QVariant stored;
    if (m_keyValue->value(ActiveProfileKey, stored) != StorageError::None) {
        return QUuid();
    }

    QUuid id(stored.toString());
    if (id.isNull()) {
        return QUuid();
    }

    Profile profile;
    if (get(id, profile) != StorageError::None) {
        LOG_DEBUG(QString("Active profile id %1 matches no profile").arg(id.toString()));
        return QUuid();
    }
    return id;
}

bool ProfileStore::getActive(Profile& profile) const
{
    QUuid id = activeProfileId();
    if (id.isNull()) {
        return false;
    }
    return get(id, profile) == StorageError::None;
}

StorageError ProfileStore::updateCredentials(const QUuid& id, const ProfileCredentials& credentials)
{
    return mutate([&id, &credentials](QList<Profile>& profiles) {
        int index = indexOf(profiles, id);
        if (index < 0) {
            return StorageError::NotFound;
        }
        profiles[index].credentials = credentials;
        return StorageError::None;
    });
}

bool ProfileStore::credentials(const QUuid& id, ProfileCredentials& credentials) const
{
    Profile profile;
    if (get(id, profile) != StorageError::None) {
        return false;
    }
    credentials = profile.credentials;
    return true;
}

StorageError ProfileStore::updateCachedUsage(const QUuid& id, const UsageSnapshot& snapshot)
{
    return mutate([&id, &snapshot](QList<Profile>& profiles) {
        int index = indexOf(profiles, id);
        if (index < 0) {
            return StorageError::NotFound;
        }
        profiles[index].cachedUsage = snapshot;
        return StorageError::None;
    });
}

QSharedPointer<const UsageSettings> ProfileStore::loadSettings(const QUuid& id)
{
    return m_store.loadSettings(id);
}

bool ProfileStore::saveSettings(const QUuid& id, const UsageSettings& settings)
{
    Profile profile;
    if (get(id, profile) != StorageError::None) {
        LOG_WARNING(QString("Cannot save settings of unknown profile %1").arg(id.toString()));
        return false;
    }
    return m_store.saveSettings(id, settings);
}

ProfileDisplayMode ProfileStore::displayMode() const
{
    QVariant stored;
    if (m_keyValue->value(DisplayModeKey, stored) == StorageError::None && stored.toString() == "multi") {
        return ProfileDisplayMode::Multi;
    }
    return ProfileDisplayMode::Single;
}

bool ProfileStore::setDisplayMode(ProfileDisplayMode mode)
{
    QString value = mode == ProfileDisplayMode::Multi ? "multi" : "single";
    return m_keyValue->setValue(DisplayModeKey, value) == StorageError::None;
}
