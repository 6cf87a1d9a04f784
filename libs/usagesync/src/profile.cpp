#include "usagesync/profile.h"

Profile::Profile()
    : createdAt(QDateTime::currentDateTimeUtc())
    , lastUsedAt(createdAt)
{
}

Profile::Profile(const QString& name)
    : id(QUuid::createUuid())
    , name(name)
    , createdAt(QDateTime::currentDateTimeUtc())
    , lastUsedAt(createdAt)
{
}

bool Profile::operator==(const Profile& other) const
{
    return id == other.id
        && name == other.name
        && credentials == other.credentials
        && hasCliAccount == other.hasCliAccount
        && cliAccountSyncedAt == other.cliAccountSyncedAt
        && refreshIntervalSecs == other.refreshIntervalSecs
        && autoStartSessionEnabled == other.autoStartSessionEnabled
        && checkOverageLimitEnabled == other.checkOverageLimitEnabled
        && autoRotateEnabled == other.autoRotateEnabled
        && isSelectedForDisplay == other.isSelectedForDisplay
        && createdAt == other.createdAt
        && lastUsedAt == other.lastUsedAt
        && cachedUsage == other.cachedUsage;
}
