#pragma once
#include <QString>
#include <QUuid>
#include <QDateTime>
#include "usagesnapshot.h"

struct ProfileCredentials {
    QString sessionKey;
    QString organizationId;
    QString apiSessionKey;
    QString apiOrganizationId;
    QString cliCredentialsJson;

    bool hasClaudeAi() const { return !sessionKey.isEmpty() && !organizationId.isEmpty(); }
    bool hasApiConsole() const { return !apiSessionKey.isEmpty() && !apiOrganizationId.isEmpty(); }
    bool hasCli() const { return !cliCredentialsJson.isEmpty(); }

    bool operator==(const ProfileCredentials& other) const {
        return sessionKey == other.sessionKey
            && organizationId == other.organizationId
            && apiSessionKey == other.apiSessionKey
            && apiOrganizationId == other.apiOrganizationId
            && cliCredentialsJson == other.cliCredentialsJson;
    }
};

class Profile {
public:
    Profile();
    explicit Profile(const QString& name);

    QUuid id;
    QString name;
    ProfileCredentials credentials;

    bool hasCliAccount = false;
    QDateTime cliAccountSyncedAt;

    int refreshIntervalSecs = 30;
    bool autoStartSessionEnabled = false;
    bool checkOverageLimitEnabled = true;
    bool autoRotateEnabled = false;
    bool isSelectedForDisplay = true;

    QDateTime createdAt;
    QDateTime lastUsedAt;

    // Last snapshot polled for this profile; null when never polled
    UsageSnapshot cachedUsage;

    bool hasUsageCredentials() const { return credentials.hasClaudeAi() || credentials.hasApiConsole() || credentials.hasCli(); }

    bool operator==(const Profile& other) const;
    bool operator!=(const Profile& other) const { return !(*this == other); }
};
