#ifndef USAGEFETCHER_H
#define USAGEFETCHER_H

#include <QString>
#include "usagesync/profile.h"
#include "usagesync/usagesnapshot.h"

// Source of fresh usage data for the agent's poll loop
class UsageFetcher
{
public:
    virtual ~UsageFetcher() = default;

    // Credentials of the account the next fetch is made for
    virtual void setCredentials(const ProfileCredentials& credentials) { m_credentials = credentials; }

    virtual bool fetchUsageData(UsageSnapshot& snapshot, QString& error) = 0;

protected:
    ProfileCredentials m_credentials;
};

#endif // USAGEFETCHER_H
