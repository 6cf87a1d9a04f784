#include "usagesync/usagesnapshot.h"

UsageSnapshot::UsageSnapshot()
{
    perModelPercentage.insert(QString(OpusModel), 0.0);
    perModelPercentage.insert(QString(SonnetModel), 0.0);
}

bool UsageSnapshot::operator==(const UsageSnapshot& other) const
{
    return sessionPercentage == other.sessionPercentage
        && sessionResetAt == other.sessionResetAt
        && weeklyPercentage == other.weeklyPercentage
        && weeklyResetAt == other.weeklyResetAt
        && perModelPercentage == other.perModelPercentage
        && extraUsage == other.extraUsage
        && capturedAt == other.capturedAt
        && sessionTokensUsed == other.sessionTokensUsed
        && sessionLimit == other.sessionLimit
        && weeklyTokensUsed == other.weeklyTokensUsed
        && weeklyLimit == other.weeklyLimit
        && timeZoneId == other.timeZoneId;
}
