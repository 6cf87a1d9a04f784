#ifndef COMMANDUSAGEFETCHER_H
#define COMMANDUSAGEFETCHER_H

#include <QStringList>
#include "UsageFetcher.h"

/**
 * Runs an external command that performs the remote poll and prints one usage
 * payload (canonical or older producer shape) as JSON on stdout. Credentials
 * reach the command through USAGE_SESSION_KEY, USAGE_ORGANIZATION_ID and
 * USAGE_CLI_CREDENTIALS.
 */
class CommandUsageFetcher : public UsageFetcher
{
public:
    CommandUsageFetcher(const QString& program, const QStringList& arguments, int timeoutMs);

    bool fetchUsageData(UsageSnapshot& snapshot, QString& error) override;

    QString program() const { return m_program; }

private:
    QString m_program;
    QStringList m_arguments;
    int m_timeoutMs;
};

#endif // COMMANDUSAGEFETCHER_H
