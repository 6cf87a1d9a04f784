#include "CommandUsageFetcher.h"
#include "usagesync/snapshotcodec.h"
#include "logger/logger.h"
#include <QProcess>
#include <QProcessEnvironment>

CommandUsageFetcher::CommandUsageFetcher(const QString& program, const QStringList& arguments, int timeoutMs)
    : m_program(program)
    , m_arguments(arguments)
    , m_timeoutMs(timeoutMs)
{
}

bool CommandUsageFetcher::fetchUsageData(UsageSnapshot& snapshot, QString& error)
{
    if (m_program.isEmpty()) {
        error = "No fetch command configured";
        return false;
    }

    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert("USAGE_SESSION_KEY", m_credentials.sessionKey);
    env.insert("USAGE_ORGANIZATION_ID", m_credentials.organizationId);
    env.insert("USAGE_CLI_CREDENTIALS", m_credentials.cliCredentialsJson);

    QProcess process;
    process.setProcessEnvironment(env);
    process.start(m_program, m_arguments);

    if (!process.waitForStarted(m_timeoutMs)) {
        error = QString("Failed to start %1: %2").arg(m_program, process.errorString());
        return false;
    }

    if (!process.waitForFinished(m_timeoutMs)) {
        process.kill();
        process.waitForFinished(1000);
        error = QString("%1 timed out after %2 ms").arg(m_program).arg(m_timeoutMs);
        return false;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        QString stderrText = QString::fromUtf8(process.readAllStandardError()).trimmed();
        error = QString("%1 exited with code %2: %3").arg(m_program).arg(process.exitCode()).arg(stderrText);
        return false;
    }

    QByteArray output = process.readAllStandardOutput();
    UsageSnapshot decoded;
    if (SnapshotCodec::decodeCompatSnapshot(output, decoded) != DecodeError::None) {
        error = QString("%1 printed an unreadable usage payload (%2 bytes)").arg(m_program).arg(output.size());
        return false;
    }

    // Producers that do not stamp their payload are stamped on arrival
    if (decoded.isNull()) {
        decoded.capturedAt = QDateTime::currentDateTimeUtc();
    }

    LOG_DEBUG(QString("Fetched usage via %1: session %2%, weekly %3%")
              .arg(m_program).arg(decoded.sessionPercentage).arg(decoded.weeklyPercentage));
    snapshot = decoded;
    return true;
}
