#ifndef USAGEAGENTSERVICE_H
#define USAGEAGENTSERVICE_H

#include <QObject>
#include <QTimer>
#include <QUuid>
#include "usagesync/snapshotstore.h"
#include "usagesync/profilestore.h"
#include "../core/UsageFetcher.h"

class UsageAgentService : public QObject
{
    Q_OBJECT
public:
    UsageAgentService(SnapshotStore& store, ProfileStore& profiles, UsageFetcher* fetcher,
                      QObject *parent = nullptr);
    ~UsageAgentService();

    bool initialize();
    bool start();
    bool stop();
    bool isRunning() const;

    // One fetch-and-publish cycle; true when a snapshot was stored
    bool pollNow();

    // Overrides the profile's refresh interval when positive
    void setPollIntervalOverride(int seconds);
    int pollIntervalMs() const;

signals:
    void snapshotPublished(const QUuid& profileId, const QDateTime& capturedAt);
    void fetchFailed(const QString& errorMessage);

private slots:
    void onPollTimer();
    void onActiveProfileChanged(const QUuid& id);

private:
    void updateTimerInterval();

    SnapshotStore& m_store;
    ProfileStore& m_profiles;
    UsageFetcher* m_fetcher;
    QTimer m_pollTimer;
    int m_pollIntervalOverrideSecs;
    bool m_initialized;
    bool m_isRunning;
};

#endif // USAGEAGENTSERVICE_H
