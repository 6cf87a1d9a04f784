#include "UsageAgentService.h"
#include "logger/logger.h"

// Keeps the millisecond interval within what QTimer accepts
static int secsToIntervalMs(int seconds)
{
    return qBound(1, seconds, UsageSettings::MaxRefreshIntervalSecs) * 1000;
}

UsageAgentService::UsageAgentService(SnapshotStore& store, ProfileStore& profiles, UsageFetcher* fetcher,
                                     QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_profiles(profiles)
    , m_fetcher(fetcher)
    , m_pollIntervalOverrideSecs(0)
    , m_initialized(false)
    , m_isRunning(false)
{
}

UsageAgentService::~UsageAgentService()
{
    if (m_isRunning) {
        stop();
    }
}

bool UsageAgentService::initialize()
{
    LOG_INFO("Initializing UsageAgentService");

    if (!m_fetcher) {
        LOG_ERROR("No usage fetcher provided");
        return false;
    }

    connect(&m_pollTimer, &QTimer::timeout, this, &UsageAgentService::onPollTimer);
    connect(&m_profiles, &ProfileStore::activeProfileChanged, this, &UsageAgentService::onActiveProfileChanged);

    m_initialized = true;
    LOG_INFO("UsageAgentService initialized successfully");
    return true;
}

bool UsageAgentService::start()
{
    if (!m_initialized) {
        LOG_ERROR("UsageAgentService not initialized");
        return false;
    }

    if (m_isRunning) {
        LOG_WARNING("UsageAgentService is already running");
        return true;
    }

    LOG_INFO("Starting UsageAgentService");

    updateTimerInterval();
    m_pollTimer.start();
    m_isRunning = true;

    // First poll right away so tiles do not wait a whole interval for data
    QTimer::singleShot(0, this, &UsageAgentService::onPollTimer);

    LOG_INFO(QString("UsageAgentService started, polling every %1 ms").arg(m_pollTimer.interval()));
    return true;
}

bool UsageAgentService::stop()
{
    if (!m_isRunning) {
        LOG_WARNING("UsageAgentService is not running");
        return true;
    }

    LOG_INFO("Stopping UsageAgentService");
    m_pollTimer.stop();
    m_isRunning = false;
    return true;
}

bool UsageAgentService::isRunning() const
{
    return m_isRunning;
}

void UsageAgentService::setPollIntervalOverride(int seconds)
{
    m_pollIntervalOverrideSecs = seconds > 0 ? seconds : 0;
    updateTimerInterval();
}

int UsageAgentService::pollIntervalMs() const
{
    if (m_pollIntervalOverrideSecs > 0) {
        return secsToIntervalMs(m_pollIntervalOverrideSecs);
    }

    Profile active;
    if (m_profiles.getActive(active) && active.refreshIntervalSecs > 0) {
        return secsToIntervalMs(active.refreshIntervalSecs);
    }

    return secsToIntervalMs(m_store.loadSettings(QUuid())->refreshIntervalSecs);
}

void UsageAgentService::updateTimerInterval()
{
    int interval = pollIntervalMs();
    if (m_pollTimer.interval() != interval) {
        LOG_DEBUG(QString("Poll interval set to %1 ms").arg(interval));
        m_pollTimer.setInterval(interval);
    }
}

bool UsageAgentService::pollNow()
{
    if (!m_fetcher) {
        LOG_ERROR("No usage fetcher provided");
        return false;
    }

    // Without an active profile the legacy single-profile scope is used
    Profile active;
    QUuid profileId;
    if (m_profiles.getActive(active)) {
        profileId = active.id;
        m_fetcher->setCredentials(active.credentials);
    } else {
        m_fetcher->setCredentials(ProfileCredentials());
    }

    UsageSnapshot snapshot;
    QString error;
    if (!m_fetcher->fetchUsageData(snapshot, error)) {
        LOG_WARNING("Usage fetch failed: " + error);
        emit fetchFailed(error);
        return false;
    }

    SaveResult result = m_store.saveSnapshot(profileId, snapshot);
    if (result == SaveResult::WriteFailed) {
        emit fetchFailed("Snapshot could not be stored");
        return false;
    }
    if (result == SaveResult::DiscardedStale) {
        return false;
    }

    if (!profileId.isNull() && m_profiles.updateCachedUsage(profileId, snapshot) != StorageError::None) {
        LOG_WARNING(QString("Could not cache usage on profile '%1'").arg(active.name));
    }

    LOG_INFO(QString("Published usage: session %1%, weekly %2%")
             .arg(snapshot.sessionPercentage).arg(snapshot.weeklyPercentage));
    emit snapshotPublished(profileId, snapshot.capturedAt);
    return true;
}

void UsageAgentService::onPollTimer()
{
    pollNow();
    updateTimerInterval();
}

void UsageAgentService::onActiveProfileChanged(const QUuid& id)
{
    LOG_INFO(QString("Active profile changed to %1").arg(id.isNull() ? QString("none") : id.toString()));
    updateTimerInterval();
}
