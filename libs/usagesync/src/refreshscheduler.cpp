#include "usagesync/refreshscheduler.h"
#include "logger/logger.h"

RefreshScheduler::RefreshScheduler(RenderModelBuilder& builder, TileFamily family, QObject *parent)
    : QObject(parent)
    , m_builder(builder)
    , m_family(family)
    , m_currentState(Idle)
{
}

int RefreshScheduler::refreshIntervalSecs(TileFamily family)
{
    return family == TileFamily::Large ? LargeRefreshSecs : CompactRefreshSecs;
}

QString RefreshScheduler::stateToString(State state)
{
    switch (state) {
        case Idle:      return "Idle";
        case Rendering: return "Rendering";
        case Scheduled: return "Scheduled";
    }
    return "Unknown";
}

bool RefreshScheduler::familyFromString(const QString& value, TileFamily& family)
{
    const QString lowered = value.trimmed().toLower();
    if (lowered == "small") {
        family = TileFamily::Small;
    } else if (lowered == "medium") {
        family = TileFamily::Medium;
    } else if (lowered == "large") {
        family = TileFamily::Large;
    } else {
        return false;
    }
    return true;
}

TimelineEntry RefreshScheduler::invoke(const QUuid& profileId, const QDateTime& now)
{
    transitionToState(Rendering);

    TimelineEntry entry;
    entry.model = m_builder.build(profileId, now);
    entry.nextRefresh = now.addSecs(refreshIntervalSecs(m_family));

    LOG_DEBUG(QString("Rendered %1 model, next refresh at %2")
              .arg(entry.model.hasSnapshot ? "usage" : "empty", entry.nextRefresh.toString(Qt::ISODate)));

    transitionToState(Scheduled);
    return entry;
}

void RefreshScheduler::transitionToState(State newState)
{
    if (m_currentState != newState) {
        State oldState = m_currentState;
        m_currentState = newState;
        LOG_DEBUG(QString("Scheduler state %1 -> %2").arg(stateToString(oldState), stateToString(newState)));
        emit stateChanged(static_cast<int>(newState), static_cast<int>(oldState));
    }
}
