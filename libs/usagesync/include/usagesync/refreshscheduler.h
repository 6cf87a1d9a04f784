#pragma once
#include <QObject>
#include <QDateTime>
#include <QUuid>
#include "rendermodel.h"

struct TimelineEntry {
    RenderModel model;
    QDateTime nextRefresh;
};

/**
 * @brief Display-side render cycle
 *
 * Purely reactive: the host invokes the process, invoke() renders once and
 * returns the earliest time the host should invoke it again. There is no
 * internal timer because the process does not outlive the invocation.
 */
class RefreshScheduler : public QObject
{
    Q_OBJECT
public:
    enum State {
        Idle = 0,
        Rendering = 1,
        Scheduled = 2
    };
    Q_ENUM(State)

    enum class TileFamily {
        Small,
        Medium,
        Large
    };

    static constexpr int CompactRefreshSecs = 15 * 60;
    static constexpr int LargeRefreshSecs = 30 * 60;

    RefreshScheduler(RenderModelBuilder& builder, TileFamily family, QObject *parent = nullptr);

    TimelineEntry invoke(const QUuid& profileId, const QDateTime& now);

    State currentState() const { return m_currentState; }
    TileFamily family() const { return m_family; }

    static int refreshIntervalSecs(TileFamily family);
    static QString stateToString(State state);
    static bool familyFromString(const QString& value, TileFamily& family);

signals:
    void stateChanged(int newState, int oldState);

private:
    void transitionToState(State newState);

    RenderModelBuilder& m_builder;
    TileFamily m_family;
    State m_currentState;
};
