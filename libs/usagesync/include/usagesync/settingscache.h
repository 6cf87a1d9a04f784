#pragma once
#include <QDateTime>
#include <QMap>
#include <QMutex>
#include <QSharedPointer>
#include <QString>
#include <functional>
#include "usagesettings.h"

/**
 * @brief Short-lived memoization of settings reads
 *
 * Display processes re-read settings many times while rendering one frame; the
 * cache collapses those reads into one tier access per TTL window. A loader
 * returning null is treated as a failure and is not cached.
 */
class SettingsCache {
public:
    typedef QSharedPointer<const UsageSettings> Value;
    typedef std::function<Value()> Loader;
    typedef std::function<qint64()> Clock;

    static constexpr int DefaultTtlMs = 1000;

    SettingsCache();
    explicit SettingsCache(Clock clock);

    Value getOrLoad(const QString& key, const Loader& loader, int ttlMs = DefaultTtlMs);
    void invalidate(const QString& key);
    void clear();

    int size() const;

private:
    struct Entry {
        Value value;
        qint64 storedAtMs;
    };

    Clock m_clock;
    QMap<QString, Entry> m_entries;
    mutable QMutex m_mutex;
};
