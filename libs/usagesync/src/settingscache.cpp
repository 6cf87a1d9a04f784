#include "usagesync/settingscache.h"
#include "logger/logger.h"

SettingsCache::SettingsCache()
    : m_clock([]() { return QDateTime::currentMSecsSinceEpoch(); })
{
}

SettingsCache::SettingsCache(Clock clock)
    : m_clock(std::move(clock))
{
}

SettingsCache::Value SettingsCache::getOrLoad(const QString& key, const Loader& loader, int ttlMs)
{
    QMutexLocker locker(&m_mutex);

    const qint64 now = m_clock();
    auto it = m_entries.constFind(key);
    if (it != m_entries.constEnd() && now - it->storedAtMs < ttlMs) {
        return it->value;
    }

    // The loader runs under the lock so concurrent callers do not load twice
    Value value = loader();
    if (value.isNull()) {
        LOG_DEBUG(QString("Settings loader for '%1' failed, not caching").arg(key));
        m_entries.remove(key);
        return value;
    }

    m_entries.insert(key, Entry{ value, now });
    return value;
}

void SettingsCache::invalidate(const QString& key)
{
    QMutexLocker locker(&m_mutex);
    m_entries.remove(key);
}

void SettingsCache::clear()
{
    QMutexLocker locker(&m_mutex);
    m_entries.clear();
}

int SettingsCache::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_entries.size();
}
