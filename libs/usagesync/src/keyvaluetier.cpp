#include "usagesync/keyvaluetier.h"
#include "logger/logger.h"
#include <QDir>
#include <QFileInfo>

KeyValueTier* KeyValueTier::createNative(const QString& organization, const QString& suite)
{
    LOG_DEBUG(QString("Using native key-value store %1/%2").arg(organization, suite));
    return new KeyValueTier(new QSettings(QSettings::NativeFormat, QSettings::UserScope, organization, suite));
}

KeyValueTier* KeyValueTier::createIni(const QString& iniPath)
{
    QDir dir = QFileInfo(iniPath).dir();
    if (!dir.exists() && !dir.mkpath(".")) {
        LOG_WARNING(QString("Could not create directory for key-value file: %1").arg(dir.path()));
    }

    LOG_DEBUG(QString("Using key-value file %1").arg(iniPath));
    return new KeyValueTier(new QSettings(iniPath, QSettings::IniFormat));
}

KeyValueTier::KeyValueTier(QSettings* settings)
    : m_settings(settings)
{
}

KeyValueTier::~KeyValueTier() = default;

QString KeyValueTier::location() const
{
    QMutexLocker locker(&m_mutex);
    return m_settings->fileName();
}

bool KeyValueTier::syncLocked() const
{
    m_settings->sync();

    QSettings::Status status = m_settings->status();
    if (status != QSettings::NoError) {
        LOG_WARNING(QString("Key-value store %1 reported status %2")
                    .arg(m_settings->fileName()).arg(static_cast<int>(status)));
        return false;
    }
    return true;
}

StorageError KeyValueTier::write(const QString& key, const QByteArray& data)
{
    return setValue(key, QVariant(data));
}

StorageError KeyValueTier::read(const QString& key, QByteArray& data) const
{
    QVariant stored;
    StorageError result = value(key, stored);
    if (result != StorageError::None) {
        return result;
    }

    data = stored.toByteArray();
    return StorageError::None;
}

StorageError KeyValueTier::remove(const QString& key)
{
    QMutexLocker locker(&m_mutex);

    m_settings->sync();

    m_settings->beginGroup(key);
    bool isGroup = !m_settings->allKeys().isEmpty();
    m_settings->endGroup();

    if (!isGroup && !m_settings->contains(key)) {
        return StorageError::NotFound;
    }

    // Removes the key and, for a group prefix, everything below it
    m_settings->remove(key);
    return syncLocked() ? StorageError::None : StorageError::WriteFailed;
}

StorageError KeyValueTier::setValue(const QString& key, const QVariant& value)
{
    QMutexLocker locker(&m_mutex);

    m_settings->setValue(key, value);
    if (!syncLocked()) {
        LOG_ERROR(QString("Failed to persist key '%1'").arg(key));
        return StorageError::WriteFailed;
    }
    return StorageError::None;
}

StorageError KeyValueTier::value(const QString& key, QVariant& value) const
{
    QMutexLocker locker(&m_mutex);

    // Reload to observe writes made by other processes since the last read
    if (!syncLocked()) {
        return StorageError::NotFound;
    }

    if (!m_settings->contains(key)) {
        return StorageError::NotFound;
    }

    value = m_settings->value(key);
    return StorageError::None;
}

bool KeyValueTier::contains(const QString& key) const
{
    QMutexLocker locker(&m_mutex);
    m_settings->sync();
    return m_settings->contains(key);
}
