#include "usagesync/sharedfiletier.h"
#include "logger/logger.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>

SharedFileTier::SharedFileTier(const QString& directory)
    : m_directory(QDir::cleanPath(directory))
{
}

QString SharedFileTier::filePath(const QString& key) const
{
    // "profiles/<id>/snapshot" maps onto subdirectories
    return m_directory + "/" + key + ".json";
}

StorageError SharedFileTier::write(const QString& key, const QByteArray& data)
{
    QMutexLocker locker(&m_mutex);

    const QString path = filePath(key);
    QDir dir = QFileInfo(path).dir();
    if (!dir.exists() && !dir.mkpath(".")) {
        LOG_ERROR(QString("Failed to create shared directory: %1").arg(dir.path()));
        return StorageError::WriteFailed;
    }

    // Full replacement in a single pass; a concurrent reader may observe a torn file
    // and must treat it as a decode error
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(QString("Failed to open %1 for writing: %2").arg(path, file.errorString()));
        return StorageError::WriteFailed;
    }

    qint64 bytesWritten = file.write(data);
    bool flushed = file.flush();
    file.close();

    if (bytesWritten != data.size() || !flushed) {
        LOG_ERROR(QString("Incomplete write to %1 (%2 of %3 bytes)")
                  .arg(path).arg(bytesWritten).arg(data.size()));
        return StorageError::WriteFailed;
    }

    LOG_DEBUG(QString("Wrote %1 bytes to %2").arg(data.size()).arg(path));
    return StorageError::None;
}

StorageError SharedFileTier::read(const QString& key, QByteArray& data) const
{
    QMutexLocker locker(&m_mutex);

    QFile file(filePath(key));
    if (!file.exists()) {
        return StorageError::NotFound;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARNING(QString("Failed to open %1: %2").arg(file.fileName(), file.errorString()));
        return StorageError::NotFound;
    }

    data = file.readAll();
    file.close();
    return StorageError::None;
}

StorageError SharedFileTier::remove(const QString& key)
{
    QMutexLocker locker(&m_mutex);

    QFile file(filePath(key));
    if (!file.exists()) {
        return StorageError::NotFound;
    }

    if (!file.remove()) {
        LOG_WARNING(QString("Failed to remove %1: %2").arg(file.fileName(), file.errorString()));
        return StorageError::WriteFailed;
    }
    return StorageError::None;
}
