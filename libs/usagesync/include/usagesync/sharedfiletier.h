#pragma once
#include <QMutex>
#include "storagetier.h"

// One JSON file per key inside a directory every cooperating process can reach.
class SharedFileTier : public StorageTier {
public:
    explicit SharedFileTier(const QString& directory);

    QString name() const override { return "file"; }
    StorageError write(const QString& key, const QByteArray& data) override;
    StorageError read(const QString& key, QByteArray& data) const override;
    StorageError remove(const QString& key) override;

    QString directory() const { return m_directory; }
    QString filePath(const QString& key) const;

private:
    QString m_directory;
    mutable QMutex m_mutex;
};
