#pragma once
#include <QString>
#include <QByteArray>

enum class StorageError {
    None,
    NotFound,     // no data in the tier, a normal condition
    DecodeError,  // data present but unparseable, handled like NotFound by readers
    WriteFailed
};

QString storageErrorToString(StorageError error);

/**
 * @brief One storage backend in the persistence fallback chain
 *
 * Implementations never throw: every I/O failure is reported as NotFound on
 * read and WriteFailed on write. A write is visible to other processes when
 * it returns.
 */
class StorageTier {
public:
    virtual ~StorageTier() = default;

    virtual QString name() const = 0;
    virtual StorageError write(const QString& key, const QByteArray& data) = 0;
    virtual StorageError read(const QString& key, QByteArray& data) const = 0;
    virtual StorageError remove(const QString& key) = 0;
};
