#pragma once
#include <QMutex>
#include <QSettings>
#include <QVariant>
#include <memory>
#include "storagetier.h"

/**
 * @brief Flat string-keyed register shared by every process of the same user
 *
 * Backed by QSettings: the platform's native per-user preferences store when
 * constructed with a suite name, or an INI file when constructed with a path.
 * Every write is synced before returning so a tile process started right
 * after observes it; every read re-syncs to pick up other processes' writes.
 */
class KeyValueTier : public StorageTier {
public:
    static KeyValueTier* createNative(const QString& organization, const QString& suite);
    static KeyValueTier* createIni(const QString& iniPath);

    ~KeyValueTier() override;

    QString name() const override { return "key-value"; }
    StorageError write(const QString& key, const QByteArray& data) override;
    StorageError read(const QString& key, QByteArray& data) const override;
    StorageError remove(const QString& key) override;

    // Primitive values for the per-field legacy keys
    StorageError setValue(const QString& key, const QVariant& value);
    StorageError value(const QString& key, QVariant& value) const;
    bool contains(const QString& key) const;

    QString location() const;

private:
    explicit KeyValueTier(QSettings* settings);
    bool syncLocked() const;

    std::unique_ptr<QSettings> m_settings;
    mutable QMutex m_mutex;
};
