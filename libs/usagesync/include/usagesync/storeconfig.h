#pragma once
#include <QString>

// Tier locations and cache policy shared by every process of one installation.
class StoreConfig {
public:
    StoreConfig();

    static StoreConfig fromEnvironment();
    static StoreConfig fromFile(const QString& configPath);

    static QString defaultSharedDirectory();

    QString sharedDirectory() const { return m_sharedDirectory; }
    // Empty selects the platform's native per-user store
    QString keyValuePath() const { return m_keyValuePath; }
    QString organization() const { return m_organization; }
    QString suiteName() const { return m_suiteName; }
    int settingsTtlMs() const { return m_settingsTtlMs; }
    bool mirrorSnapshotToKeyValue() const { return m_mirrorSnapshotToKeyValue; }

    void setSharedDirectory(const QString& directory) { m_sharedDirectory = directory; }
    void setKeyValuePath(const QString& path) { m_keyValuePath = path; }
    void setSuiteName(const QString& organization, const QString& suite);
    void setSettingsTtlMs(int ttlMs) { m_settingsTtlMs = ttlMs; }
    void setMirrorSnapshotToKeyValue(bool mirror) { m_mirrorSnapshotToKeyValue = mirror; }

private:
    QString m_sharedDirectory;
    QString m_keyValuePath;
    QString m_organization;
    QString m_suiteName;
    int m_settingsTtlMs;
    bool m_mirrorSnapshotToKeyValue;
};
