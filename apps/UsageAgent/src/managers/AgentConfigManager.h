#ifndef AGENTCONFIGMANAGER_H
#define AGENTCONFIGMANAGER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QSettings>
#include <QMutex>
#include "usagesync/storeconfig.h"

class AgentConfigManager : public QObject
{
    Q_OBJECT
public:
    explicit AgentConfigManager(QObject *parent = nullptr);
    ~AgentConfigManager();

    // Empty path selects USAGE_AGENT_CONFIG_DIR or the per-user config location
    bool initialize(const QString& configPath = QString());

    // Getters
    QString fetchCommand() const;
    QStringList fetchArguments() const;
    int fetchTimeoutMs() const;
    int pollIntervalSecs() const;
    QString logLevel() const;
    QString logFilePath() const;
    QString sharedDirectory() const;
    QString keyValuePath() const;
    QString configFilePath() const;

    // Setters
    void setFetchCommand(const QString& command);
    void setFetchArguments(const QStringList& arguments);
    void setFetchTimeoutMs(int milliseconds);
    void setPollIntervalSecs(int seconds);
    void setLogLevel(const QString& level);
    void setLogFilePath(const QString& path);
    void setSharedDirectory(const QString& directory);
    void setKeyValuePath(const QString& path);

    // Configuration operations
    bool loadLocalConfig();
    bool saveLocalConfig();

    // Environment store settings with this file's overrides applied
    StoreConfig storeConfig() const;

signals:
    void configChanged();

private:
    void loadDefaults();
    QString defaultConfigFilePath() const;
    bool configFileExists() const;

    QSettings* m_settings;
    mutable QMutex m_mutex;

    QString m_configPath;
    QString m_fetchCommand;
    QStringList m_fetchArguments;
    int m_fetchTimeoutMs;
    int m_pollIntervalSecs;
    QString m_logLevel;
    QString m_logFilePath;
    QString m_sharedDirectory;
    QString m_keyValuePath;
    bool m_initialized;
};

#endif // AGENTCONFIGMANAGER_H
