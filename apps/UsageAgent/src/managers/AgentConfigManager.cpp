#include "AgentConfigManager.h"
#include "logger/logger.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcessEnvironment>
#include <QStandardPaths>

// Bounds applied when loading; values outside are corrected
static const int MinFetchTimeoutMs = 1000;
static const int MinPollIntervalSecs = 5;

AgentConfigManager::AgentConfigManager(QObject *parent)
    : QObject(parent)
    , m_settings(nullptr)
    , m_initialized(false)
{
    loadDefaults();
}

AgentConfigManager::~AgentConfigManager()
{
    delete m_settings;
}

bool AgentConfigManager::initialize(const QString& configPath)
{
    if (m_initialized) {
        LOG_WARNING("AgentConfigManager already initialized");
        return true;
    }

    LOG_INFO("Initializing AgentConfigManager");

    m_configPath = configPath.isEmpty() ? defaultConfigFilePath() : configPath;
    LOG_INFO("Config file path: " + m_configPath);

    QFileInfo fileInfo(m_configPath);
    QDir dir = fileInfo.dir();
    if (!dir.exists()) {
        LOG_INFO("Creating config directory: " + dir.path());
        if (!dir.mkpath(".")) {
            LOG_ERROR("Failed to create config directory");
            return false;
        }
    }

    m_settings = new QSettings(m_configPath, QSettings::IniFormat);

    if (m_settings->status() != QSettings::NoError) {
        LOG_ERROR("Error initializing QSettings: " + QString::number(m_settings->status()));
        return false;
    }

    m_initialized = true;
    return true;
}

void AgentConfigManager::loadDefaults()
{
    m_fetchCommand = "";
    m_fetchArguments.clear();
    m_fetchTimeoutMs = 30000;
    m_pollIntervalSecs = 0; // 0 follows the active profile's refresh interval
    m_logLevel = "info";
    m_logFilePath = "";
    m_sharedDirectory = "";
    m_keyValuePath = "";
}

QString AgentConfigManager::defaultConfigFilePath() const
{
    QString configDir = QProcessEnvironment::systemEnvironment().value("USAGE_AGENT_CONFIG_DIR");
    if (configDir.isEmpty()) {
        configDir = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation) + "/UsageSync";
    }
    return configDir + "/usage_agent.conf";
}

bool AgentConfigManager::configFileExists() const
{
    if (!m_settings) {
        LOG_ERROR("Settings object not initialized");
        return false;
    }

    QFile file(m_settings->fileName());
    return file.exists() && file.size() > 0;
}

bool AgentConfigManager::loadLocalConfig()
{
    LOG_INFO("Loading local configuration");

    if (!m_initialized) {
        LOG_ERROR("AgentConfigManager not initialized");
        return false;
    }

    if (configFileExists()) {
        LOG_INFO("Configuration file found: " + m_settings->fileName());
    } else {
        LOG_INFO("Configuration file not found, will use defaults");
        return saveLocalConfig();
    }

    {
        QMutexLocker locker(&m_mutex);

        m_settings->beginGroup("Fetch");
        m_fetchCommand = m_settings->value("Command", m_fetchCommand).toString();
        m_fetchArguments = m_settings->value("Arguments", m_fetchArguments).toStringList();
        m_fetchTimeoutMs = m_settings->value("TimeoutMs", m_fetchTimeoutMs).toInt();
        m_pollIntervalSecs = m_settings->value("PollIntervalSecs", m_pollIntervalSecs).toInt();
        m_settings->endGroup();

        m_settings->beginGroup("Log");
        m_logLevel = m_settings->value("Level", m_logLevel).toString();
        m_logFilePath = m_settings->value("FilePath", m_logFilePath).toString();
        m_settings->endGroup();

        m_settings->beginGroup("Store");
        m_sharedDirectory = m_settings->value("SharedDirectory", m_sharedDirectory).toString();
        m_keyValuePath = m_settings->value("KeyValuePath", m_keyValuePath).toString();
        m_settings->endGroup();

        if (m_fetchTimeoutMs < MinFetchTimeoutMs) {
            LOG_WARNING("Invalid TimeoutMs corrected from " + QString::number(m_fetchTimeoutMs)
                        + " to " + QString::number(MinFetchTimeoutMs));
            m_fetchTimeoutMs = MinFetchTimeoutMs;
        }

        if (m_pollIntervalSecs != 0 && m_pollIntervalSecs < MinPollIntervalSecs) {
            LOG_WARNING("Invalid PollIntervalSecs corrected from " + QString::number(m_pollIntervalSecs)
                        + " to " + QString::number(MinPollIntervalSecs));
            m_pollIntervalSecs = MinPollIntervalSecs;
        }
    }

    bool ok = false;
    Logger::LogLevel level = Logger::levelFromString(m_logLevel, &ok);
    if (ok) {
        Logger::instance()->setLogLevel(level);
    } else {
        LOG_WARNING("Unknown log level in configuration: " + m_logLevel);
    }

    if (!m_logFilePath.isEmpty() && !Logger::instance()->setLogFile(m_logFilePath)) {
        LOG_WARNING("Could not open configured log file: " + m_logFilePath);
    }

    LOG_INFO("Local configuration loaded successfully");
    return true;
}

bool AgentConfigManager::saveLocalConfig()
{
    if (!m_initialized || !m_settings) {
        LOG_ERROR("AgentConfigManager not initialized");
        return false;
    }

    LOG_INFO("Saving configuration to: " + m_settings->fileName());

    {
        QMutexLocker locker(&m_mutex);

        m_settings->beginGroup("Fetch");
        m_settings->setValue("Command", m_fetchCommand);
        m_settings->setValue("Arguments", m_fetchArguments);
        m_settings->setValue("TimeoutMs", m_fetchTimeoutMs);
        m_settings->setValue("PollIntervalSecs", m_pollIntervalSecs);
        m_settings->endGroup();

        m_settings->beginGroup("Log");
        m_settings->setValue("Level", m_logLevel);
        m_settings->setValue("FilePath", m_logFilePath);
        m_settings->endGroup();

        m_settings->beginGroup("Store");
        m_settings->setValue("SharedDirectory", m_sharedDirectory);
        m_settings->setValue("KeyValuePath", m_keyValuePath);
        m_settings->endGroup();

        m_settings->sync();
    }

    QSettings::Status status = m_settings->status();
    if (status != QSettings::NoError) {
        LOG_ERROR("Failed to save configuration, error code: " + QString::number(status));
        return false;
    }

    LOG_INFO("Configuration saved successfully");
    return true;
}

StoreConfig AgentConfigManager::storeConfig() const
{
    StoreConfig config = StoreConfig::fromEnvironment();

    QMutexLocker locker(&m_mutex);
    if (!m_sharedDirectory.isEmpty()) {
        config.setSharedDirectory(m_sharedDirectory);
    }
    if (!m_keyValuePath.isEmpty()) {
        config.setKeyValuePath(m_keyValuePath);
    }
    return config;
}

QString AgentConfigManager::fetchCommand() const
{
    QMutexLocker locker(&m_mutex);
    return m_fetchCommand;
}

QStringList AgentConfigManager::fetchArguments() const
{
    QMutexLocker locker(&m_mutex);
    return m_fetchArguments;
}

int AgentConfigManager::fetchTimeoutMs() const
{
    QMutexLocker locker(&m_mutex);
    return m_fetchTimeoutMs;
}

int AgentConfigManager::pollIntervalSecs() const
{
    QMutexLocker locker(&m_mutex);
    return m_pollIntervalSecs;
}

QString AgentConfigManager::logLevel() const
{
    QMutexLocker locker(&m_mutex);
    return m_logLevel;
}

QString AgentConfigManager::logFilePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_logFilePath;
}

QString AgentConfigManager::sharedDirectory() const
{
    QMutexLocker locker(&m_mutex);
    return m_sharedDirectory;
}

QString AgentConfigManager::keyValuePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_keyValuePath;
}

QString AgentConfigManager::configFilePath() const
{
    return m_configPath;
}

void AgentConfigManager::setFetchCommand(const QString& command)
{
    QMutexLocker locker(&m_mutex);
    if (m_fetchCommand != command) {
        m_fetchCommand = command;
        emit configChanged();
    }
}

void AgentConfigManager::setFetchArguments(const QStringList& arguments)
{
    QMutexLocker locker(&m_mutex);
    if (m_fetchArguments != arguments) {
        m_fetchArguments = arguments;
        emit configChanged();
    }
}

void AgentConfigManager::setFetchTimeoutMs(int milliseconds)
{
    QMutexLocker locker(&m_mutex);
    if (milliseconds >= MinFetchTimeoutMs && m_fetchTimeoutMs != milliseconds) {
        m_fetchTimeoutMs = milliseconds;
        emit configChanged();
    }
}

void AgentConfigManager::setPollIntervalSecs(int seconds)
{
    QMutexLocker locker(&m_mutex);
    if ((seconds == 0 || seconds >= MinPollIntervalSecs) && m_pollIntervalSecs != seconds) {
        m_pollIntervalSecs = seconds;
        emit configChanged();
    }
}

void AgentConfigManager::setLogLevel(const QString& level)
{
    QMutexLocker locker(&m_mutex);
    if (m_logLevel != level) {
        m_logLevel = level;
        emit configChanged();
    }
}

void AgentConfigManager::setLogFilePath(const QString& path)
{
    QMutexLocker locker(&m_mutex);
    if (m_logFilePath != path) {
        m_logFilePath = path;
        emit configChanged();
    }
}

void AgentConfigManager::setSharedDirectory(const QString& directory)
{
    QMutexLocker locker(&m_mutex);
    if (m_sharedDirectory != directory) {
        m_sharedDirectory = directory;
        emit configChanged();
    }
}

void AgentConfigManager::setKeyValuePath(const QString& path)
{
    QMutexLocker locker(&m_mutex);
    if (m_keyValuePath != path) {
        m_keyValuePath = path;
        emit configChanged();
    }
}
