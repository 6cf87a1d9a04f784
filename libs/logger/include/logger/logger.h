#pragma once

#include <QObject>
#include <QString>
#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QMutex>
#include <QDebug>
#include <QMap>
#include <QVariant>
#include <QThread>

// Define the logger_global macro for export/import
#if defined(_MSC_VER) || defined(WIN64) || defined(_WIN64) || defined(__WIN64__) || defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
#  define DECL_EXPORT __declspec(dllexport)
#  define DECL_IMPORT __declspec(dllimport)
#else
#  define DECL_EXPORT     __attribute__((visibility("default")))
#  define DECL_IMPORT     __attribute__((visibility("default")))
#endif

#if defined(LOGGER_LIBRARY)
#  define LOGGER_EXPORT DECL_EXPORT
#else
#  define LOGGER_EXPORT DECL_IMPORT
#endif

/**
 * @brief Singleton logger shared by the agent and the tile processes
 *
 * Every process that touches the shared tiers writes to its own log file.
 * Lines carry a process tag so that interleaved logs of the background agent
 * and short-lived tile invocations can be told apart.
 */
class LOGGER_EXPORT Logger : public QObject {
    Q_OBJECT
public:
    /**
     * @brief Log levels supported by the logger
     */
    enum LogLevel {
        Debug,    ///< Detailed debugging information
        Info,     ///< General informational messages
        Warning,  ///< Warning messages for potentially harmful situations
        Error,    ///< Error messages for serious problems
        Fatal     ///< Critical errors that may cause program termination
    };

    /**
     * @brief Gets the singleton instance of the logger
     * @return Pointer to the Logger instance
     */
    static Logger* instance();

    /**
     * @brief Parses a configuration string ("debug", "info", ...) into a level
     * @param name Level name, case-insensitive
     * @param ok Set to false when the name is not recognized
     * @return The parsed level, Info when the name is not recognized
     */
    static LogLevel levelFromString(const QString& name, bool* ok = nullptr);

    /**
     * @brief Sets the output log file path
     * @param filePath The full path to the log file
     * @return True if the file could be opened for appending
     */
    bool setLogFile(const QString& filePath);

    /**
     * @brief Sets the minimum log level for message filtering
     * @param level The minimum LogLevel to output
     */
    void setLogLevel(LogLevel level);

    /**
     * @brief Sets the tag identifying the process role in every line
     * @param tag Short role name such as "agent" or "tile"
     */
    void setProcessTag(const QString& tag);

    /**
     * @brief Enables or disables console output
     * @param enable True to enable console output, false to disable
     * @return The new console output state
     */
    bool enableConsoleOutput(bool enable);

    void debug(const QString& message, const QString& source = QString(), int line = -1);
    void info(const QString& message, const QString& source = QString(), int line = -1);
    void warning(const QString& message, const QString& source = QString(), int line = -1);
    void error(const QString& message, const QString& source = QString(), int line = -1);
    void fatal(const QString& message, const QString& source = QString(), int line = -1);

    /**
     * @brief Logs a message at the given level
     * @param level The log level
     * @param message The log message
     * @param source The source function or class name
     * @param line The source line, or -1
     */
    void log(LogLevel level, const QString& message, const QString& source = QString(), int line = -1);

    /**
     * @brief Logs a message with key-value pairs
     * @param level The log level
     * @param data The key-value pairs to log
     * @param source The source function or class name
     * @param line The source line, or -1
     */
    void logData(LogLevel level, const QMap<QString, QVariant>& data, const QString& source = QString(), int line = -1);

    LogLevel getLogLevel() const;
    QString getLogFilePath() const;
    QString getProcessTag() const;
    bool isConsoleOutputEnabled() const;

private:
    explicit Logger(QObject* parent = nullptr);
    ~Logger();

    static Logger* m_instance;
    QFile m_logFile;
    QTextStream m_logStream;
    LogLevel m_logLevel;
    bool m_consoleOutput;
    mutable QMutex m_mutex;
    QString m_logFilePath;
    QString m_processTag;

    QString logLevelToString(LogLevel level) const;
    QString formatLogMessage(LogLevel level, const QString& message, const QString& source, int line) const;
    bool openLogFile(const QString& filePath);
    void writeToLog(const QString& message);
};

// Convenience macros
#define LOG_DEBUG(msg) Logger::instance()->debug(msg, Q_FUNC_INFO, __LINE__)
#define LOG_INFO(msg) Logger::instance()->info(msg, Q_FUNC_INFO, __LINE__)
#define LOG_WARNING(msg) Logger::instance()->warning(msg, Q_FUNC_INFO, __LINE__)
#define LOG_ERROR(msg) Logger::instance()->error(msg, Q_FUNC_INFO, __LINE__)
#define LOG_FATAL(msg) Logger::instance()->fatal(msg, Q_FUNC_INFO, __LINE__)

// Macro for logging with data
#define LOG_DATA(level, data) Logger::instance()->logData(level, data, Q_FUNC_INFO, __LINE__)
