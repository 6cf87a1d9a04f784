#include "logger/logger.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

// Initialize static member to nullptr
Logger* Logger::m_instance = nullptr;

// Double-checked locking around the lazily created instance
Logger* Logger::instance() {
    if (m_instance == nullptr) {
        static QMutex mutex;
        QMutexLocker locker(&mutex);

        // Check again after locking
        if (m_instance == nullptr) {
            m_instance = new Logger();
        }
    }
    return m_instance;
}

Logger::LogLevel Logger::levelFromString(const QString& name, bool* ok) {
    const QString normalized = name.trimmed().toLower();
    if (ok) {
        *ok = true;
    }

    if (normalized == "debug") {
        return Debug;
    } else if (normalized == "info") {
        return Info;
    } else if (normalized == "warning" || normalized == "warn") {
        return Warning;
    } else if (normalized == "error") {
        return Error;
    } else if (normalized == "fatal") {
        return Fatal;
    }

    if (ok) {
        *ok = false;
    }
    return Info;
}

Logger::Logger(QObject* parent)
    : QObject(parent)
    , m_logLevel(Info)
    , m_consoleOutput(true)
    , m_logFilePath("")
    , m_processTag("")
{
    // No file until setLogFile(): tile processes may run without a writable data location
}

Logger::~Logger() {
    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logFile.close();
    }
}

bool Logger::setLogFile(const QString& filePath) {
    QMutexLocker locker(&m_mutex);

    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logFile.close();
    }

    if (!openLogFile(filePath)) {
        qWarning() << "Failed to open log file:" << filePath;
        return false;
    }

    // Use direct logging without going through log() to avoid recursion on the mutex
    writeToLog(formatLogMessage(Info, QString("Log file opened: %1").arg(filePath), "", -1));
    return true;
}

bool Logger::openLogFile(const QString& filePath) {
    m_logFilePath = filePath;
    m_logFile.setFileName(filePath);

    QDir dir = QFileInfo(filePath).dir();
    if (!dir.exists() && !dir.mkpath(".")) {
        return false;
    }

    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return false;
    }

    m_logStream.setDevice(&m_logFile);
    return true;
}

void Logger::setLogLevel(LogLevel level) {
    QMutexLocker locker(&m_mutex);
    m_logLevel = level;
    writeToLog(formatLogMessage(Info, QString("Log level set to: %1").arg(logLevelToString(level)), "", -1));
}

void Logger::setProcessTag(const QString& tag) {
    QMutexLocker locker(&m_mutex);
    m_processTag = tag;
}

bool Logger::enableConsoleOutput(bool enable) {
    QMutexLocker locker(&m_mutex);
    m_consoleOutput = enable;
    return m_consoleOutput;
}

void Logger::debug(const QString& message, const QString& source, int line) {
    log(Debug, message, source, line);
}

void Logger::info(const QString& message, const QString& source, int line) {
    log(Info, message, source, line);
}

void Logger::warning(const QString& message, const QString& source, int line) {
    log(Warning, message, source, line);
}

void Logger::error(const QString& message, const QString& source, int line) {
    log(Error, message, source, line);
}

void Logger::fatal(const QString& message, const QString& source, int line) {
    log(Fatal, message, source, line);
}

void Logger::log(LogLevel level, const QString& message, const QString& source, int line) {
    QMutexLocker locker(&m_mutex);

    if (level < m_logLevel) {
        return;
    }

    QString formattedMessage = formatLogMessage(level, message, source, line);
    writeToLog(formattedMessage);

    if (m_consoleOutput) {
        switch (level) {
            case Debug:
                qDebug().noquote() << formattedMessage;
                break;
            case Info:
                qInfo().noquote() << formattedMessage;
                break;
            case Warning:
                qWarning().noquote() << formattedMessage;
                break;
            case Error:
            case Fatal:
                qCritical().noquote() << formattedMessage;
                break;
        }
    }
}

void Logger::logData(LogLevel level, const QMap<QString, QVariant>& data, const QString& source, int line) {
    if (level < getLogLevel()) {
        return;
    }

    QStringList logParts;
    for (auto it = data.constBegin(); it != data.constEnd(); ++it) {
        logParts.append(QString("%1: %2").arg(it.key(), it.value().toString()));
    }

    log(level, logParts.join(", "), source, line);
}

QString Logger::logLevelToString(LogLevel level) const {
    switch (level) {
        case Debug:   return "DEBUG";
        case Info:    return "INFO";
        case Warning: return "WARNING";
        case Error:   return "ERROR";
        case Fatal:   return "FATAL";
        default:      return "UNKNOWN";
    }
}

QString Logger::formatLogMessage(LogLevel level, const QString& message, const QString& source, int line) const {
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    QString pid = QString::number(QCoreApplication::applicationPid());
    QString threadId = QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()));
    QString levelStr = logLevelToString(level);
    QString tag = m_processTag.isEmpty() ? QString() : QString("[%1] ").arg(m_processTag);

    if (source.isEmpty()) {
        return QString("[%1] [%2] [PID:%3] [TID:%4] %5%6")
            .arg(timestamp, levelStr, pid, threadId, tag, message);
    }

    // Q_FUNC_INFO gives the full signature; keep "Class::method"
    QString sourceInfo = source;
    int parenPos = sourceInfo.indexOf('(');
    if (parenPos > 0) {
        sourceInfo = sourceInfo.left(parenPos);
    }

    // Drop the return type and qualifiers preceding the qualified name
    static const QRegularExpression qualifiedName("([A-Za-z0-9_]+::)*[A-Za-z0-9_~]+$");
    QRegularExpressionMatch match = qualifiedName.match(sourceInfo);
    if (match.hasMatch()) {
        sourceInfo = match.captured(0);
    }

    // Constructors appear as "ClassName::ClassName"
    QStringList parts = sourceInfo.split("::");
    if (parts.size() >= 2 && parts[parts.size() - 2] == parts[parts.size() - 1]) {
        sourceInfo = parts[parts.size() - 2] + "::constructor";
    }

    if (line >= 0) {
        sourceInfo += QString(":%1").arg(line);
    }

    return QString("[%1] [%2] [PID:%3] [TID:%4] %5[%6] %7")
        .arg(timestamp, levelStr, pid, threadId, tag, sourceInfo, message);
}

void Logger::writeToLog(const QString& message) {
    // Always called with m_mutex held
    if (m_logFile.isOpen()) {
        m_logStream << message << Qt::endl;
        m_logStream.flush();
    }
}

Logger::LogLevel Logger::getLogLevel() const {
    QMutexLocker locker(&m_mutex);
    return m_logLevel;
}

QString Logger::getLogFilePath() const {
    QMutexLocker locker(&m_mutex);
    return m_logFilePath;
}

QString Logger::getProcessTag() const {
    QMutexLocker locker(&m_mutex);
    return m_processTag;
}

bool Logger::isConsoleOutputEnabled() const {
    QMutexLocker locker(&m_mutex);
    return m_consoleOutput;
}
