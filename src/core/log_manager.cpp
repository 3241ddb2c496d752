#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>
#include <QDebug>

namespace {

const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

QString timestampNow() {
    return QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
}

}

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

bool LogManager::initialize(const QString& logDir) {
    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen())
        m_logFile.close();

    QDir().mkpath(logDir);
    QString logPath = logDir + "/retry_classifier.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
        m_logFile.close();
        return false;
    }
    return true;
}

void LogManager::setMinimumLevel(Level level) {
    m_minLevel.storeRelaxed(level);
}

LogManager::Level LogManager::minimumLevel() const {
    return static_cast<Level>(m_minLevel.loadRelaxed());
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }
    if (!isEnabled(level))
        return;

    QString timestamp = timestampNow();
    QString formatted = QString("[%1] [%2] [%3] %4")
        .arg(timestamp, kLevelNames[level], category, message);

    {
        QMutexLocker locker(&m_mutex);

        // file output
        if (m_logFile.isOpen()) {
            QTextStream stream(&m_logFile);
            stream << formatted << "\n";
            stream.flush();
        }

        // ring buffer
        QVariantMap entry;
        entry["level"] = static_cast<int>(level);
        entry["timestamp"] = timestamp;
        entry["category"] = category;
        entry["message"] = message;
        m_buffer.append(entry);
        while (m_buffer.size() > m_maxBuffer)
            m_buffer.removeFirst();
    }

    // signal
    emit logEntry(static_cast<int>(level), timestamp, category, message);
}

QVariantList LogManager::recentLogs(int count) const {
    QMutexLocker locker(&m_mutex);
    QVariantList result;
    const qsizetype start = qMax<qsizetype>(0, m_buffer.size() - count);
    for (qsizetype i = start; i < m_buffer.size(); ++i)
        result.append(m_buffer[i]);
    return result;
}

void LogManager::clearLogs() {
    QMutexLocker locker(&m_mutex);
    m_buffer.clear();
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    return QString("[%1] [%2] [%3] %4")
        .arg(timestampNow(), kLevelNames[level], category, message);
}

std::optional<LogManager::Level> LogManager::parseLevel(const QString& name) {
    const QString token = name.trimmed().toLower();
    if (token == QLatin1String("debug"))
        return Debug;
    if (token == QLatin1String("info"))
        return Info;
    if (token == QLatin1String("warning") || token == QLatin1String("warn"))
        return Warning;
    if (token == QLatin1String("error"))
        return Error;
    return std::nullopt;
}
