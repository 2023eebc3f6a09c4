#include "log_manager.h"
#include <QMutexLocker>
#include <QThread>
#include <QDir>
#include <QFileInfo>

#include <cstdio>
#include <cstdlib>

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(FLUSH_INTERVAL_MS);
    connect(&m_flushTimer, &QTimer::timeout, this, &LogManager::flushPending);
}

LogManager::~LogManager() {
    QMutexLocker locker(&m_mutex);
    if (m_ts.device()) {
        m_ts.flush();
    }
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

bool LogManager::setLogFile(const QString& path) {
    QMutexLocker locker(&m_mutex);
    if (m_ts.device()) {
        m_ts.flush();
        m_ts.setDevice(nullptr);
    }
    if (m_file.isOpen()) m_file.close();
    if (path.isEmpty()) return true;

    QDir().mkpath(QFileInfo(path).absolutePath());
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start " << QDateTime::currentDateTime().toString(Qt::ISODate) << " ---\n";
    m_ts.flush();
    return true;
}

void LogManager::addLog(const QString& message, const QString& level) {
    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, level, message);
        m_logs.append(logEntry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }

        // Write-through to disk log with buffered flushing
        if (m_ts.device()) {
            m_ts << logEntry << '\n';
            m_pendingFlush = true;
            if (shouldFlushImmediately(level)) {
                m_ts.flush();
                m_pendingFlush = false;
            }
        }

        if (m_echo) {
            fprintf(stderr, "%s\n", logEntry.toLocal8Bit().constData());
            fflush(stderr);
        }
    } // unlock before emitting signals

    emit logAdded(logEntry);
    scheduleFlush(level);
}

void LogManager::flushPending() {
    QMutexLocker locker(&m_mutex);
    if (!m_ts.device()) {
        m_pendingFlush = false;
        return;
    }
    if (m_pendingFlush) {
        m_ts.flush();
        m_pendingFlush = false;
    }
}

bool LogManager::shouldFlushImmediately(const QString& level) const {
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

void LogManager::scheduleFlush(const QString& level) {
    if (shouldFlushImmediately(level)) {
        return; // already flushed in addLog
    }
    {
        QMutexLocker locker(&m_mutex);
        if (!m_ts.device() || !m_pendingFlush) return;
    }

    // The timer lives on the manager's thread; callers may be on the batch worker
    if (QThread::currentThread() == thread()) {
        if (!m_flushTimer.isActive()) m_flushTimer.start(FLUSH_INTERVAL_MS);
    } else {
        QMetaObject::invokeMethod(this, [this]() {
            if (!m_flushTimer.isActive()) m_flushTimer.start(FLUSH_INTERVAL_MS);
        }, Qt::QueuedConnection);
    }
}

void LogManager::clear() {
    QMutexLocker locker(&m_mutex);
    m_logs.clear();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    QString level;
    switch (type) {
        case QtDebugMsg:
            level = "DEBUG";
            break;
        case QtInfoMsg:
            level = "INFO";
            break;
        case QtWarningMsg:
            level = "WARN";
            break;
        case QtCriticalMsg:
            level = "ERROR";
            break;
        case QtFatalMsg:
            level = "FATAL";
            break;
    }

    LogManager::instance().addLog(msg, level);

    if (type == QtFatalMsg) {
        fprintf(stderr, "[FATAL] %s\n", msg.toLocal8Bit().constData());
        fflush(stderr);
        abort();
    }
}
