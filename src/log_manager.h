#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QDateTime>
#include <QFile>
#include <QTextStream>
#include <QTimer>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    QStringList logs() const;

    // Safe to call from the batch worker thread.
    void addLog(const QString& message, const QString& level = "INFO");
    void clear();

    // Opens (appends to) a persistent log file. Returns false if it cannot be opened.
    bool setLogFile(const QString& path);
    void setEchoToStderr(bool on) { m_echo = on; }

signals:
    void logAdded(const QString& message);

private:
    explicit LogManager(QObject* parent = nullptr);
    void flushPending();
    void scheduleFlush(const QString& level);
    bool shouldFlushImmediately(const QString& level) const;

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QTimer m_flushTimer;
    bool m_pendingFlush = false;
    bool m_echo = false;
    static constexpr int MAX_LOGS = 1000;
    static constexpr int FLUSH_INTERVAL_MS = 250;
};

// Custom message handler for qDebug/qWarning/qCritical
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
