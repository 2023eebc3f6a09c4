#pragma once
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QJsonObject>

struct ConversionOutcome;

// Session accumulator. Owned and mutated by the batch orchestrator only,
// once per processed file, between files.
class SessionReport {
public:
    enum class Mode { Normal, DryRun };

    SessionReport();

    void markComplete();
    void markDryRun() { m_mode = Mode::DryRun; }

    void setTotalFiles(int n) { m_totalFiles = n; }
    void addConverted() { ++m_converted; }
    void addSkipped() { ++m_skipped; }

    // Records a failed file in the bucket matching the outcome's failure reason.
    void addFailure(const ConversionOutcome& outcome);

    Mode mode() const { return m_mode; }
    QDateTime startTime() const { return m_startTime; }
    QDateTime endTime() const { return m_endTime; }
    qint64 durationSeconds() const;

    int totalFiles() const { return m_totalFiles; }
    int converted() const { return m_converted; }
    int skipped() const { return m_skipped; }
    int failed() const { return m_failed; }
    int genericFailures() const { return m_genericFailures; }
    int audioFailures() const { return m_audioFailures; }
    int retryFailures() const { return m_retryFailures; }
    QStringList failedFiles() const { return m_failedFiles; }
    QStringList audioFailedFiles() const { return m_audioFailedFiles; }

    QString summaryText() const;
    QJsonObject toJson() const;

    // Writes summaryText() to path, and toJson() to jsonPathFor(path).
    bool saveToFile(const QString& path, QString* errorMessage = nullptr) const;
    // Same base name with a .json suffix; never equal to textPath.
    static QString jsonPathFor(const QString& textPath);

private:
    Mode m_mode = Mode::Normal;
    QDateTime m_startTime;
    QDateTime m_endTime;

    int m_totalFiles = 0;
    int m_converted = 0;
    int m_skipped = 0;
    int m_failed = 0;
    int m_genericFailures = 0;
    int m_audioFailures = 0;
    int m_retryFailures = 0;
    QStringList m_failedFiles;
    QStringList m_audioFailedFiles;
};
