#pragma once

#include <QObject>
#include <QVector>
#include <QStringList>

#include <atomic>

#include "conversion_engine.h"
#include "session_report.h"

struct ConversionProfile;
class ProcessRunner;

// What would happen to one discovered file.
struct OutputPlan {
    QString name;
    QString sourcePath;
    QString outputPath;         // empty when it cannot be resolved
    bool needsConversion = false;
    QString skipReason;
    QVector<MediaInfo::SubtitleTrack> subtitles;
};

// Sequential batch driver. runBatch() blocks until every file is processed or the
// batch is cancelled; run it on a worker thread to keep an event loop responsive.
class BatchOrchestrator : public QObject {
    Q_OBJECT
public:
    BatchOrchestrator(const ConversionProfile& profile, ProcessRunner& runner, QObject* parent = nullptr);

    void setDryRun(bool dryRun) { m_dryRun = dryRun; }

    // False for an unsupported extension, or when overwriting is off and the output exists.
    bool needsConversion(const QString& path, QString* reason = nullptr) const;

    OutputPlan planFor(const QString& path) const;
    // planFor() for every file, plus the subtitle tracks of each source.
    QVector<OutputPlan> preparePlan(const QStringList& files) const;

    SessionReport runBatch(const QStringList& files);

    // Stops the batch before the next file. A running tool invocation is not interrupted.
    // The request sticks: a cancel issued before runBatch() starts is honoured.
    void cancel() { m_cancelRequested.store(true); }
    bool isCancelled() const { return m_cancelRequested.load(); }

signals:
    void batchStarted(int total);
    void fileStarted(int index, int total, const QString& srcPath);
    void fileFinished(int index, bool success, const QString& message);
    void batchFinished(int converted, int skipped, int failed);

private:
    void processFile(int index, int total, const QString& path, SessionReport& report);

    const ConversionProfile& m_profile;
    ConversionEngine m_engine;
    bool m_dryRun = false;
    std::atomic<bool> m_cancelRequested{false};
};
