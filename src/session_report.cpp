#include "session_report.h"
#include "conversion_engine.h"
#include "utils.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>

namespace {
const QString kRule = QString(60, QLatin1Char('='));
const QString kThinRule = QString(60, QLatin1Char('-'));
}

SessionReport::SessionReport()
    : m_startTime(QDateTime::currentDateTime())
{
}

void SessionReport::markComplete()
{
    m_endTime = QDateTime::currentDateTime();
}

qint64 SessionReport::durationSeconds() const
{
    return m_endTime.isValid() ? m_startTime.secsTo(m_endTime) : 0;
}

void SessionReport::addFailure(const ConversionOutcome& outcome)
{
    ++m_failed;
    m_failedFiles.append(outcome.sourcePath);

    switch (outcome.reason) {
        case ConversionOutcome::FailureReason::AudioValidation:
            ++m_audioFailures;
            m_audioFailedFiles.append(outcome.sourcePath);
            ++m_retryFailures;
            break;
        case ConversionOutcome::FailureReason::RetryExhausted:
            ++m_retryFailures;
            break;
        case ConversionOutcome::FailureReason::Generic:
        case ConversionOutcome::FailureReason::None:
            ++m_genericFailures;
            break;
    }
}

QString SessionReport::jsonPathFor(const QString& textPath)
{
    const QFileInfo fi(textPath);
    // summary.txt -> summary.json; summary.json -> summary.report.json
    const QString suffix = fi.suffix().compare("json", Qt::CaseInsensitive) == 0 ? ".report.json" : ".json";
    return QDir(fi.absolutePath()).filePath(fi.completeBaseName() + suffix);
}

QString SessionReport::summaryText() const
{
    QStringList lines;
    lines << kRule
          << "VIDEO CONVERSION SUMMARY"
          << kRule
          << QString("Mode:       %1").arg(m_mode == Mode::DryRun ? "DRY_RUN" : "NORMAL")
          << QString("Start Time: %1").arg(m_startTime.toString(Qt::ISODate))
          << QString("End Time:   %1").arg(m_endTime.isValid() ? m_endTime.toString(Qt::ISODate) : QString("-"))
          << QString("Duration:   %1").arg(Utils::formatDuration(durationSeconds()))
          << kThinRule
          << QString("Total Files Found:        %1").arg(m_totalFiles)
          << QString("Converted Successfully:   %1").arg(m_converted)
          << QString("Skipped (no conversion):  %1").arg(m_skipped)
          << QString("Failed (total):           %1").arg(m_failed);

    if (m_genericFailures) lines << QString("  - Generic failures:            %1").arg(m_genericFailures);
    if (m_audioFailures) lines << QString("  - Audio validation failures:   %1").arg(m_audioFailures);
    if (m_retryFailures) lines << QString("  - Failures after retries:      %1").arg(m_retryFailures);

    lines << kThinRule;

    if (!m_failedFiles.isEmpty()) {
        lines << "Failed Files:";
        for (const QString& f : m_failedFiles) lines << QString("  - %1").arg(f);
    }
    if (!m_audioFailedFiles.isEmpty()) {
        lines << "Audio Validation Failed Files:";
        for (const QString& f : m_audioFailedFiles) lines << QString("  - %1").arg(f);
    }
    return lines.join('\n');
}

QJsonObject SessionReport::toJson() const
{
    QJsonObject o;
    o["mode"] = m_mode == Mode::DryRun ? "DRY_RUN" : "NORMAL";
    o["start_time"] = m_startTime.toString(Qt::ISODate);
    o["end_time"] = m_endTime.isValid() ? QJsonValue(m_endTime.toString(Qt::ISODate)) : QJsonValue();
    o["duration_seconds"] = durationSeconds();
    o["total_files"] = m_totalFiles;
    o["converted"] = m_converted;
    o["skipped"] = m_skipped;
    o["failed"] = m_failed;
    o["generic_failures"] = m_genericFailures;
    o["audio_failures"] = m_audioFailures;
    o["retry_failures"] = m_retryFailures;
    o["failed_files"] = QJsonArray::fromStringList(m_failedFiles);
    o["audio_failed_files"] = QJsonArray::fromStringList(m_audioFailedFiles);
    return o;
}

bool SessionReport::saveToFile(const QString& path, QString* errorMessage) const
{
    const QFileInfo fi(path);
    if (!QDir().mkpath(fi.absolutePath())) {
        if (errorMessage) *errorMessage = QString("Cannot create %1").arg(fi.absolutePath());
        return false;
    }

    QFile text(path);
    if (!text.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        if (errorMessage) *errorMessage = QString("Cannot write %1: %2").arg(path, text.errorString());
        return false;
    }
    QTextStream ts(&text);
    ts << summaryText() << '\n';
    ts.flush();
    text.close();

    const QString jsonPath = jsonPathFor(path);
    QFile json(jsonPath);
    if (!json.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorMessage) *errorMessage = QString("Cannot write %1: %2").arg(jsonPath, json.errorString());
        return false;
    }
    if (json.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented)) < 0) {
        if (errorMessage) *errorMessage = QString("Cannot write %1: %2").arg(jsonPath, json.errorString());
        return false;
    }
    return true;
}
