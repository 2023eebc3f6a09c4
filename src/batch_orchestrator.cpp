#include "batch_orchestrator.h"
#include "conversion_profile.h"
#include "file_utils.h"
#include "log_manager.h"
#include "path_resolver.h"

#include <QFileInfo>

namespace {
void log(const QString& message, const QString& level = "INFO")
{
    LogManager::instance().addLog("[Batch] " + message, level);
}
}

BatchOrchestrator::BatchOrchestrator(const ConversionProfile& profile, ProcessRunner& runner, QObject* parent)
    : QObject(parent), m_profile(profile), m_engine(profile, runner) {}

bool BatchOrchestrator::needsConversion(const QString& path, QString* reason) const
{
    if (!m_profile.isSupportedExtension(path)) {
        if (reason) *reason = QString("unsupported extension .%1").arg(QFileInfo(path).suffix());
        return false;
    }
    if (m_profile.overwriteExisting) return true;

    QString outPath, err;
    if (!PathResolver::plannedOutputPath(path, m_profile, outPath, &err)) {
        // Let the engine report the resolution failure
        return true;
    }
    if (FileUtils::pathExists(outPath)) {
        if (reason) *reason = QString("output already exists at %1").arg(outPath);
        return false;
    }
    return true;
}

OutputPlan BatchOrchestrator::planFor(const QString& path) const
{
    OutputPlan plan;
    plan.name = QFileInfo(path).fileName();
    plan.sourcePath = path;
    QString err;
    if (!PathResolver::plannedOutputPath(path, m_profile, plan.outputPath, &err)) plan.outputPath.clear();
    plan.needsConversion = needsConversion(path, &plan.skipReason);
    return plan;
}

QVector<OutputPlan> BatchOrchestrator::preparePlan(const QStringList& files) const
{
    QVector<OutputPlan> plans;
    plans.reserve(files.size());
    for (const QString& f : files) {
        OutputPlan plan = planFor(f);
        plan.subtitles = m_engine.prober().listSubtitleTracks(f);
        plans.append(plan);
    }
    return plans;
}

SessionReport BatchOrchestrator::runBatch(const QStringList& files)
{
    SessionReport report;
    if (m_dryRun) report.markDryRun();
    report.setTotalFiles(files.size());

    const int total = files.size();
    log(QString("Starting %1batch of %2 file(s)").arg(m_dryRun ? "dry-run " : "").arg(total));
    emit batchStarted(total);

    for (int i = 0; i < total; ++i) {
        if (isCancelled()) {
            log(QString("Cancelled, %1 file(s) not processed").arg(total - i), "WARN");
            break;
        }
        processFile(i, total, files.at(i), report);
    }

    report.markComplete();
    log(QString("Batch finished: %1 converted, %2 skipped, %3 failed")
            .arg(report.converted()).arg(report.skipped()).arg(report.failed()));
    emit batchFinished(report.converted(), report.skipped(), report.failed());
    return report;
}

void BatchOrchestrator::processFile(int index, int total, const QString& path, SessionReport& report)
{
    const QString name = QFileInfo(path).fileName();
    emit fileStarted(index, total, path);

    QString reason;
    if (!needsConversion(path, &reason)) {
        report.addSkipped();
        log(QString("Skipping %1: %2").arg(name, reason));
        emit fileFinished(index, true, QString("skipped: %1").arg(reason));
        return;
    }

    if (m_dryRun) {
        log(QString("[DRY RUN] Would convert: %1").arg(path));
        emit fileFinished(index, true, "would convert");
        return;
    }

    log(QString("(%1/%2) Processing %3").arg(index + 1).arg(total).arg(name));
    const ConversionOutcome outcome = m_engine.convert(path);
    if (outcome.success) {
        report.addConverted();
        emit fileFinished(index, true, outcome.outputPath);
    } else {
        report.addFailure(outcome);
        log(QString("Failed %1 [%2]").arg(name, failureReasonName(outcome.reason)), "WARN");
        emit fileFinished(index, false, outcome.error);
    }
}
