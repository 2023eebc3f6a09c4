#include "conversion_engine.h"
#include "command_builder.h"
#include "conversion_profile.h"
#include "file_utils.h"
#include "log_manager.h"
#include "path_resolver.h"
#include "process_runner.h"
#include "utils.h"

#include <QDir>
#include <QFileInfo>
#include <QElapsedTimer>

#include <algorithm>

namespace {

void log(const QString& message, const QString& level = "INFO")
{
    LogManager::instance().addLog("[Engine] " + message, level);
}

bool mentionsUnsupportedSubtitles(const QString& stdErr)
{
    return stdErr.contains("Subtitle codec", Qt::CaseInsensitive)
        || stdErr.contains("codec not currently supported in container", Qt::CaseInsensitive);
}

} // namespace

QString strategyName(Strategy s)
{
    return s == Strategy::Remux ? "remux" : "encode";
}

QString failureReasonName(ConversionOutcome::FailureReason r)
{
    switch (r) {
        case ConversionOutcome::FailureReason::None: return "none";
        case ConversionOutcome::FailureReason::Generic: return "generic";
        case ConversionOutcome::FailureReason::AudioValidation: return "audio-validation";
        case ConversionOutcome::FailureReason::RetryExhausted: return "retry-exhausted";
    }
    return "none";
}

ConversionEngine::ConversionEngine(const ConversionProfile& profile, ProcessRunner& runner)
    : m_profile(profile), m_runner(runner), m_prober(profile, runner) {}

ConversionOutcome ConversionEngine::convert(const QString& sourcePath)
{
    QString outPath, err;
    if (!PathResolver::resolveOutputPath(sourcePath, m_profile, outPath, &err)) {
        log(QString("Cannot resolve output for %1: %2").arg(sourcePath, err), "ERROR");
        ConversionOutcome outcome;
        outcome.sourcePath = sourcePath;
        outcome.reason = ConversionOutcome::FailureReason::Generic;
        outcome.error = err;
        return outcome;
    }
    return convert(sourcePath, outPath);
}

ConversionOutcome ConversionEngine::convert(const QString& sourcePath, const QString& outputPath)
{
    ConversionOutcome outcome;
    outcome.sourcePath = sourcePath;
    outcome.outputPath = outputPath;

    const QString name = QFileInfo(sourcePath).fileName();

    if (!FileUtils::fileExists(sourcePath)) {
        outcome.reason = ConversionOutcome::FailureReason::Generic;
        outcome.error = QString("Source not found: %1").arg(sourcePath);
        log(outcome.error, "ERROR");
        return outcome;
    }
    if (FileUtils::samePath(sourcePath, outputPath)) {
        outcome.reason = ConversionOutcome::FailureReason::Generic;
        outcome.error = QString("Output path resolves to the source file: %1").arg(outputPath);
        log(outcome.error, "ERROR");
        return outcome;
    }
    if (!QDir().mkpath(QFileInfo(outputPath).absolutePath())) {
        outcome.reason = ConversionOutcome::FailureReason::Generic;
        outcome.error = QString("Cannot create output directory %1").arg(QFileInfo(outputPath).absolutePath());
        log(outcome.error, "ERROR");
        return outcome;
    }

    QElapsedTimer timer;
    timer.start();

    const int maxPasses = 1 + std::max(0, m_profile.maxRetries);
    bool success = false;
    bool lastAudioFailure = false;

    for (int pass = 1; pass <= maxPasses && !success; ++pass) {
        outcome.passes = pass;
        lastAudioFailure = false;

        ConversionAttempt remux;
        remux.number = pass;
        remux.strategy = Strategy::Remux;
        bool chosenOk = runStrategy(Strategy::Remux, sourcePath, outputPath, remux);
        outcome.attempts.append(remux);
        Strategy chosen = Strategy::Remux;

        if (chosenOk) {
            log(QString("Copy mode succeeded for %1 on attempt %2").arg(name).arg(pass));
        } else {
            log(QString("Copy mode failed for %1 on attempt %2, retrying with encode mode.").arg(name).arg(pass), "WARN");
            removePartialOutput(outputPath, sourcePath);

            ConversionAttempt encode;
            encode.number = pass;
            encode.strategy = Strategy::Encode;
            chosenOk = runStrategy(Strategy::Encode, sourcePath, outputPath, encode);
            outcome.attempts.append(encode);
            chosen = Strategy::Encode;
            if (!chosenOk) log(QString("Encoding failed for %1 on attempt %2.").arg(name).arg(pass), "WARN");
        }

        if (chosenOk) {
            const bool audioOk = m_prober.hasAudioStream(outputPath);
            outcome.attempts.last().audioValidated = audioOk;
            if (audioOk) {
                success = true;
                outcome.strategy = chosen;
            } else {
                lastAudioFailure = true;
                log(QString("Audio validation failed for %1 (no audio streams detected).").arg(name), "WARN");
            }
        }

        if (!success) removePartialOutput(outputPath, sourcePath);
    }

    if (success) {
        outcome.success = true;
        outcome.reason = ConversionOutcome::FailureReason::None;
        const qint64 size = QFileInfo(outputPath).size();
        log(QString("Success (%1): %2 -> %3 [%4, %5]")
                .arg(strategyName(outcome.strategy), name, QFileInfo(outputPath).fileName(),
                     Utils::humanSize(size), Utils::formatDuration(timer.elapsed() / 1000)));
        if (m_profile.deleteAfterSuccess) deleteSource(outcome);
        return outcome;
    }

    outcome.reason = lastAudioFailure ? ConversionOutcome::FailureReason::AudioValidation
                                      : ConversionOutcome::FailureReason::RetryExhausted;
    outcome.error = lastAudioFailure ? QString("No audio stream in output after %1 attempt(s)").arg(outcome.passes)
                                     : QString("Conversion failed after %1 attempt(s)").arg(outcome.passes);
    log(QString("Failed: %1 (%2)").arg(name, outcome.error), "ERROR");
    moveToFailed(outcome);
    return outcome;
}

bool ConversionEngine::runStrategy(Strategy strategy, const QString& in, const QString& out, ConversionAttempt& attempt)
{
    QStringList args;
    if (strategy == Strategy::Remux) {
        args = CommandBuilder::buildRemuxCommand(in, out, m_profile);
    } else {
        attempt.used4k = m_prober.isFourK(in);
        if (attempt.used4k) log(QString("...Using 4K settings for: %1").arg(QFileInfo(in).fileName()));
        args = CommandBuilder::buildEncodeCommand(in, out, m_profile, attempt.used4k);
    }

    log(Utils::commandLine(QFileInfo(m_profile.ffmpegPath).fileName(), args), "DEBUG");
    const ToolResult r = m_runner.run(m_profile.ffmpegPath, args);

    if (!r.ok()) {
        if (!r.started) {
            log(QString("Could not launch %1: %2").arg(m_profile.ffmpegPath, r.error), "ERROR");
        } else {
            log(QString("%1 exited with code %2%3").arg(strategyName(strategy)).arg(r.exitCode)
                    .arg(r.error.isEmpty() ? QString() : " (" + r.error + ")"), "WARN");
            const QString tail = r.stdErr.trimmed().right(2000);
            if (!tail.isEmpty()) log(QString("stderr: %1").arg(tail), "DEBUG");
        }
        if (strategy == Strategy::Remux && mentionsUnsupportedSubtitles(r.stdErr)) {
            log("...Reason: unsupported subtitle format for the target container.");
        }
        attempt.commandSucceeded = false;
        return false;
    }

    if (!FileUtils::fileExists(out)) {
        log(QString("%1 reported success but produced no file at %2").arg(strategyName(strategy), out), "WARN");
        attempt.commandSucceeded = false;
        return false;
    }
    attempt.commandSucceeded = true;
    return true;
}

void ConversionEngine::removePartialOutput(const QString& out, const QString& source) const
{
    if (FileUtils::samePath(out, source)) return;
    QString err;
    if (!FileUtils::removeIfExists(out, &err)) log(err, "ERROR");
}

void ConversionEngine::deleteSource(ConversionOutcome& outcome) const
{
    if (FileUtils::samePath(outcome.sourcePath, outcome.outputPath)) return;
    QFile f(outcome.sourcePath);
    if (f.remove()) {
        outcome.sourceFate = ConversionOutcome::SourceFate::Deleted;
        log(QString("Deleted original file: %1").arg(QFileInfo(outcome.sourcePath).fileName()));
    } else {
        log(QString("Failed to delete original file %1: %2").arg(outcome.sourcePath, f.errorString()), "ERROR");
    }
}

void ConversionEngine::moveToFailed(ConversionOutcome& outcome) const
{
    const QString failedDir = m_profile.effectiveFailedDir();
    if (!QDir().mkpath(failedDir)) {
        log(QString("Failed to move file after retries: cannot create %1").arg(failedDir), "ERROR");
        return;
    }
    const QString target = FileUtils::uniqueNameInDir(failedDir, QFileInfo(outcome.sourcePath).fileName());
    QString err;
    if (!FileUtils::moveFile(outcome.sourcePath, target, &err)) {
        log(QString("Failed to move file after retries: %1").arg(err), "ERROR");
        return;
    }
    outcome.sourceFate = ConversionOutcome::SourceFate::MovedToFailed;
    outcome.movedTo = target;
    log(QString("Moved failed file to %1").arg(target));
}
