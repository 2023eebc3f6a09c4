#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFutureWatcher>
#include <QtConcurrent>

#include <atomic>
#include <csignal>
#include <cstdio>

#include "batch_orchestrator.h"
#include "command_line.h"
#include "conversion_profile.h"
#include "log_manager.h"
#include "media_scanner.h"
#include "process_runner.h"
#include "session_report.h"

namespace {

enum ExitCode { ExitOk = 0, ExitFailures = 1, ExitConfigError = 2 };

std::atomic<BatchOrchestrator*> g_orchestrator{nullptr};

void onSigInt(int)
{
    if (BatchOrchestrator* o = g_orchestrator.load()) o->cancel();
}

void out(const QString& text)
{
    std::fputs(qPrintable(text + '\n'), stdout);
    std::fflush(stdout);
}

bool ensureDir(const QString& path, const char* what)
{
    if (path.isEmpty()) return true;
    if (QDir().mkpath(path)) return true;
    LogManager::instance().addLog(QString("[MAIN] Cannot create %1 directory %2").arg(what, path), "ERROR");
    return false;
}

void printPlan(const QVector<OutputPlan>& plans)
{
    out("\n=== Conversion Plan ===");
    for (const OutputPlan& p : plans) {
        out(QString("- %1").arg(p.name));
        out(QString("  Path: %1").arg(p.sourcePath));
        out(QString("  Output: %1").arg(p.outputPath.isEmpty() ? QString("(unresolved)") : p.outputPath));
        out(QString("  Needs conversion: %1").arg(p.needsConversion ? "yes" : "no"));
        if (!p.needsConversion && !p.skipReason.isEmpty()) out(QString("  Reason: %1").arg(p.skipReason));
        if (p.subtitles.isEmpty()) {
            out("  Subtitles: none");
        } else {
            out("  Subtitles:");
            for (const MediaInfo::SubtitleTrack& s : p.subtitles) {
                QString line = QString("    - index %1 [%2] %3").arg(s.index).arg(s.language, s.codec);
                if (!s.title.isEmpty()) line += "  " + s.title;
                out(line);
            }
        }
        out(QString());
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("VidConvert");
    QCoreApplication::setApplicationName("vidconvert");
    QCoreApplication::setApplicationVersion("1.0.0");

    // Owner thread of the log flush timer
    LogManager::instance().setEchoToStderr(true);
    qInstallMessageHandler(customMessageHandler);

    QCommandLineParser parser;
    parser.setApplicationDescription("Batch converts a video library to MP4, remuxing where possible.");
    parser.addHelpOption();
    parser.addVersionOption();
    const CommandLineOptions opts;
    opts.addTo(parser);
    parser.process(app);

    ConversionProfile profile;
    QStringList warnings;
    QString err;
    if (!ConversionProfile::fromFile(parser.value(opts.config), profile, &warnings, &err)) {
        LogManager::instance().addLog("[MAIN] Configuration error: " + err, "ERROR");
        return ExitConfigError;
    }
    if (!opts.applyOverrides(parser, profile, &err)) {
        LogManager::instance().addLog("[MAIN] " + err, "ERROR");
        return ExitConfigError;
    }

    if (!profile.logFile.isEmpty() && !LogManager::instance().setLogFile(profile.logFile)) {
        LogManager::instance().addLog("[MAIN] Cannot open log file " + profile.logFile, "WARN");
    }
    for (const QString& w : warnings) LogManager::instance().addLog("[MAIN] Config: " + w, "WARN");

    if (!ensureDir(profile.inputRoot, "input") || !ensureDir(profile.outputRoot, "output")
        || !ensureDir(profile.tempDir, "temp") || !ensureDir(profile.effectiveFailedDir(), "failed")) {
        return ExitConfigError;
    }

    LogManager::instance().addLog(QString("[MAIN] Input: %1 | Output: %2 | placement=%3 subtitles=%4 retries=%5")
                                      .arg(profile.inputRoot, profile.outputRoot,
                                           ConversionProfile::outputPlacementName(profile.outputPlacement),
                                           ConversionProfile::subtitleModeName(profile.subtitleMode))
                                      .arg(profile.maxRetries));
    LogManager::instance().addLog(QString("[MAIN] delete_original=%1 validate_audio=%2 high_quality_4k=%3 extensions=%4")
                                      .arg(profile.deleteAfterSuccess ? "yes" : "no",
                                           profile.validateAudio ? "yes" : "no",
                                           profile.highQuality4k ? "yes" : "no",
                                           profile.videoExtensions.join(',')));

    const QStringList videos = MediaScanner::scanForVideos(profile.inputRoot, profile.videoExtensions);

    QProcessRunner runner(profile.toolTimeoutSec * 1000);
    BatchOrchestrator orchestrator(profile, runner);
    orchestrator.setDryRun(parser.isSet(opts.dryRun));

    if (parser.isSet(opts.plan)) {
        printPlan(orchestrator.preparePlan(videos));
        LogManager::instance().addLog("[MAIN] Plan-only run complete. No files were converted.");
        return ExitOk;
    }

    g_orchestrator.store(&orchestrator);
    std::signal(SIGINT, onSigInt);

    QFutureWatcher<SessionReport> watcher;
    QObject::connect(&watcher, &QFutureWatcher<SessionReport>::finished, &app, [&]() {
        const SessionReport report = watcher.result();
        out(report.summaryText());

        if (!profile.summaryFile.isEmpty()) {
            QString saveErr;
            if (report.saveToFile(profile.summaryFile, &saveErr)) {
                LogManager::instance().addLog("[Report] Summary saved to " + profile.summaryFile);
            } else {
                LogManager::instance().addLog("[Report] " + saveErr, "ERROR");
            }
        }
        app.exit(report.failed() > 0 ? ExitFailures : ExitOk);
    });
    watcher.setFuture(QtConcurrent::run([&orchestrator, videos]() { return orchestrator.runBatch(videos); }));

    const int rc = app.exec();
    std::signal(SIGINT, SIG_DFL);
    g_orchestrator.store(nullptr);
    LogManager::instance().addLog("[MAIN] Finished");
    return rc;
}
