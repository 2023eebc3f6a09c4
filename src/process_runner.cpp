#include "process_runner.h"

#include <QProcess>

#ifdef Q_OS_UNIX
#include <unistd.h>
#endif

namespace {
constexpr int kStartTimeoutMs = 10000;
constexpr int kKillWaitMs = 3000;
}

ToolResult QProcessRunner::run(const QString& program, const QStringList& args)
{
    ToolResult r;
    QProcess p;
    p.setProgram(program);
    p.setArguments(args);
    p.setStandardInputFile(QProcess::nullDevice());
#ifdef Q_OS_UNIX
    // Own process group: a terminal Ctrl-C cancels the batch, not the running tool
    p.setChildProcessModifier([]() { ::setpgid(0, 0); });
#endif
    p.start();

    if (!p.waitForStarted(kStartTimeoutMs)) {
        r.error = QString("Failed to start %1: %2").arg(program, p.errorString());
        return r;
    }
    r.started = true;

    if (!p.waitForFinished(m_timeoutMs > 0 ? m_timeoutMs : -1)) {
        if (p.state() != QProcess::NotRunning) {
            r.timedOut = true;
            r.error = QString("%1 did not finish within %2 ms, killed").arg(program).arg(m_timeoutMs);
            p.kill();
            p.waitForFinished(kKillWaitMs);
        } else {
            r.error = p.errorString();
        }
    }

    r.stdOut = QString::fromUtf8(p.readAllStandardOutput());
    r.stdErr = QString::fromUtf8(p.readAllStandardError());
    if (r.timedOut) return r;

    r.crashed = (p.exitStatus() != QProcess::NormalExit);
    r.exitCode = p.exitCode();
    if (r.crashed && r.error.isEmpty()) r.error = QString("%1 crashed").arg(program);
    return r;
}
