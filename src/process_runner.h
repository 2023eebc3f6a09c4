#pragma once
#include <QString>
#include <QStringList>

// Outcome of one external tool invocation.
struct ToolResult {
    bool started = false;
    bool crashed = false;
    bool timedOut = false;
    int exitCode = -1;
    QString stdOut;
    QString stdErr;
    QString error;        // launch/timeout diagnostics, empty otherwise

    bool ok() const { return started && !crashed && !timedOut && exitCode == 0; }
};

// Seam between the conversion core and the external ffmpeg/ffprobe binaries.
// Calls are blocking; implementations must never throw.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual ToolResult run(const QString& program, const QStringList& args) = 0;
};

// QProcess backed runner. timeoutMs <= 0 waits until the tool exits.
// On Unix each tool runs in its own process group, out of reach of terminal signals.
class QProcessRunner : public ProcessRunner {
public:
    explicit QProcessRunner(int timeoutMs = 0) : m_timeoutMs(timeoutMs) {}

    ToolResult run(const QString& program, const QStringList& args) override;

private:
    int m_timeoutMs;
};
