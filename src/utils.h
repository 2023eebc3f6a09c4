#pragma once
#include <QtGlobal>
#include <QString>
#include <QStringList>

namespace Utils {

// Human friendly duration: 45 -> "45s", 65 -> "1m 5s", 3605 -> "1h 0m 5s".
inline QString formatDuration(qint64 seconds) {
    if (seconds < 0) seconds = 0;
    if (seconds < 60) return QString("%1s").arg(seconds);
    const qint64 minutes = seconds / 60;
    const qint64 sec = seconds % 60;
    if (minutes < 60) return QString("%1m %2s").arg(minutes).arg(sec);
    return QString("%1h %2m %3s").arg(minutes / 60).arg(minutes % 60).arg(sec);
}

// Human readable size: 512 -> "512 B", 1024 -> "1.0 KB", 1048576 -> "1.0 MB".
inline QString humanSize(qint64 bytes) {
    if (bytes < 1024) return QString("%1 B").arg(bytes);
    static const char* units[] = { "KB", "MB", "GB", "TB", "PB" };
    double num = double(bytes) / 1024.0;
    int idx = 0;
    while (num >= 1024.0 && idx < 4) {
        num /= 1024.0;
        ++idx;
    }
    return QString("%1 %2").arg(num, 0, 'f', 1).arg(units[idx]);
}

// Joins a command line for logging; arguments containing spaces are quoted.
inline QString commandLine(const QString& program, const QStringList& args) {
    QStringList parts{ program };
    for (const QString& a : args) {
        if (a.contains(' ') && !(a.startsWith('"') && a.endsWith('"'))) {
            QString s = a; s.replace('"', "\\\"");
            parts << '"' + s + '"';
        } else {
            parts << a;
        }
    }
    return parts.join(' ');
}

} // namespace Utils
