#include "media_scanner.h"
#include "log_manager.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

bool MediaScanner::hasVideoExtension(const QString& path, const QStringList& extensions)
{
    const QString ext = QFileInfo(path).suffix();
    if (ext.isEmpty()) return false;
    return extensions.contains(ext, Qt::CaseInsensitive);
}

QStringList MediaScanner::scanForVideos(const QString& root, const QStringList& extensions)
{
    QStringList out;
    const QFileInfo rootInfo(root);
    if (!rootInfo.isDir()) {
        LogManager::instance().addLog(QString("[Scan] Input directory does not exist: %1").arg(root), "WARN");
        return out;
    }

    QDirIterator it(rootInfo.absoluteFilePath(), QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString fp = it.next();
        if (hasVideoExtension(fp, extensions)) out.append(QFileInfo(fp).absoluteFilePath());
    }
    out.sort();

    LogManager::instance().addLog(QString("[Scan] Found %1 video file(s) in %2").arg(out.size()).arg(root));
    return out;
}
