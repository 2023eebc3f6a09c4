#pragma once

#include <QString>
#include <QFileInfo>
#include <QFile>
#include <QDir>

/**
 * FileUtils - Standardized file operations utilities
 *
 * Existence checks, canonical path comparison and the move/remove helpers the
 * conversion pipeline uses for its terminal actions.
 */
namespace FileUtils {

inline bool fileExists(const QString& filePath)
{
    QFileInfo fi(filePath);
    return fi.exists() && fi.isFile();
}

inline bool dirExists(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir();
}

inline bool pathExists(const QString& path)
{
    return QFileInfo::exists(path);
}

/**
 * Fully resolved form of a path that may not exist yet.
 *
 * Existing paths are canonicalized (symlinks followed). For a missing file the
 * parent directory is canonicalized when it exists and the file name appended,
 * so two spellings of the same location compare equal.
 */
inline QString canonicalOrAbsolute(const QString& path)
{
    const QFileInfo fi(path);
    const QString canonical = fi.canonicalFilePath();
    if (!canonical.isEmpty()) return canonical;
    const QString parent = QFileInfo(fi.absolutePath()).canonicalFilePath();
    if (!parent.isEmpty()) return QDir(parent).filePath(fi.fileName());
    return QDir::cleanPath(fi.absoluteFilePath());
}

/**
 * True if both paths refer to the same location once fully resolved.
 */
inline bool samePath(const QString& a, const QString& b)
{
    return canonicalOrAbsolute(a) == canonicalOrAbsolute(b);
}

/**
 * Removes a file if present. Returns false only when a file exists and could not be removed.
 */
inline bool removeIfExists(const QString& filePath, QString* errorOut = nullptr)
{
    if (!QFileInfo::exists(filePath)) return true;
    QFile f(filePath);
    if (f.remove()) return true;
    if (errorOut) *errorOut = QString("Failed to remove %1: %2").arg(filePath, f.errorString());
    return false;
}

/**
 * First free path for fileName inside dir: "name.ext", then "name (2).ext", "name (3).ext", ...
 */
inline QString uniqueNameInDir(const QString& dir, const QString& fileName)
{
    QString path = QDir(dir).filePath(fileName);
    const QString stem = QFileInfo(fileName).completeBaseName();
    const QString ext = QFileInfo(fileName).suffix();
    int i = 2;
    while (QFileInfo::exists(path)) {
        const QString name = ext.isEmpty() ? QString("%1 (%2)").arg(stem).arg(i++)
                                           : QString("%1 (%2).%3").arg(stem).arg(i++).arg(ext);
        path = QDir(dir).filePath(name);
    }
    return path;
}

/**
 * Moves src to dst. Falls back to copy + remove when a rename is not possible
 * (e.g. across file systems). On failure the source is left in place.
 */
inline bool moveFile(const QString& src, const QString& dst, QString* errorOut = nullptr)
{
    if (QFile::rename(src, dst)) return true;

    QFile in(src);
    if (!in.copy(dst)) {
        if (errorOut) *errorOut = QString("Failed to move %1 to %2: %3").arg(src, dst, in.errorString());
        return false;
    }
    if (!QFile::remove(src)) {
        // Keep exactly one copy: the source stays authoritative
        QFile::remove(dst);
        if (errorOut) *errorOut = QString("Copied %1 to %2 but could not remove the source").arg(src, dst);
        return false;
    }
    return true;
}

} // namespace FileUtils
