#pragma once
#include <QStringList>

// Recursive discovery of candidate video files under an input root.
class MediaScanner {
public:
    // Sorted absolute paths of regular files whose extension (case-insensitive,
    // without the dot) is in extensions. A missing root yields an empty list.
    static QStringList scanForVideos(const QString& root, const QStringList& extensions);

    static bool hasVideoExtension(const QString& path, const QStringList& extensions);
};
