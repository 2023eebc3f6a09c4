#pragma once
#include <QString>
#include <QStringList>

struct ConversionProfile;

class PathResolver {
public:
    // Removes every occurrence of each pattern, in list order and case-sensitively,
    // then collapses whitespace runs. Falls back to the original stem if nothing is left.
    static QString cleanStem(const QString& stem, const QStringList& patterns);

    // Directory the output for sourcePath goes into (not created).
    // Returns false if the placement cannot be computed (mirrored tree without an output root).
    static bool outputDirFor(const QString& sourcePath, const ConversionProfile& profile,
                             QString& outDir, QString* errorMessage = nullptr);

    // Same name rules as resolveOutputPath without touching the filesystem.
    static bool plannedOutputPath(const QString& sourcePath, const ConversionProfile& profile,
                                  QString& outPath, QString* errorMessage = nullptr);

    // Computes the output path for sourcePath and creates its directory.
    // The result never resolves to the same file as sourcePath. Returns false, with
    // errorMessage filled, when no writable destination directory can be created.
    static bool resolveOutputPath(const QString& sourcePath, const ConversionProfile& profile,
                                  QString& outPath, QString* errorMessage = nullptr);
};
