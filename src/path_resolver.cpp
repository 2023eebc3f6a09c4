#include "path_resolver.h"
#include "conversion_profile.h"
#include "file_utils.h"
#include "log_manager.h"

#include <QDir>
#include <QFileInfo>

namespace {
// Bound on disambiguation rounds; each round needs another name resolving to the source
constexpr int kMaxCollisionRounds = 100;
}

QString PathResolver::cleanStem(const QString& stem, const QStringList& patterns)
{
    QString cleaned = stem;
    for (const QString& pattern : patterns) {
        if (pattern.isEmpty()) continue;
        cleaned.replace(pattern, QString(), Qt::CaseSensitive);
    }
    cleaned = cleaned.simplified();
    return cleaned.isEmpty() ? stem : cleaned;
}

bool PathResolver::outputDirFor(const QString& sourcePath, const ConversionProfile& profile,
                                QString& outDir, QString* errorMessage)
{
    const QFileInfo src(sourcePath);
    const QString srcDir = src.absolutePath();

    if (profile.outputPlacement == OutputPlacement::SameDir) {
        outDir = srcDir;
        return true;
    }

    if (profile.outputRoot.isEmpty()) {
        if (errorMessage) *errorMessage = "Mirrored output requires an output root";
        return false;
    }

    // Recreate the subfolder structure below the input root
    QString rel;
    if (!profile.inputRoot.isEmpty()) {
        const QString root = FileUtils::canonicalOrAbsolute(profile.inputRoot);
        rel = QDir(root).relativeFilePath(FileUtils::canonicalOrAbsolute(srcDir));
        if (rel == QLatin1String(".")) {
            rel.clear();
        } else if (rel == QLatin1String("..") || rel.startsWith(QLatin1String("../")) || QDir::isAbsolutePath(rel)) {
            LogManager::instance().addLog(QString("[Resolve] %1 is outside input root %2, writing to output root")
                                              .arg(sourcePath, profile.inputRoot), "WARN");
            rel.clear();
        }
    }
    outDir = QDir::cleanPath(rel.isEmpty() ? profile.outputRoot : QDir(profile.outputRoot).filePath(rel));
    return true;
}

bool PathResolver::plannedOutputPath(const QString& sourcePath, const ConversionProfile& profile,
                                     QString& outPath, QString* errorMessage)
{
    QString baseDir;
    if (!outputDirFor(sourcePath, profile, baseDir, errorMessage)) return false;

    const QString stem = cleanStem(QFileInfo(sourcePath).completeBaseName(), profile.renamePatterns);
    const QString ext = profile.outputExtension;
    const QString source = FileUtils::canonicalOrAbsolute(sourcePath);

    QString candidate = QDir(baseDir).filePath(stem + '.' + ext);
    for (int round = 1; FileUtils::canonicalOrAbsolute(candidate) == source; ++round) {
        if (round > kMaxCollisionRounds) {
            if (errorMessage) *errorMessage = QString("No output name distinct from %1").arg(sourcePath);
            return false;
        }
        // Movie.mp4 -> Movie_converted.mp4 -> Movie_converted_2.mp4 ...
        const QString suffix = round == 1 ? profile.collisionSuffix
                                          : QString("%1_%2").arg(profile.collisionSuffix).arg(round);
        candidate = QDir(baseDir).filePath(stem + suffix + '.' + ext);
    }

    outPath = candidate;
    return true;
}

bool PathResolver::resolveOutputPath(const QString& sourcePath, const ConversionProfile& profile,
                                     QString& outPath, QString* errorMessage)
{
    QString baseDir;
    if (!outputDirFor(sourcePath, profile, baseDir, errorMessage)) return false;

    // Ensure the output directory exists before any name checks
    if (!QDir().mkpath(baseDir) || !FileUtils::dirExists(baseDir)) {
        if (errorMessage) *errorMessage = QString("Cannot create output directory %1").arg(baseDir);
        return false;
    }
    return plannedOutputPath(sourcePath, profile, outPath, errorMessage);
}
