#include "conversion_profile.h"

#include <QSettings>
#include <QFileInfo>
#include <QDir>
#include <QProcess>
#include <QMetaType>
#include <QVariant>

#include <algorithm>

namespace {

QString envOr(const char* name, const QString& fallback)
{
    const QString v = qEnvironmentVariable(name);
    return v.isEmpty() ? fallback : v;
}

QString absPath(const QString& p)
{
    return p.isEmpty() ? p : QDir::cleanPath(QFileInfo(p).absoluteFilePath());
}

// QSettings returns comma separated INI values as a QStringList and everything
// else as a QString; accept both.
QStringList variantToList(const QVariant& v)
{
    QStringList out;
    const QStringList raw = (v.metaType().id() == QMetaType::QStringList) ? v.toStringList()
                                                                        : QStringList{ v.toString() };
    for (const QString& s : raw) {
        const QString t = s.trimmed();
        if (!t.isEmpty()) out << t;
    }
    return out;
}

QStringList variantToArgs(const QVariant& v)
{
    return QProcess::splitCommand(variantToList(v).join(','));
}

class Reader {
public:
    explicit Reader(QSettings* s) : m_settings(s) {}

    bool has(const QString& key) const { return m_settings && m_settings->contains(key); }
    QVariant get(const QString& key) const { return m_settings ? m_settings->value(key) : QVariant(); }

    QString string(const QString& key, const QString& fallback) const
    {
        if (!has(key)) return fallback;
        const QString v = variantToList(get(key)).join(',').trimmed();
        return v.isEmpty() ? fallback : v;
    }
    bool boolean(const QString& key, bool fallback) const
    {
        return has(key) ? get(key).toBool() : fallback;
    }
    int integer(const QString& key, int fallback, QStringList* warnings) const
    {
        if (!has(key)) return fallback;
        bool ok = false;
        const int v = get(key).toString().trimmed().toInt(&ok);
        if (!ok) {
            if (warnings) *warnings << QString("%1: '%2' is not an integer, using %3").arg(key, get(key).toString()).arg(fallback);
            return fallback;
        }
        return v;
    }

private:
    QSettings* m_settings;
};

ConversionProfile build(QSettings* settings, QStringList* warnings)
{
    ConversionProfile p;
    Reader r(settings);

    const QString base = absPath(r.string("paths/base_dir", envOr("MEDIA_CONVERTER_BASE_DIR", "media")));
    p.inputRoot = absPath(r.string("paths/input_root", QDir(base).filePath("input")));
    p.outputRoot = absPath(r.string("paths/output_root", QDir(base).filePath("output")));
    p.tempDir = absPath(r.string("paths/temp_dir", QDir(base).filePath("temp")));
    p.failedDir = absPath(r.string("paths/failed_dir", QDir(p.tempDir).filePath("failed")));
    p.logFile = absPath(r.string("paths/log_file", QDir(p.tempDir).filePath("log.txt")));
    p.summaryFile = absPath(r.string("paths/summary_file", QDir(p.tempDir).filePath("summary.txt")));

    p.ffmpegPath = r.string("tools/ffmpeg", envOr("FFMPEG_BINARY", p.ffmpegPath));
    p.ffprobePath = r.string("tools/ffprobe", envOr("FFPROBE_BINARY", p.ffprobePath));
    p.toolTimeoutSec = r.integer("tools/timeout_sec", p.toolTimeoutSec, warnings);
    if (p.toolTimeoutSec < 0) {
        if (warnings) *warnings << "tools/timeout_sec must be >= 0, using 0 (no timeout)";
        p.toolTimeoutSec = 0;
    }

    if (r.has("behavior/output_placement")) {
        const QString v = r.string("behavior/output_placement", QString());
        if (!ConversionProfile::parseOutputPlacement(v, p.outputPlacement) && warnings)
            *warnings << QString("behavior/output_placement: unknown value '%1', using %2")
                             .arg(v, ConversionProfile::outputPlacementName(p.outputPlacement));
    }
    p.overwriteExisting = r.boolean("behavior/overwrite_existing", p.overwriteExisting);
    p.deleteAfterSuccess = r.boolean("behavior/delete_after_success", p.deleteAfterSuccess);
    p.validateAudio = r.boolean("behavior/validate_audio", p.validateAudio);
    p.highQuality4k = r.boolean("behavior/high_quality_4k", p.highQuality4k);

    p.maxRetries = r.integer("behavior/max_retries", p.maxRetries, warnings);
    if (p.maxRetries < 0 || p.maxRetries > ConversionProfile::kMaxRetriesCap) {
        const int clamped = std::clamp(p.maxRetries, 0, ConversionProfile::kMaxRetriesCap);
        if (warnings) *warnings << QString("behavior/max_retries out of range (%1), using %2").arg(p.maxRetries).arg(clamped);
        p.maxRetries = clamped;
    }
    p.fourKHeightThreshold = r.integer("behavior/4k_height_threshold", p.fourKHeightThreshold, warnings);
    if (p.fourKHeightThreshold <= 0) {
        if (warnings) *warnings << "behavior/4k_height_threshold must be positive, using 2160";
        p.fourKHeightThreshold = 2160;
    }

    if (r.has("behavior/subtitle_mode")) {
        const QString v = r.string("behavior/subtitle_mode", QString());
        if (!ConversionProfile::parseSubtitleMode(v, p.subtitleMode) && warnings)
            *warnings << QString("behavior/subtitle_mode: unknown value '%1', using %2")
                             .arg(v, ConversionProfile::subtitleModeName(p.subtitleMode));
    }
    if (r.has("behavior/rename_patterns")) p.renamePatterns = variantToList(r.get("behavior/rename_patterns"));

    const QString preset = r.string("behavior/extension_profile", envOr("MEDIA_PROFILE", "plex_friendly"));
    p.videoExtensions = ConversionProfile::extensionsForPreset(preset);
    if (r.has("behavior/extensions")) {
        QStringList exts;
        for (QString e : variantToList(r.get("behavior/extensions"))) {
            e = e.trimmed().toLower();
            if (e.startsWith('.')) e.remove(0, 1);
            if (!e.isEmpty()) exts << e;
        }
        if (!exts.isEmpty()) p.videoExtensions = exts;
    }
    p.collisionSuffix = r.string("behavior/collision_suffix", p.collisionSuffix);

    auto args = [&](const QString& key, QStringList& target) {
        if (!r.has(key)) return;
        const QStringList a = variantToArgs(r.get(key));
        if (a.isEmpty()) {
            if (warnings) *warnings << QString("%1 is empty, keeping default").arg(key);
            return;
        }
        target = a;
    };
    args("ffmpeg/remux_args", p.remuxArgs);
    args("ffmpeg/encode_video_args", p.encodeVideoArgs);
    args("ffmpeg/encode_audio_args", p.encodeAudioArgs);
    args("ffmpeg/encode_video_args_4k", p.encodeVideoArgs4k);
    args("ffmpeg/encode_audio_args_4k", p.encodeAudioArgs4k);

    return p;
}

} // namespace

bool ConversionProfile::isSupportedExtension(const QString& path) const
{
    const QString ext = QFileInfo(path).suffix().toLower();
    return !ext.isEmpty() && videoExtensions.contains(ext);
}

QString ConversionProfile::effectiveFailedDir() const
{
    if (!failedDir.isEmpty()) return failedDir;
    const QString temp = tempDir.isEmpty() ? QDir::currentPath() : tempDir;
    return QDir(temp).filePath("failed");
}

QString ConversionProfile::effectiveFfprobePath() const
{
    if (!ffprobePath.isEmpty()) return ffprobePath;
    // Use ffprobe next to ffmpeg if possible
    const QFileInfo ff(ffmpegPath);
    if (ff.isAbsolute()) {
        const QString exe = ff.suffix().compare("exe", Qt::CaseInsensitive) == 0 ? "ffprobe.exe" : "ffprobe";
        const QString sibling = ff.dir().filePath(exe);
        if (QFileInfo::exists(sibling)) return sibling;
    }
    return QStringLiteral("ffprobe"); // try PATH
}

QStringList ConversionProfile::extensionsForPreset(const QString& name)
{
    if (name == QLatin1String("archival")) return { "mkv", "mov" };
    return { "m4v", "mp4", "mov", "mkv" };
}

QString ConversionProfile::subtitleModeName(SubtitleMode mode)
{
    switch (mode) {
        case SubtitleMode::None: return "none";
        case SubtitleMode::Keep: return "keep";
        case SubtitleMode::BurnIn: return "burn-in";
    }
    return "none";
}

bool ConversionProfile::parseSubtitleMode(const QString& text, SubtitleMode& out)
{
    const QString t = text.trimmed().toLower();
    if (t == "none") { out = SubtitleMode::None; return true; }
    if (t == "keep") { out = SubtitleMode::Keep; return true; }
    if (t == "burn-in" || t == "burnin" || t == "burn_in") { out = SubtitleMode::BurnIn; return true; }
    return false;
}

QString ConversionProfile::outputPlacementName(OutputPlacement placement)
{
    return placement == OutputPlacement::SameDir ? "same-dir" : "mirrored-tree";
}

bool ConversionProfile::parseOutputPlacement(const QString& text, OutputPlacement& out)
{
    const QString t = text.trimmed().toLower();
    if (t == "same-dir" || t == "same_dir") { out = OutputPlacement::SameDir; return true; }
    if (t == "mirrored-tree" || t == "mirrored_tree") { out = OutputPlacement::MirroredTree; return true; }
    return false;
}

ConversionProfile ConversionProfile::fromSettings(QSettings& settings, QStringList* warnings)
{
    return build(&settings, warnings);
}

bool ConversionProfile::fromFile(const QString& iniPath, ConversionProfile& out,
                                 QStringList* warnings, QString* errorMessage)
{
    if (iniPath.isEmpty()) {
        out = build(nullptr, warnings);
        return true;
    }
    const QFileInfo fi(iniPath);
    if (!fi.exists() || !fi.isFile()) {
        if (errorMessage) *errorMessage = QString("Configuration file not found: %1").arg(iniPath);
        return false;
    }
    if (!fi.isReadable()) {
        if (errorMessage) *errorMessage = QString("Configuration file not readable: %1").arg(iniPath);
        return false;
    }

    QSettings s(fi.absoluteFilePath(), QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        if (errorMessage) *errorMessage = QString("Malformed configuration file: %1").arg(iniPath);
        return false;
    }
    out = fromSettings(s, warnings);
    return true;
}
