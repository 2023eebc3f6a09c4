#pragma once
#include <QString>
#include <QStringList>

class QSettings;

enum class SubtitleMode { None, Keep, BurnIn };
enum class OutputPlacement { SameDir, MirroredTree };

// Immutable per-session configuration. Every field carries its default here;
// loaders only override what the configuration source actually sets.
struct ConversionProfile {
    static constexpr int kMaxRetriesCap = 20;

    // Paths
    QString inputRoot;
    QString outputRoot;
    QString tempDir;
    QString failedDir;        // empty -> <tempDir>/failed
    QString logFile;          // empty -> no log file
    QString summaryFile;      // empty -> report is not persisted

    // External tools
    QString ffmpegPath = QStringLiteral("ffmpeg");
    QString ffprobePath;      // empty -> ffprobe next to ffmpeg, else PATH
    int toolTimeoutSec = 0;   // 0 = wait forever

    // Behavior
    OutputPlacement outputPlacement = OutputPlacement::MirroredTree;
    bool overwriteExisting = false;
    bool deleteAfterSuccess = false;
    int maxRetries = 1;       // additional attempts after the first
    bool validateAudio = true;
    bool highQuality4k = false;
    int fourKHeightThreshold = 2160;
    SubtitleMode subtitleMode = SubtitleMode::None;
    QStringList renamePatterns;

    QStringList videoExtensions = extensionsForPreset(QStringLiteral("plex_friendly"));
    QString outputExtension = QStringLiteral("mp4");
    QString collisionSuffix = QStringLiteral("_converted");

    // ffmpeg argument templates
    QStringList remuxArgs = { "-map", "0", "-c", "copy", "-c:s", "mov_text" };
    QStringList encodeVideoArgs = { "-c:v", "libx264", "-preset", "slow", "-crf", "20" };
    QStringList encodeAudioArgs = { "-c:a", "aac", "-b:a", "192k" };
    QStringList encodeVideoArgs4k = { "-c:v", "libx264", "-preset", "slow", "-crf", "18" };
    QStringList encodeAudioArgs4k = { "-c:a", "aac", "-b:a", "320k" };

    bool isSupportedExtension(const QString& path) const;
    QString effectiveFailedDir() const;
    QString effectiveFfprobePath() const;

    // Named extension sets ("plex_friendly", "archival"). Unknown names yield the default set.
    static QStringList extensionsForPreset(const QString& name);

    static QString subtitleModeName(SubtitleMode mode);
    static bool parseSubtitleMode(const QString& text, SubtitleMode& out);
    static QString outputPlacementName(OutputPlacement placement);
    static bool parseOutputPlacement(const QString& text, OutputPlacement& out);

    // Builds a profile from defaults overlaid with the given settings. Values that
    // are out of range are clamped and reported in warnings.
    static ConversionProfile fromSettings(QSettings& settings, QStringList* warnings = nullptr);

    // Loads an INI file. An empty path yields defaults; a missing, unreadable or
    // malformed file returns false and fills errorMessage.
    // Precedence per key: INI value, then environment (MEDIA_CONVERTER_BASE_DIR,
    // FFMPEG_BINARY, FFPROBE_BINARY, MEDIA_PROFILE), then the built-in default.
    static bool fromFile(const QString& iniPath, ConversionProfile& out,
                         QStringList* warnings = nullptr, QString* errorMessage = nullptr);
};
