#pragma once
#include <QString>
#include <QVector>
#include <QByteArray>

#include <optional>

struct ConversionProfile;
class ProcessRunner;

namespace MediaInfo {
struct SubtitleTrack {
    int index = -1;
    QString codec;
    QString language = QStringLiteral("und");
    QString title;
};
}

// Point-in-time stream queries through ffprobe. Nothing is cached: a file may be
// rewritten between two calls. Every query tolerates a failing or silent probe.
class MediaProber {
public:
    MediaProber(const ConversionProfile& profile, ProcessRunner& runner);

    // Fail-closed: a failed or empty probe means "no audio". Always true when
    // audio validation is disabled (no probe is run).
    bool hasAudioStream(const QString& path) const;

    // Height of the first video stream, nullopt when unknown.
    std::optional<int> videoHeight(const QString& path) const;

    // False whenever high-quality 4K mode is off; unknown heights are not 4K.
    bool isFourK(const QString& path) const;

    // Empty on any probe or parse failure.
    QVector<MediaInfo::SubtitleTrack> listSubtitleTracks(const QString& path) const;

    // Parsers for ffprobe output, exposed for reuse and tests
    static bool parseHasAudio(const QString& stdOut);
    static std::optional<int> parseHeight(const QString& stdOut);
    static QVector<MediaInfo::SubtitleTrack> parseSubtitleJson(const QByteArray& json);

private:
    const ConversionProfile& m_profile;
    ProcessRunner& m_runner;
};
