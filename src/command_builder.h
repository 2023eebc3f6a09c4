#pragma once
#include <QString>
#include <QStringList>

struct ConversionProfile;

// Pure argument assembly for ffmpeg/ffprobe. Nothing here touches the file system.
namespace CommandBuilder {

// Prevents relative paths starting with '-' from being read as options.
QString safePath(const QString& path);

// Escapes a path for use inside a filtergraph option value (e.g. subtitles=...).
QString escapeFilterPath(const QString& path);

// Lossless rewrap: all streams mapped and copied, subtitles converted for MP4.
QStringList buildRemuxCommand(const QString& in, const QString& out, const ConversionProfile& profile);

// Full re-encode with the standard or 4K parameter set and the profile's subtitle policy.
QStringList buildEncodeCommand(const QString& in, const QString& out, const ConversionProfile& profile, bool is4k);

// ffprobe queries
QStringList buildAudioProbeCommand(const QString& path);
QStringList buildHeightProbeCommand(const QString& path);
QStringList buildSubtitleProbeCommand(const QString& path);

} // namespace CommandBuilder
