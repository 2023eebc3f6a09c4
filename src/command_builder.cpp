#include "command_builder.h"
#include "conversion_profile.h"

#include <QFileInfo>

namespace CommandBuilder {

namespace {

QString escapeChars(const QString& in, const QString& special)
{
    QString out;
    out.reserve(in.size() * 2);
    for (const QChar c : in) {
        if (special.contains(c)) out += QLatin1Char('\\');
        out += c;
    }
    return out;
}

QStringList commonPrefix(const QString& in)
{
    QStringList args;
    args << "-hide_banner" << "-nostdin" << "-y";
    args << "-i" << safePath(in);
    return args;
}

void appendContainerFlags(QStringList& args, const ConversionProfile& profile)
{
    const QString ext = profile.outputExtension.toLower();
    if (ext == "mp4" || ext == "m4v" || ext == "mov") args << "-movflags" << "+faststart";
}

} // namespace

QString safePath(const QString& path)
{
    QFileInfo fi(path);
    if (!fi.isAbsolute() && path.startsWith('-')) {
        return QStringLiteral("./") + path;
    }
    return path;
}

QString escapeFilterPath(const QString& path)
{
    // Option value level first, then filtergraph level
    const QString level1 = escapeChars(path, QStringLiteral("\\':"));
    return escapeChars(level1, QStringLiteral("\\'[],;"));
}

QStringList buildRemuxCommand(const QString& in, const QString& out, const ConversionProfile& profile)
{
    QStringList args = commonPrefix(in);
    args << profile.remuxArgs;
    // The template must keep every stream and make subtitles MP4 compatible
    if (!profile.remuxArgs.contains("-map")) args << "-map" << "0";
    if (!profile.remuxArgs.contains("-c:s")) args << "-c:s" << "mov_text";
    appendContainerFlags(args, profile);
    args << safePath(out);
    return args;
}

QStringList buildEncodeCommand(const QString& in, const QString& out, const ConversionProfile& profile, bool is4k)
{
    QStringList args = commonPrefix(in);

    args << "-map" << "0:v";     // Map video
    args << "-map" << "0:a?";    // Map audio (if it exists)
    if (profile.subtitleMode == SubtitleMode::Keep) args << "-map" << "0:s?";

    args << (is4k ? profile.encodeVideoArgs4k : profile.encodeVideoArgs);
    args << (is4k ? profile.encodeAudioArgs4k : profile.encodeAudioArgs);

    switch (profile.subtitleMode) {
        case SubtitleMode::BurnIn:
            args << "-vf" << QString("subtitles=%1").arg(escapeFilterPath(QFileInfo(in).absoluteFilePath()));
            args << "-sn";
            break;
        case SubtitleMode::Keep:
            args << "-c:s" << "mov_text";
            break;
        case SubtitleMode::None:
            args << "-sn";
            break;
    }

    appendContainerFlags(args, profile);
    args << safePath(out);
    return args;
}

QStringList buildAudioProbeCommand(const QString& path)
{
    return { "-v", "error", "-select_streams", "a", "-show_entries", "stream=index",
             "-of", "default=nokey=1:noprint_wrappers=1", safePath(path) };
}

QStringList buildHeightProbeCommand(const QString& path)
{
    return { "-v", "error", "-select_streams", "v:0", "-show_entries", "stream=height",
             "-of", "csv=p=0", safePath(path) };
}

QStringList buildSubtitleProbeCommand(const QString& path)
{
    return { "-v", "error", "-select_streams", "s",
             "-show_entries", "stream=index,codec_name,codec_type:stream_tags=language,title",
             "-of", "json", safePath(path) };
}

} // namespace CommandBuilder
