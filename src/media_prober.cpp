#include "media_prober.h"
#include "command_builder.h"
#include "conversion_profile.h"
#include "process_runner.h"
#include "log_manager.h"

#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonParseError>
#include <QRegularExpression>

MediaProber::MediaProber(const ConversionProfile& profile, ProcessRunner& runner)
    : m_profile(profile), m_runner(runner) {}

bool MediaProber::parseHasAudio(const QString& stdOut)
{
    // One stream index per line; any token means at least one audio stream
    return !stdOut.trimmed().isEmpty();
}

std::optional<int> MediaProber::parseHeight(const QString& stdOut)
{
    const QStringList lines = stdOut.split(QRegularExpression("[\r\n]+"), Qt::SkipEmptyParts);
    if (lines.isEmpty()) return std::nullopt;
    // csv=p=0 may leave a trailing separator on some builds ("2160,")
    const QString first = lines.first().trimmed().section(',', 0, 0).trimmed();
    bool ok = false;
    const int h = first.toInt(&ok);
    if (!ok || h <= 0) return std::nullopt;
    return h;
}

QVector<MediaInfo::SubtitleTrack> MediaProber::parseSubtitleJson(const QByteArray& json)
{
    QVector<MediaInfo::SubtitleTrack> out;
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) return out;

    const QJsonArray streams = doc.object().value("streams").toArray();
    for (const QJsonValue& v : streams) {
        if (!v.isObject()) continue;
        const QJsonObject s = v.toObject();
        const QJsonObject tags = s.value("tags").toObject();
        MediaInfo::SubtitleTrack t;
        t.index = s.value("index").toInt(-1);
        t.codec = s.value("codec_name").toString();
        const QString lang = tags.value("language").toString();
        if (!lang.isEmpty()) t.language = lang;
        t.title = tags.value("title").toString();
        out.append(t);
    }
    return out;
}

bool MediaProber::hasAudioStream(const QString& path) const
{
    if (!m_profile.validateAudio) return true;

    const ToolResult r = m_runner.run(m_profile.effectiveFfprobePath(), CommandBuilder::buildAudioProbeCommand(path));
    if (!r.ok()) {
        LogManager::instance().addLog(QString("[Probe] audio probe failed for %1 (exit %2) %3")
                                          .arg(QFileInfo(path).fileName()).arg(r.exitCode).arg(r.error), "WARN");
        return false;
    }
    return parseHasAudio(r.stdOut);
}

std::optional<int> MediaProber::videoHeight(const QString& path) const
{
    const ToolResult r = m_runner.run(m_profile.effectiveFfprobePath(), CommandBuilder::buildHeightProbeCommand(path));
    if (!r.ok()) return std::nullopt;
    return parseHeight(r.stdOut);
}

bool MediaProber::isFourK(const QString& path) const
{
    if (!m_profile.highQuality4k) return false;
    const std::optional<int> h = videoHeight(path);
    return h.has_value() && *h >= m_profile.fourKHeightThreshold;
}

QVector<MediaInfo::SubtitleTrack> MediaProber::listSubtitleTracks(const QString& path) const
{
    const ToolResult r = m_runner.run(m_profile.effectiveFfprobePath(), CommandBuilder::buildSubtitleProbeCommand(path));
    if (!r.ok() || r.stdOut.trimmed().isEmpty()) return {};
    return parseSubtitleJson(r.stdOut.toUtf8());
}
