#include "command_line.h"
#include "conversion_profile.h"

#include <QCommandLineParser>
#include <QFileInfo>

void CommandLineOptions::addTo(QCommandLineParser& parser) const
{
    parser.addOptions({ config, input, output, dryRun, plan, profile, sameDirOutput,
                        deleteOriginal, maxRetries, highQuality4k, skipAudioValidation });
}

bool CommandLineOptions::applyOverrides(const QCommandLineParser& parser, ConversionProfile& target,
                                        QString* errorMessage) const
{
    ConversionProfile p = target;

    if (parser.isSet(profile)) {
        const QString name = parser.value(profile).trimmed().toLower();
        if (name != QLatin1String("plex_friendly") && name != QLatin1String("archival")) {
            if (errorMessage) *errorMessage = QString("--profile: unknown profile '%1'").arg(parser.value(profile));
            return false;
        }
        p.videoExtensions = ConversionProfile::extensionsForPreset(name);
    }
    if (parser.isSet(maxRetries)) {
        bool ok = false;
        const int n = parser.value(maxRetries).trimmed().toInt(&ok);
        if (!ok || n < 0 || n > ConversionProfile::kMaxRetriesCap) {
            if (errorMessage)
                *errorMessage = QString("--max-retries: expected 0..%1, got '%2'")
                                    .arg(ConversionProfile::kMaxRetriesCap).arg(parser.value(maxRetries));
            return false;
        }
        p.maxRetries = n;
    }

    if (parser.isSet(input)) p.inputRoot = QFileInfo(parser.value(input)).absoluteFilePath();
    if (parser.isSet(output)) p.outputRoot = QFileInfo(parser.value(output)).absoluteFilePath();
    if (parser.isSet(sameDirOutput)) p.outputPlacement = OutputPlacement::SameDir;
    if (parser.isSet(deleteOriginal)) p.deleteAfterSuccess = true;
    if (parser.isSet(highQuality4k)) p.highQuality4k = true;
    if (parser.isSet(skipAudioValidation)) p.validateAudio = false;

    target = p;
    return true;
}
