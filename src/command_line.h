#pragma once
#include <QCommandLineOption>
#include <QString>

class QCommandLineParser;
struct ConversionProfile;

// vidconvert command line. Options override the loaded profile per field;
// anything not given on the command line keeps its configured value.
struct CommandLineOptions {
    QCommandLineOption config{ "config", "INI configuration file.", "file" };
    QCommandLineOption input{ "input", "Input root directory (overrides config).", "dir" };
    QCommandLineOption output{ "output", "Output root directory (overrides config).", "dir" };
    QCommandLineOption dryRun{ "dry-run", "Report what would be converted without converting." };
    QCommandLineOption plan{ "plan", "Print a per-file plan with subtitle tracks and exit." };
    QCommandLineOption profile{ "profile", "Extension profile: plex_friendly or archival.", "name" };
    QCommandLineOption sameDirOutput{ "same-dir-output", "Write each output next to its source." };
    QCommandLineOption deleteOriginal{ "delete-original", "Delete the source after a successful conversion." };
    QCommandLineOption maxRetries{ "max-retries", "Additional attempts per file after the first.", "n" };
    QCommandLineOption highQuality4k{ "high-quality-4k", "Use the 4K encode settings for sources at or above the 4K height." };
    QCommandLineOption skipAudioValidation{ "skip-audio-validation", "Do not check outputs for an audio stream." };

    void addTo(QCommandLineParser& parser) const;

    // Returns false and fills errorMessage when an option value is invalid;
    // profile is left untouched in that case.
    bool applyOverrides(const QCommandLineParser& parser, ConversionProfile& profile,
                        QString* errorMessage = nullptr) const;
};
