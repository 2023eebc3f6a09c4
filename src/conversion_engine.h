#pragma once
#include <QString>
#include <QVector>

#include "media_prober.h"

struct ConversionProfile;
class ProcessRunner;

enum class Strategy { Remux, Encode };

// One strategy run inside a pass. Remux and its encode fallback share a pass number.
struct ConversionAttempt {
    int number = 0;                 // 1-based pass, up to 1 + maxRetries
    Strategy strategy = Strategy::Remux;
    bool commandSucceeded = false;
    bool audioValidated = false;
    bool used4k = false;
};

struct ConversionOutcome {
    // AudioValidation and RetryExhausted both mean every pass was used; AudioValidation
    // when the last pass produced output without an audio stream.
    enum class FailureReason { None, Generic, AudioValidation, RetryExhausted };
    enum class SourceFate { Kept, Deleted, MovedToFailed };

    bool success = false;
    FailureReason reason = FailureReason::None;

    QString sourcePath;
    QString outputPath;
    Strategy strategy = Strategy::Remux;    // strategy of the successful run
    QVector<ConversionAttempt> attempts;
    int passes = 0;

    SourceFate sourceFate = SourceFate::Kept;
    QString movedTo;
    QString error;
};

QString strategyName(Strategy s);
QString failureReasonName(ConversionOutcome::FailureReason r);

// Converts one file: remux first on every pass, encode as the in-pass fallback,
// optional audio validation of the result, up to 1 + maxRetries passes.
// On success the source may be deleted; on exhaustion it is moved to the failed dir.
class ConversionEngine {
public:
    ConversionEngine(const ConversionProfile& profile, ProcessRunner& runner);

    // Resolves the output path first; a resolution failure fails the file with reason Generic.
    ConversionOutcome convert(const QString& sourcePath);
    ConversionOutcome convert(const QString& sourcePath, const QString& outputPath);

    const MediaProber& prober() const { return m_prober; }

private:
    bool runStrategy(Strategy strategy, const QString& in, const QString& out, ConversionAttempt& attempt);
    void removePartialOutput(const QString& out, const QString& source) const;
    void deleteSource(ConversionOutcome& outcome) const;
    void moveToFailed(ConversionOutcome& outcome) const;

    const ConversionProfile& m_profile;
    ProcessRunner& m_runner;
    MediaProber m_prober;
};
