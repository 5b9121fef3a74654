#pragma once

#include <QString>
#include <QVector>

namespace ak {

// Few-shot pattern families. Declaration order is the tie-break priority
// used by PatternDetector when two kinds carry the same weight.
enum class PatternKind {
    ExplicitExamples,
    InputOutputPairs,
    NumberedSequence,
    Analogy,
    RuleChain,
};

constexpr int kPatternKindCount = 5;

QString patternKindToString(PatternKind kind);
bool patternKindFromString(const QString& str, PatternKind* kindOut);

// Why an adaptation attempt ended without an attached adapter.
// None is reserved for accepted decisions.
enum class AdaptationReason {
    None,
    PatternNotDetected,
    InsufficientExamples,
    ExtractionError,
    Timeout,
    MemoryLimitExceeded,
    LowConfidence,
    TrainingFailed,
    Cancelled,
    DisabledByCaller,
};

QString adaptationReasonToString(AdaptationReason reason);
AdaptationReason adaptationReasonFromString(const QString& str);

// One demonstration pulled out of the query text.
struct Example {
    QString context;
    QString input;
    QString output;
};

// The trailing unpaired fragment the caller actually wants answered.
struct LiveQuery {
    QString input;
    QString raw;

    bool isEmpty() const { return input.isEmpty() && raw.isEmpty(); }
};

struct TrainingInstance {
    QString prompt;
    QString target;
    int heldOutIndex = -1;
};

using ExampleList = QVector<Example>;
using TrainingSet = QVector<TrainingInstance>;

} // namespace ak
