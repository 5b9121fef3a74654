#include "core/shared/types.h"

namespace ak {

QString patternKindToString(PatternKind kind)
{
    switch (kind) {
    case PatternKind::ExplicitExamples: return QStringLiteral("explicit_examples");
    case PatternKind::InputOutputPairs: return QStringLiteral("input_output_pairs");
    case PatternKind::NumberedSequence: return QStringLiteral("numbered_sequence");
    case PatternKind::Analogy:          return QStringLiteral("analogy");
    case PatternKind::RuleChain:        return QStringLiteral("rule_chain");
    }
    return QStringLiteral("unknown");
}

bool patternKindFromString(const QString& str, PatternKind* kindOut)
{
    PatternKind kind;
    if (str == QLatin1String("explicit_examples"))       kind = PatternKind::ExplicitExamples;
    else if (str == QLatin1String("input_output_pairs")) kind = PatternKind::InputOutputPairs;
    else if (str == QLatin1String("numbered_sequence"))  kind = PatternKind::NumberedSequence;
    else if (str == QLatin1String("analogy"))            kind = PatternKind::Analogy;
    else if (str == QLatin1String("rule_chain"))         kind = PatternKind::RuleChain;
    else return false;

    if (kindOut) {
        *kindOut = kind;
    }
    return true;
}

QString adaptationReasonToString(AdaptationReason reason)
{
    switch (reason) {
    case AdaptationReason::None:                 return QStringLiteral("none");
    case AdaptationReason::PatternNotDetected:   return QStringLiteral("pattern_not_detected");
    case AdaptationReason::InsufficientExamples: return QStringLiteral("insufficient_examples");
    case AdaptationReason::ExtractionError:      return QStringLiteral("extraction_error");
    case AdaptationReason::Timeout:              return QStringLiteral("timeout");
    case AdaptationReason::MemoryLimitExceeded:  return QStringLiteral("memory_limit_exceeded");
    case AdaptationReason::LowConfidence:        return QStringLiteral("low_confidence");
    case AdaptationReason::TrainingFailed:       return QStringLiteral("training_failed");
    case AdaptationReason::Cancelled:            return QStringLiteral("cancelled");
    case AdaptationReason::DisabledByCaller:     return QStringLiteral("disabled_by_caller");
    }
    return QStringLiteral("none");
}

AdaptationReason adaptationReasonFromString(const QString& str)
{
    if (str == QLatin1String("pattern_not_detected"))  return AdaptationReason::PatternNotDetected;
    if (str == QLatin1String("insufficient_examples")) return AdaptationReason::InsufficientExamples;
    if (str == QLatin1String("extraction_error"))      return AdaptationReason::ExtractionError;
    if (str == QLatin1String("timeout"))               return AdaptationReason::Timeout;
    if (str == QLatin1String("memory_limit_exceeded")) return AdaptationReason::MemoryLimitExceeded;
    if (str == QLatin1String("low_confidence"))        return AdaptationReason::LowConfidence;
    if (str == QLatin1String("training_failed"))       return AdaptationReason::TrainingFailed;
    if (str == QLatin1String("cancelled"))             return AdaptationReason::Cancelled;
    if (str == QLatin1String("disabled_by_caller"))    return AdaptationReason::DisabledByCaller;
    return AdaptationReason::None;
}

} // namespace ak
