#include "core/shared/adaptation_config.h"

namespace ak {

AdaptationConfig::AdaptationConfig()
{
    rule(PatternKind::ExplicitExamples) = PatternRule{0.95, 2, 10, 1};
    rule(PatternKind::InputOutputPairs) = PatternRule{0.90, 2, 12, 1};
    rule(PatternKind::NumberedSequence) = PatternRule{0.80, 2, 16, 2};
    rule(PatternKind::Analogy)          = PatternRule{0.70, 2, 6, 2};
    rule(PatternKind::RuleChain)        = PatternRule{0.60, 2, 8, 2};
}

} // namespace ak
