#include "core/pattern/pattern_detector.h"

#include "core/pattern/pattern_grammar.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace ak {

QVector<PatternMatch> PatternDetector::detect(const QString& text, const AdaptationConfig& config)
{
    QVector<PatternMatch> matches;
    if (text.trimmed().isEmpty()) {
        return matches;
    }

    for (int i = 0; i < kPatternKindCount; ++i) {
        const auto kind = static_cast<PatternKind>(i);
        const PatternRule& rule = config.rule(kind);
        const int strength = pattern_grammar::parsePattern(kind, text).strength;
        if (strength <= 0 || strength < rule.minStrength) {
            continue;
        }
        matches.append(PatternMatch{kind, rule.weight, strength});
    }

    // Kinds were appended in priority order, so a stable sort on weight
    // keeps the declared tie-break.
    std::stable_sort(matches.begin(), matches.end(),
                     [](const PatternMatch& a, const PatternMatch& b) {
                         return a.weight > b.weight;
                     });
    return matches;
}

std::optional<PatternMatch> PatternDetector::select(const QString& text,
                                                    const AdaptationConfig& config)
{
    const QVector<PatternMatch> matches = detect(text, config);
    if (matches.isEmpty()) {
        return std::nullopt;
    }

    const PatternMatch& chosen = matches.first();
    LOG_DEBUG(akPattern, "Selected %s (weight=%.2f strength=%d) from %d candidate(s)",
              qUtf8Printable(patternKindToString(chosen.kind)),
              chosen.weight,
              chosen.strength,
              static_cast<int>(matches.size()));
    return chosen;
}

} // namespace ak
