#include "core/pattern/example_extractor.h"

#include "core/pattern/pattern_grammar.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace ak {

ExtractionResult ExampleExtractor::extract(const QString& text,
                                           PatternKind kind,
                                           const PatternRule& rule)
{
    ExtractionResult result;
    const pattern_grammar::ParsedPattern parsed = pattern_grammar::parsePattern(kind, text);
    result.liveQuery = parsed.live;
    result.parsedCount = parsed.pairs.size();

    if (parsed.strength <= 0) {
        result.status = ExtractionResult::Status::ExtractionError;
        result.errorMessage = QStringLiteral("no %1 structure in query")
                                  .arg(patternKindToString(kind));
        return result;
    }

    if (parsed.pairs.isEmpty() && parsed.malformed > 0) {
        result.status = ExtractionResult::Status::ExtractionError;
        result.errorMessage = QStringLiteral("%1 malformed segment(s), no readable pairs")
                                  .arg(parsed.malformed);
        return result;
    }

    if (parsed.pairs.size() < rule.minExamples) {
        result.status = ExtractionResult::Status::InsufficientExamples;
        result.errorMessage = QStringLiteral("parsed %1 example(s), need at least %2")
                                  .arg(parsed.pairs.size())
                                  .arg(rule.minExamples);
        return result;
    }

    const int keep = std::min(static_cast<int>(parsed.pairs.size()), rule.maxExamples);
    if (keep < parsed.pairs.size()) {
        LOG_INFO(akPattern, "Truncating %d %s examples to %d",
                 static_cast<int>(parsed.pairs.size()),
                 qUtf8Printable(patternKindToString(kind)),
                 keep);
    }

    result.examples.reserve(keep);
    for (int i = 0; i < keep; ++i) {
        const pattern_grammar::RawPair& pair = parsed.pairs.at(i);
        result.examples.append(Example{parsed.preamble, pair.input, pair.output});
    }
    if (parsed.malformed > 0) {
        LOG_DEBUG(akPattern, "Skipped %d malformed segment(s)", parsed.malformed);
    }

    result.status = ExtractionResult::Status::Success;
    return result;
}

} // namespace ak
