#pragma once

#include "core/shared/adaptation_config.h"
#include "core/shared/types.h"

#include <QString>

namespace ak {

struct ExtractionResult {
    enum class Status {
        Success,
        InsufficientExamples,
        ExtractionError,
    };

    Status status = Status::ExtractionError;
    ExampleList examples;      // document order, at most rule.maxExamples
    LiveQuery liveQuery;       // never part of examples
    int parsedCount = 0;       // complete pairs before truncation
    QString errorMessage;

    bool ok() const { return status == Status::Success; }
};

// ExampleExtractor -- turns a detected pattern into ordered Example records.
//
// Fewer than rule.minExamples parsed pairs is InsufficientExamples; a text
// with no readable structure for the kind at all is ExtractionError. Extra
// examples beyond rule.maxExamples are dropped from the end of the example
// list; the live query is kept regardless.
class ExampleExtractor {
public:
    static ExtractionResult extract(const QString& text, PatternKind kind, const PatternRule& rule);
};

} // namespace ak
