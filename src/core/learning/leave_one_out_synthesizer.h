#pragma once

#include "core/shared/types.h"

#include <QString>

namespace ak {

// Expands N examples into N training instances. Instance i holds example i
// out as the supervised target and shows the other N-1 examples, in their
// original order, as context ahead of example i's input.
class LeaveOneOutSynthesizer {
public:
    enum class Status {
        Success,
        InsufficientExamples,
    };

    struct Result {
        Status status = Status::InsufficientExamples;
        TrainingSet instances;
    };

    static Result synthesize(const ExampleList& examples);

    // Shared prompt layout, also used to build the generation-time prompt
    // for the live query.
    static QString formatPrompt(const ExampleList& examples, int skipIndex, const QString& input);
};

} // namespace ak
