#include "core/learning/leave_one_out_synthesizer.h"

#include "core/shared/logging.h"

#include <QStringList>

namespace ak {

QString LeaveOneOutSynthesizer::formatPrompt(const ExampleList& examples,
                                             int skipIndex,
                                             const QString& input)
{
    QStringList blocks;
    if (!examples.isEmpty() && !examples.first().context.isEmpty()) {
        blocks.append(examples.first().context);
    }
    for (int i = 0; i < examples.size(); ++i) {
        if (i == skipIndex) {
            continue;
        }
        const Example& example = examples.at(i);
        blocks.append(QStringLiteral("Input: %1\nOutput: %2").arg(example.input, example.output));
    }
    blocks.append(QStringLiteral("Input: %1\nOutput:").arg(input));
    return blocks.join(QStringLiteral("\n\n"));
}

LeaveOneOutSynthesizer::Result LeaveOneOutSynthesizer::synthesize(const ExampleList& examples)
{
    Result result;
    if (examples.size() < 2) {
        LOG_DEBUG(akTraining, "Leave-one-out needs 2+ examples, got %d",
                  static_cast<int>(examples.size()));
        return result;
    }

    result.instances.reserve(examples.size());
    for (int i = 0; i < examples.size(); ++i) {
        TrainingInstance instance;
        instance.prompt = formatPrompt(examples, i, examples.at(i).input);
        instance.target = examples.at(i).output;
        instance.heldOutIndex = i;
        result.instances.append(instance);
    }
    result.status = Status::Success;
    return result;
}

} // namespace ak
