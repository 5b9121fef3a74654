#pragma once

#include "core/adaptation/base_generator.h"

namespace ak {

// Stand-in base model for the CLI: echoes the prompt's live input and the
// adapter it would have run with.
class DryRunGenerator final : public BaseGenerator {
public:
    bool generate(const TaskContext& context,
                  const QString& prompt,
                  const LowRankAdapter* adapter,
                  QString* textOut,
                  QString* errorOut) override;
};

} // namespace ak
