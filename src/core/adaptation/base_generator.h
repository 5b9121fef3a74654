#pragma once

#include "core/adaptation/task_context.h"
#include "core/shared/types.h"

#include <QString>

namespace ak {

class LowRankAdapter;

// BaseGenerator -- the frozen base model's generation entry point.
//
// adapter is null on the fallback path. The generator must treat the base
// weights as read-only and must not retain the adapter pointer past the
// call. Failure is reported through the return value and errorOut; a
// thrown std::exception is treated the same way.
class BaseGenerator {
public:
    virtual ~BaseGenerator() = default;

    virtual bool generate(const TaskContext& context,
                          const QString& prompt,
                          const LowRankAdapter* adapter,
                          QString* textOut,
                          QString* errorOut) = 0;
};

} // namespace ak
