#pragma once

#include "core/learning/convergence_monitor.h"
#include "core/shared/adaptation_config.h"
#include "core/shared/types.h"

#include <QString>

#include <cstdint>

namespace ak {

struct GateInput {
    bool runUsable = false;
    ConvergenceMonitor::State runState = ConvergenceMonitor::State::Training;
    double confidence = 0.0;
    int64_t serializedSizeBytes = 0;
};

// AdapterGate -- all-or-nothing acceptance of a trained adapter.
//
// Checked in order: a failed run (Timeout / Cancelled / TrainingFailed),
// then confidence below config.confidenceThreshold (LowConfidence, whatever
// the size), then size above config.memoryLimitBytes (MemoryLimitExceeded).
class AdapterGate {
public:
    static bool passes(const AdaptationConfig& config,
                       const GateInput& input,
                       AdaptationReason* reasonOut,
                       QString* detailOut = nullptr);
};

} // namespace ak
