#include "core/learning/adapter_gate.h"

#include <cmath>

namespace ak {

namespace {

AdaptationReason reasonForUnusableRun(ConvergenceMonitor::State state)
{
    switch (state) {
    case ConvergenceMonitor::State::TimedOut:
        return AdaptationReason::Timeout;
    case ConvergenceMonitor::State::Cancelled:
        return AdaptationReason::Cancelled;
    case ConvergenceMonitor::State::Training:
    case ConvergenceMonitor::State::Converged:
    case ConvergenceMonitor::State::Exhausted:
    case ConvergenceMonitor::State::Failed:
        break;
    }
    return AdaptationReason::TrainingFailed;
}

} // namespace

bool AdapterGate::passes(const AdaptationConfig& config,
                         const GateInput& input,
                         AdaptationReason* reasonOut,
                         QString* detailOut)
{
    auto reject = [&](AdaptationReason reason, const QString& detail) {
        if (reasonOut) {
            *reasonOut = reason;
        }
        if (detailOut) {
            *detailOut = detail;
        }
        return false;
    };

    if (!input.runUsable) {
        return reject(reasonForUnusableRun(input.runState),
                      QStringLiteral("training run %1 is not usable")
                          .arg(ConvergenceMonitor::stateToString(input.runState)));
    }

    if (!std::isfinite(input.confidence) || input.confidence < config.confidenceThreshold) {
        return reject(AdaptationReason::LowConfidence,
                      QStringLiteral("confidence %1 below threshold %2")
                          .arg(input.confidence, 0, 'f', 3)
                          .arg(config.confidenceThreshold, 0, 'f', 3));
    }

    if (input.serializedSizeBytes > config.memoryLimitBytes) {
        return reject(AdaptationReason::MemoryLimitExceeded,
                      QStringLiteral("adapter size %1 exceeds limit %2")
                          .arg(input.serializedSizeBytes)
                          .arg(config.memoryLimitBytes));
    }

    if (reasonOut) {
        *reasonOut = AdaptationReason::None;
    }
    if (detailOut) {
        detailOut->clear();
    }
    return true;
}

} // namespace ak
