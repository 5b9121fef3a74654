#pragma once

#include "core/learning/training_run.h"
#include "core/shared/adaptation_config.h"
#include "core/shared/types.h"

namespace ak {

class CancellationToken;
class LowRankAdapter;
class TrainingObjective;

// AdapterTrainer -- bounded synchronous update loop.
//
// Runs at most config.maxSteps updates, one loss per step, and checks the
// wall-clock budget and the cancellation token once per step. On timeout
// the adapter is rolled back to the lowest-loss weights seen so far and
// the completed steps are kept in the run.
class AdapterTrainer {
public:
    explicit AdapterTrainer(const AdaptationConfig& config);

    TrainingRun train(const TrainingSet& instances,
                      LowRankAdapter& adapter,
                      TrainingObjective& objective,
                      const CancellationToken* cancel = nullptr) const;

private:
    AdaptationConfig m_config;
};

} // namespace ak
