#include "core/learning/confidence_scorer.h"

#include "core/learning/training_run.h"

#include <algorithm>
#include <cmath>

namespace ak {

ConfidenceScores ConfidenceScorer::score(double finalLoss, bool earlyStopped)
{
    ConfidenceScores scores;
    if (!std::isfinite(finalLoss)) {
        return scores;
    }
    scores.convergence = std::clamp((2.0 - finalLoss) / 2.0, 0.0, 1.0);
    scores.confidence = scores.convergence * (earlyStopped ? kConvergedFactor : kUnconvergedFactor);
    return scores;
}

ConfidenceScores ConfidenceScorer::score(const TrainingRun& run)
{
    if (run.losses.isEmpty()) {
        return ConfidenceScores();
    }
    return score(run.finalLoss(), run.earlyStopped);
}

} // namespace ak
