#pragma once

namespace ak {

struct TrainingRun;

struct ConfidenceScores {
    double convergence = 0.0;
    double confidence = 0.0;
};

// convergence = clamp((2 - finalLoss) / 2, 0, 1)
// confidence  = convergence * (earlyStopped ? 0.9 : 0.7)
//
// Runs that only stopped because the step budget ran out are trusted less
// than runs that converged.
class ConfidenceScorer {
public:
    static constexpr double kConvergedFactor = 0.9;
    static constexpr double kUnconvergedFactor = 0.7;

    static ConfidenceScores score(double finalLoss, bool earlyStopped);
    static ConfidenceScores score(const TrainingRun& run);
};

} // namespace ak
