#pragma once

#include "core/shared/types.h"

#include <QVector>

#include <array>
#include <cstdint>

namespace ak {

// Per-kind detection and extraction limits.
struct PatternRule {
    double weight = 0.5;      // structural confidence weight
    int minExamples = 2;
    int maxExamples = 8;
    int minStrength = 1;      // markers required before the kind counts as a match
};

struct AdaptationConfig {
    AdaptationConfig();

    const PatternRule& rule(PatternKind kind) const
    {
        return patternRules[static_cast<size_t>(kind)];
    }
    PatternRule& rule(PatternKind kind)
    {
        return patternRules[static_cast<size_t>(kind)];
    }

    // Pattern detection / extraction
    std::array<PatternRule, kPatternKindCount> patternRules;

    // Adapter shape
    QVector<int> allowedRanks = {8, 16, 32, 64};
    int adapterRank = 8;
    int featureDim = 256;
    uint32_t initSeed = 0x5eedu;

    // Training loop
    int minSteps = 2;
    int maxSteps = 8;
    double learningRate = 0.3;
    double convergenceThreshold = 0.01;
    double gradientClipNorm = 5.0;
    int maxAdaptationTimeMs = 5000;

    // Gate
    double confidenceThreshold = 0.7;
    int64_t memoryLimitBytes = 32 * 1024 * 1024;   // 32 MiB
};

} // namespace ak
