#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace ak {

class LowRankAdapter;

// Transparency annotation returned with every response.
// confidence is set whenever a training run was scored; reason is set
// whenever the request fell back.
struct AdaptationStatus {
    bool enabled = false;
    std::optional<double> confidence;
    std::optional<AdaptationReason> reason;

    // {"enabled": bool, "confidence": number|null, "reason": string|null}
    QJsonObject toJson() const;
};

// Outcome of the adaptation half of a request. accepted implies a live
// adapter owned by the manager's arena; a rejected decision never carries one.
struct AdaptationDecision {
    bool accepted = false;
    AdaptationReason reason = AdaptationReason::None;
    const LowRankAdapter* adapter = nullptr;
    double confidence = 0.0;
    double convergence = 0.0;
    bool scored = false;
};

struct AdaptationResponse {
    bool ok = false;
    QString text;
    AdaptationStatus status;
    QString error;      // set only on request-level (generation) failure
};

} // namespace ak
