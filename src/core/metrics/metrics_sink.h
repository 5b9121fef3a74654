#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <memory>
#include <optional>
#include <vector>

namespace ak {

// One record per request, emitted after the adaptation decision.
struct AdaptationMetricsRecord {
    QString requestId;
    QDateTime recordedAt;
    std::optional<PatternKind> patternDetected;
    int examplesCount = 0;
    int stepsRun = 0;
    qint64 elapsedMs = 0;
    double confidenceScore = 0.0;
    double convergenceScore = 0.0;
    bool accepted = false;
    AdaptationReason rejectionReason = AdaptationReason::None;

    QJsonObject toJson() const;
};

// MetricsSink -- fire-and-forget consumer of per-request records.
//
// record() may be called from any request thread. Implementations should
// return quickly; the pipeline catches and logs anything thrown.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual void record(const AdaptationMetricsRecord& record) = 0;
};

// Forwards every record to each registered sink. A throwing sink does not
// prevent delivery to the others.
class FanoutMetricsSink final : public MetricsSink {
public:
    void addSink(std::shared_ptr<MetricsSink> sink);
    void record(const AdaptationMetricsRecord& record) override;

private:
    std::vector<std::shared_ptr<MetricsSink>> m_sinks;
};

} // namespace ak
