#pragma once

#include "core/metrics/metrics_sink.h"

#include <QHash>
#include <QJsonObject>

#include <mutex>

namespace ak {

// In-process aggregate of adaptation outcomes, shared by all requests.
class MetricsCollector final : public MetricsSink {
public:
    void record(const AdaptationMetricsRecord& record) override;

    int totalRequests() const;
    int acceptedCount() const;
    int fallbackCount(AdaptationReason reason) const;
    double acceptanceRate() const;
    double meanAcceptedConfidence() const;

    QJsonObject healthSnapshot() const;
    void reset();

private:
    mutable std::mutex m_mutex;
    int m_total = 0;
    int m_accepted = 0;
    qint64 m_totalSteps = 0;
    qint64 m_totalElapsedMs = 0;
    double m_acceptedConfidenceSum = 0.0;
    QHash<int, int> m_fallbacksByReason;
    QHash<int, int> m_patternCounts;
};

} // namespace ak
