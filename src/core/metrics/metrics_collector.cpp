#include "core/metrics/metrics_collector.h"

namespace ak {

void MetricsCollector::record(const AdaptationMetricsRecord& record)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_total;
    m_totalSteps += record.stepsRun;
    m_totalElapsedMs += record.elapsedMs;
    if (record.patternDetected) {
        ++m_patternCounts[static_cast<int>(*record.patternDetected)];
    }
    if (record.accepted) {
        ++m_accepted;
        m_acceptedConfidenceSum += record.confidenceScore;
    } else {
        ++m_fallbacksByReason[static_cast<int>(record.rejectionReason)];
    }
}

int MetricsCollector::totalRequests() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_total;
}

int MetricsCollector::acceptedCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_accepted;
}

int MetricsCollector::fallbackCount(AdaptationReason reason) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_fallbacksByReason.value(static_cast<int>(reason), 0);
}

double MetricsCollector::acceptanceRate() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_total > 0 ? static_cast<double>(m_accepted) / m_total : 0.0;
}

double MetricsCollector::meanAcceptedConfidence() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_accepted > 0 ? m_acceptedConfidenceSum / m_accepted : 0.0;
}

QJsonObject MetricsCollector::healthSnapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    QJsonObject fallbacks;
    for (auto it = m_fallbacksByReason.constBegin(); it != m_fallbacksByReason.constEnd(); ++it) {
        fallbacks[adaptationReasonToString(static_cast<AdaptationReason>(it.key()))] = it.value();
    }
    QJsonObject patterns;
    for (auto it = m_patternCounts.constBegin(); it != m_patternCounts.constEnd(); ++it) {
        patterns[patternKindToString(static_cast<PatternKind>(it.key()))] = it.value();
    }

    QJsonObject snapshot;
    snapshot[QStringLiteral("totalRequests")] = m_total;
    snapshot[QStringLiteral("accepted")] = m_accepted;
    snapshot[QStringLiteral("acceptanceRate")] = m_total > 0
        ? static_cast<double>(m_accepted) / m_total
        : 0.0;
    snapshot[QStringLiteral("meanAcceptedConfidence")] = m_accepted > 0
        ? m_acceptedConfidenceSum / m_accepted
        : 0.0;
    snapshot[QStringLiteral("meanSteps")] = m_total > 0
        ? static_cast<double>(m_totalSteps) / m_total
        : 0.0;
    snapshot[QStringLiteral("meanElapsedMs")] = m_total > 0
        ? static_cast<double>(m_totalElapsedMs) / m_total
        : 0.0;
    snapshot[QStringLiteral("fallbacksByReason")] = fallbacks;
    snapshot[QStringLiteral("patterns")] = patterns;
    return snapshot;
}

void MetricsCollector::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_total = 0;
    m_accepted = 0;
    m_totalSteps = 0;
    m_totalElapsedMs = 0;
    m_acceptedConfidenceSum = 0.0;
    m_fallbacksByReason.clear();
    m_patternCounts.clear();
}

} // namespace ak
