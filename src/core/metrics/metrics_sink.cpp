#include "core/metrics/metrics_sink.h"

#include "core/shared/logging.h"

#include <exception>

namespace ak {

QJsonObject AdaptationMetricsRecord::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("requestId")] = requestId;
    json[QStringLiteral("recordedAt")] = recordedAt.toString(Qt::ISODateWithMs);
    json[QStringLiteral("patternDetected")] = patternDetected
        ? QJsonValue(patternKindToString(*patternDetected))
        : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("examplesCount")] = examplesCount;
    json[QStringLiteral("stepsRun")] = stepsRun;
    json[QStringLiteral("elapsedMs")] = elapsedMs;
    json[QStringLiteral("confidenceScore")] = confidenceScore;
    json[QStringLiteral("convergenceScore")] = convergenceScore;
    json[QStringLiteral("accepted")] = accepted;
    json[QStringLiteral("rejectionReason")] = accepted
        ? QJsonValue(QJsonValue::Null)
        : QJsonValue(adaptationReasonToString(rejectionReason));
    return json;
}

void FanoutMetricsSink::addSink(std::shared_ptr<MetricsSink> sink)
{
    if (sink) {
        m_sinks.push_back(std::move(sink));
    }
}

void FanoutMetricsSink::record(const AdaptationMetricsRecord& record)
{
    for (const std::shared_ptr<MetricsSink>& sink : m_sinks) {
        try {
            sink->record(record);
        } catch (const std::exception& e) {
            LOG_WARN(akMetrics, "Metrics sink failed for request %s: %s",
                     qUtf8Printable(record.requestId), e.what());
        } catch (...) {
            LOG_WARN(akMetrics, "Metrics sink failed for request %s: unknown exception",
                     qUtf8Printable(record.requestId));
        }
    }
}

} // namespace ak
