#include "core/metrics/async_metrics_sink.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <exception>

namespace ak {

// ── Construction / destruction ──────────────────────────────

AsyncMetricsSink::AsyncMetricsSink(std::shared_ptr<MetricsSink> delegate, size_t maxQueueSize)
    : m_delegate(std::move(delegate))
    , m_maxQueueSize(std::max<size_t>(1, maxQueueSize))
{
    m_worker = std::thread([this] { workerLoop(); });
}

AsyncMetricsSink::~AsyncMetricsSink()
{
    shutdown();
}

// ── Enqueue ─────────────────────────────────────────────────

void AsyncMetricsSink::record(const AdaptationMetricsRecord& record)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_shutdown) {
        ++m_dropped;
        LOG_WARN(akMetrics, "AsyncMetricsSink::record() called after shutdown");
        return;
    }

    if (m_queue.size() >= m_maxQueueSize) {
        ++m_dropped;
        LOG_WARN(akMetrics, "Metrics queue at capacity (%d), dropped record: %s",
                 static_cast<int>(m_maxQueueSize), qUtf8Printable(record.requestId));
        return;
    }

    m_queue.push_back(record);
    m_cv.notify_one();
}

// ── Worker ──────────────────────────────────────────────────

void AsyncMetricsSink::workerLoop()
{
    for (;;) {
        AdaptationMetricsRecord next;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_shutdown || !m_queue.empty(); });
            if (m_queue.empty()) {
                // Shutdown with nothing left to deliver.
                return;
            }
            next = std::move(m_queue.front());
            m_queue.pop_front();
            m_busy = true;
        }

        bool ok = true;
        if (m_delegate) {
            try {
                m_delegate->record(next);
            } catch (const std::exception& e) {
                ok = false;
                LOG_WARN(akMetrics, "Metrics delegate threw for %s: %s",
                         qUtf8Printable(next.requestId), e.what());
            } catch (...) {
                ok = false;
                LOG_WARN(akMetrics, "Metrics delegate threw for %s: unknown exception",
                         qUtf8Printable(next.requestId));
            }
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_busy = false;
        if (ok) {
            ++m_delivered;
        } else {
            ++m_failed;
        }
        if (m_queue.empty()) {
            m_idleCv.notify_all();
        }
    }
}

// ── Flush / shutdown ────────────────────────────────────────

void AsyncMetricsSink::flush()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return m_queue.empty() && !m_busy; });
}

void AsyncMetricsSink::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_shutdown) {
            m_shutdown = true;
            LOG_INFO(akMetrics, "AsyncMetricsSink shutting down (depth=%d, dropped=%d)",
                     static_cast<int>(m_queue.size()),
                     static_cast<int>(m_dropped));
            m_cv.notify_all();
        }
    }
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

// ── Stats ───────────────────────────────────────────────────

AsyncSinkStats AsyncMetricsSink::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    AsyncSinkStats s;
    s.depth = m_queue.size();
    s.delivered = m_delivered;
    s.dropped = m_dropped;
    s.failed = m_failed;
    return s;
}

} // namespace ak
