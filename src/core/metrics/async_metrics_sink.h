#pragma once

#include "core/metrics/metrics_sink.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace ak {

struct AsyncSinkStats {
    size_t depth = 0;
    size_t delivered = 0;
    size_t dropped = 0;
    size_t failed = 0;
};

// AsyncMetricsSink -- moves metrics delivery off the request path.
//
// record() copies the record into a bounded queue and returns. A single
// worker thread forwards queued records to the delegate in order.
//
// Backpressure: when the queue holds MAX_QUEUE_SIZE records the new record
// is dropped and counted. Records are never allowed to block a request.
//
// The destructor stops the worker after draining what is already queued.
class AsyncMetricsSink final : public MetricsSink {
public:
    static constexpr size_t MAX_QUEUE_SIZE = 1024;

    explicit AsyncMetricsSink(std::shared_ptr<MetricsSink> delegate,
                              size_t maxQueueSize = MAX_QUEUE_SIZE);
    ~AsyncMetricsSink() override;

    // Non-copyable, non-movable
    AsyncMetricsSink(const AsyncMetricsSink&) = delete;
    AsyncMetricsSink& operator=(const AsyncMetricsSink&) = delete;
    AsyncMetricsSink(AsyncMetricsSink&&) = delete;
    AsyncMetricsSink& operator=(AsyncMetricsSink&&) = delete;

    void record(const AdaptationMetricsRecord& record) override;

    // Block until every record queued so far has been handed to the delegate.
    void flush();

    // Drain the queue and stop the worker. Later records are dropped.
    void shutdown();

    AsyncSinkStats stats() const;

private:
    void workerLoop();

    std::shared_ptr<MetricsSink> m_delegate;
    const size_t m_maxQueueSize;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    std::deque<AdaptationMetricsRecord> m_queue;
    bool m_shutdown = false;
    bool m_busy = false;
    size_t m_delivered = 0;
    size_t m_dropped = 0;
    size_t m_failed = 0;

    std::thread m_worker;
};

} // namespace ak
