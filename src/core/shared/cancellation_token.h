#pragma once

#include <atomic>

namespace ak {

// Cooperative cancellation flag for one request. The owner (e.g. the
// connection handler) calls cancel() from any thread; pipeline stages poll
// isCancelled() at their boundaries and once per training step.
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { m_cancelled.store(true, std::memory_order_release); }
    bool isCancelled() const { return m_cancelled.load(std::memory_order_acquire); }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace ak
