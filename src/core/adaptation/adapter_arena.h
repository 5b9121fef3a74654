#pragma once

#include <cstdint>
#include <memory>

namespace ak {

class LowRankAdapter;

// AdapterArena -- request-scoped owner of the single live adapter.
//
// create() disposes any previous adapter first, so at most one is alive.
// The destructor disposes whatever is left, which makes every exit path of
// the owning request (return, rejection, exception) release the weights.
class AdapterArena {
public:
    AdapterArena() = default;
    ~AdapterArena();

    AdapterArena(const AdapterArena&) = delete;
    AdapterArena& operator=(const AdapterArena&) = delete;
    AdapterArena(AdapterArena&&) = delete;
    AdapterArena& operator=(AdapterArena&&) = delete;

    LowRankAdapter* create(int inputDim, int outputDim, int rank);
    LowRankAdapter* current() const { return m_adapter.get(); }
    bool hasLiveAdapter() const { return m_adapter != nullptr; }

    void dispose();

    int createdCount() const { return m_created; }
    int disposedCount() const { return m_disposed; }

private:
    std::unique_ptr<LowRankAdapter> m_adapter;
    int m_created = 0;
    int m_disposed = 0;
};

} // namespace ak
