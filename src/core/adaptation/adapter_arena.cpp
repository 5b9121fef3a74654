#include "core/adaptation/adapter_arena.h"

#include "core/learning/low_rank_adapter.h"
#include "core/shared/logging.h"

namespace ak {

AdapterArena::~AdapterArena()
{
    dispose();
}

LowRankAdapter* AdapterArena::create(int inputDim, int outputDim, int rank)
{
    dispose();
    m_adapter = std::make_unique<LowRankAdapter>(inputDim, outputDim, rank);
    ++m_created;
    return m_adapter.get();
}

void AdapterArena::dispose()
{
    if (!m_adapter) {
        return;
    }
    m_adapter->dispose();
    m_adapter.reset();
    ++m_disposed;
    LOG_DEBUG(akLifecycle, "Adapter disposed (%d created, %d disposed)", m_created, m_disposed);
}

} // namespace ak
