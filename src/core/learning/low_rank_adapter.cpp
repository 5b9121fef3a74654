#include "core/learning/low_rank_adapter.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace ak {

namespace {

// rank, inputDim, outputDim as int32 plus two float64 scores.
constexpr int64_t kSerializedHeaderBytes = 3 * sizeof(int32_t) + 2 * sizeof(double);

} // namespace

LowRankAdapter::LowRankAdapter(int inputDim, int outputDim, int rank)
    : m_inputDim(std::max(1, inputDim))
    , m_outputDim(std::max(1, outputDim))
    , m_rank(std::max(1, rank))
{
    m_weights.a.fill(0.0f, m_rank * m_inputDim);
    m_weights.b.fill(0.0f, m_outputDim * m_rank);
}

LowRankAdapter::~LowRankAdapter()
{
    dispose();
}

void LowRankAdapter::initialize(uint32_t seed)
{
    if (m_disposed) {
        return;
    }
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f / std::sqrt(static_cast<float>(m_rank)));
    for (float& value : m_weights.a) {
        value = dist(rng);
    }
    std::fill(m_weights.b.begin(), m_weights.b.end(), 0.0f);
}

void LowRankAdapter::restore(const Weights& weights)
{
    if (m_disposed
        || weights.a.size() != m_weights.a.size()
        || weights.b.size() != m_weights.b.size()) {
        return;
    }
    m_weights = weights;
}

QVector<float> LowRankAdapter::project(const QVector<float>& x) const
{
    if (m_disposed || x.size() != m_inputDim) {
        return {};
    }

    QVector<float> hidden(m_rank, 0.0f);
    for (int r = 0; r < m_rank; ++r) {
        const float* row = m_weights.a.constData() + static_cast<size_t>(r) * m_inputDim;
        float acc = 0.0f;
        for (int j = 0; j < m_inputDim; ++j) {
            acc += row[j] * x.at(j);
        }
        hidden[r] = acc;
    }

    QVector<float> out(m_outputDim, 0.0f);
    for (int o = 0; o < m_outputDim; ++o) {
        const float* row = m_weights.b.constData() + static_cast<size_t>(o) * m_rank;
        float acc = 0.0f;
        for (int r = 0; r < m_rank; ++r) {
            acc += row[r] * hidden.at(r);
        }
        out[o] = acc;
    }
    return out;
}

int64_t LowRankAdapter::serializedSizeFor(int inputDim, int outputDim, int rank)
{
    const int64_t params = static_cast<int64_t>(rank) * inputDim
        + static_cast<int64_t>(outputDim) * rank;
    return kSerializedHeaderBytes + params * static_cast<int64_t>(sizeof(float));
}

int64_t LowRankAdapter::serializedSizeBytes() const
{
    return serializedSizeFor(m_inputDim, m_outputDim, m_rank);
}

void LowRankAdapter::setScores(double confidence, double convergence)
{
    m_confidenceScore = confidence;
    m_convergenceScore = convergence;
}

void LowRankAdapter::dispose()
{
    if (m_disposed) {
        return;
    }
    // Release the storage, not just the contents.
    m_weights.a = QVector<float>();
    m_weights.b = QVector<float>();
    m_disposed = true;
}

} // namespace ak
