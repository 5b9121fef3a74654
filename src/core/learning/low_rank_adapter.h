#pragma once

#include <QVector>

#include <cstdint>

namespace ak {

// LowRankAdapter -- request-scoped parameter delta W = B * A.
//
// A is rank x inputDim, B is outputDim x rank, both row-major. The adapter
// is never persisted; dispose() releases the weights and the object must
// not be used for projection afterwards.
class LowRankAdapter {
public:
    struct Weights {
        QVector<float> a;
        QVector<float> b;
    };

    LowRankAdapter(int inputDim, int outputDim, int rank);
    ~LowRankAdapter();

    LowRankAdapter(const LowRankAdapter&) = delete;
    LowRankAdapter& operator=(const LowRankAdapter&) = delete;
    LowRankAdapter(LowRankAdapter&&) = delete;
    LowRankAdapter& operator=(LowRankAdapter&&) = delete;

    // A ~ N(0, 1/rank) from a fixed seed, B = 0: the fresh delta is exactly zero.
    void initialize(uint32_t seed);

    int inputDim() const { return m_inputDim; }
    int outputDim() const { return m_outputDim; }
    int rank() const { return m_rank; }

    QVector<float>& a() { return m_weights.a; }
    QVector<float>& b() { return m_weights.b; }
    const QVector<float>& a() const { return m_weights.a; }
    const QVector<float>& b() const { return m_weights.b; }

    Weights snapshot() const { return m_weights; }
    void restore(const Weights& weights);

    // Returns B * (A * x). Empty when disposed or x has the wrong size.
    QVector<float> project(const QVector<float>& x) const;

    static int64_t serializedSizeFor(int inputDim, int outputDim, int rank);
    int64_t serializedSizeBytes() const;

    double confidenceScore() const { return m_confidenceScore; }
    double convergenceScore() const { return m_convergenceScore; }
    void setScores(double confidence, double convergence);

    void dispose();
    bool isDisposed() const { return m_disposed; }

private:
    int m_inputDim = 0;
    int m_outputDim = 0;
    int m_rank = 0;
    Weights m_weights;
    double m_confidenceScore = 0.0;
    double m_convergenceScore = 0.0;
    bool m_disposed = false;
};

} // namespace ak
