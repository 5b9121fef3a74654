#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QVector>

namespace ak {

class LowRankAdapter;

// TrainingObjective -- the differentiable loss an adapter is fitted against.
//
// prepare() is called once per run before the first step; step() applies
// one update to the adapter and returns the resulting loss. A non-finite
// return value aborts the run.
class TrainingObjective {
public:
    virtual ~TrainingObjective() = default;

    virtual int inputDim() const = 0;
    virtual int outputDim() const = 0;

    virtual bool prepare(const TrainingSet& instances, QString* errorOut) = 0;
    virtual double step(LowRankAdapter& adapter, double learningRate) = 0;
};

// Default objective. The frozen base contributes no delta, so the adapter
// alone maps the hashed bag-of-tokens features of a prompt to those of its
// target:
//
//   loss = mean_i || B * A * x_i - y_i ||^2
//
// x_i and y_i are L2-normalised, so a fresh adapter (B = 0) starts at 1.0.
// Tokens of the final "Input:" block are counted twice to separate the
// leave-one-out prompts, which share most of their context.
//
// Each step alternates: B is refitted in closed form (ridge least squares
// on the hidden states A * x_i), then A takes one clipped gradient step of
// size learningRate. The loss plateaus after the first refit whenever the
// instances fit within the rank.
class HashedProjectionObjective final : public TrainingObjective {
public:
    explicit HashedProjectionObjective(int featureDim, double gradientClipNorm = 5.0);

    int inputDim() const override { return m_featureDim; }
    int outputDim() const override { return m_featureDim; }

    bool prepare(const TrainingSet& instances, QString* errorOut) override;
    double step(LowRankAdapter& adapter, double learningRate) override;

    double evaluate(const LowRankAdapter& adapter) const;

    static QVector<float> featurize(const QString& text, int dim);
    static QVector<float> featurizePrompt(const QString& prompt, int dim);

private:
    bool solveOutputFactor(const QVector<double>& hidden, LowRankAdapter& adapter) const;

    int m_featureDim;
    double m_clipNorm;
    QVector<QVector<float>> m_inputs;
    QVector<QVector<float>> m_targets;
};

} // namespace ak
