#include "core/learning/training_objective.h"

#include "core/learning/low_rank_adapter.h"
#include "core/shared/logging.h"

#include <QHash>
#include <QRegularExpression>
#include <QStringList>

#include <algorithm>
#include <cmath>
#include <limits>

namespace ak {

namespace {

constexpr size_t kHashSeed = 0x9e3779b9u;
constexpr double kQueryTailWeight = 2.0;
constexpr double kRidgeFactor = 1e-6;
constexpr double kRidgeFloor = 1e-12;

void accumulateTokens(const QString& text, double weight, QVector<float>* features)
{
    static const QRegularExpression nonWord(QStringLiteral(R"([^\p{L}\p{N}]+)"));
    const int dim = features->size();
    const QStringList tokens = text.toLower().split(nonWord, Qt::SkipEmptyParts);
    for (const QString& token : tokens) {
        const size_t h = qHash(token, kHashSeed);
        const int index = static_cast<int>(h % static_cast<size_t>(dim));
        const float sign = ((h / static_cast<size_t>(dim)) & 1u) ? -1.0f : 1.0f;
        (*features)[index] += sign * static_cast<float>(weight);
    }
}

void normalize(QVector<float>* features)
{
    double norm = 0.0;
    for (float value : *features) {
        norm += static_cast<double>(value) * value;
    }
    norm = std::sqrt(norm);
    if (norm <= 0.0) {
        return;
    }
    for (float& value : *features) {
        value = static_cast<float>(value / norm);
    }
}

} // namespace

HashedProjectionObjective::HashedProjectionObjective(int featureDim, double gradientClipNorm)
    : m_featureDim(std::max(1, featureDim))
    , m_clipNorm(gradientClipNorm)
{
}

QVector<float> HashedProjectionObjective::featurize(const QString& text, int dim)
{
    QVector<float> features(std::max(1, dim), 0.0f);
    accumulateTokens(text, 1.0, &features);
    normalize(&features);
    return features;
}

QVector<float> HashedProjectionObjective::featurizePrompt(const QString& prompt, int dim)
{
    QVector<float> features(std::max(1, dim), 0.0f);
    accumulateTokens(prompt, 1.0, &features);
    const int tail = prompt.lastIndexOf(QStringLiteral("Input:"));
    if (tail >= 0) {
        accumulateTokens(prompt.mid(tail), kQueryTailWeight, &features);
    }
    normalize(&features);
    return features;
}

bool HashedProjectionObjective::prepare(const TrainingSet& instances, QString* errorOut)
{
    m_inputs.clear();
    m_targets.clear();
    if (instances.isEmpty()) {
        if (errorOut) {
            *errorOut = QStringLiteral("no training instances");
        }
        return false;
    }

    m_inputs.reserve(instances.size());
    m_targets.reserve(instances.size());
    for (const TrainingInstance& instance : instances) {
        m_inputs.append(featurizePrompt(instance.prompt, m_featureDim));
        m_targets.append(featurize(instance.target, m_featureDim));
    }
    return true;
}

double HashedProjectionObjective::evaluate(const LowRankAdapter& adapter) const
{
    if (m_inputs.isEmpty()) {
        return 0.0;
    }
    double loss = 0.0;
    for (int i = 0; i < m_inputs.size(); ++i) {
        const QVector<float> predicted = adapter.project(m_inputs.at(i));
        if (predicted.size() != m_featureDim) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        const QVector<float>& target = m_targets.at(i);
        for (int o = 0; o < m_featureDim; ++o) {
            const double residual = static_cast<double>(predicted.at(o)) - target.at(o);
            loss += residual * residual;
        }
    }
    return loss / static_cast<double>(m_inputs.size());
}

bool HashedProjectionObjective::solveOutputFactor(const QVector<double>& hidden,
                                                  LowRankAdapter& adapter) const
{
    const int dim = m_featureDim;
    const int rank = adapter.rank();
    const int count = m_inputs.size();

    // Normal equations of the ridge problem: M = H H^T + lambda I (rank x rank),
    // C = Y H^T (dim x rank), B = C M^-1.
    QVector<double> m(rank * rank, 0.0);
    QVector<double> c(dim * rank, 0.0);
    for (int i = 0; i < count; ++i) {
        const double* h = hidden.constData() + i * rank;
        for (int p = 0; p < rank; ++p) {
            for (int q = 0; q <= p; ++q) {
                m[p * rank + q] += h[p] * h[q];
            }
        }
        const QVector<float>& y = m_targets.at(i);
        for (int o = 0; o < dim; ++o) {
            const double target = y.at(o);
            if (target == 0.0) {
                continue;
            }
            for (int r = 0; r < rank; ++r) {
                c[o * rank + r] += target * h[r];
            }
        }
    }

    double trace = 0.0;
    for (int p = 0; p < rank; ++p) {
        trace += m.at(p * rank + p);
    }
    const double lambda = kRidgeFactor * trace / rank + kRidgeFloor;

    // In-place Cholesky factor of the lower triangle.
    for (int p = 0; p < rank; ++p) {
        m[p * rank + p] += lambda;
        for (int q = 0; q <= p; ++q) {
            double sum = m.at(p * rank + q);
            for (int k = 0; k < q; ++k) {
                sum -= m.at(p * rank + k) * m.at(q * rank + k);
            }
            if (p == q) {
                if (!(sum > 0.0) || !std::isfinite(sum)) {
                    LOG_WARN(akTraining, "Ridge system not positive definite at pivot %d", p);
                    return false;
                }
                m[p * rank + p] = std::sqrt(sum);
            } else {
                m[p * rank + q] = sum / m.at(q * rank + q);
            }
        }
    }

    QVector<float>& b = adapter.b();
    QVector<double> z(rank, 0.0);
    for (int o = 0; o < dim; ++o) {
        const double* row = c.constData() + o * rank;
        for (int p = 0; p < rank; ++p) {
            double sum = row[p];
            for (int k = 0; k < p; ++k) {
                sum -= m.at(p * rank + k) * z.at(k);
            }
            z[p] = sum / m.at(p * rank + p);
        }
        for (int p = rank - 1; p >= 0; --p) {
            double sum = z.at(p);
            for (int k = p + 1; k < rank; ++k) {
                sum -= m.at(k * rank + p) * z.at(k);
            }
            z[p] = sum / m.at(p * rank + p);
        }
        for (int r = 0; r < rank; ++r) {
            b[o * rank + r] = static_cast<float>(z.at(r));
        }
    }
    return true;
}

double HashedProjectionObjective::step(LowRankAdapter& adapter, double learningRate)
{
    if (adapter.isDisposed()
        || adapter.inputDim() != m_featureDim
        || adapter.outputDim() != m_featureDim
        || m_inputs.isEmpty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    const int dim = m_featureDim;
    const int rank = adapter.rank();
    const int count = m_inputs.size();

    QVector<double> hidden(count * rank, 0.0);
    const QVector<float>& a = adapter.a();
    for (int i = 0; i < count; ++i) {
        const QVector<float>& x = m_inputs.at(i);
        for (int r = 0; r < rank; ++r) {
            double acc = 0.0;
            for (int j = 0; j < dim; ++j) {
                acc += static_cast<double>(a.at(r * dim + j)) * x.at(j);
            }
            hidden[i * rank + r] = acc;
        }
    }

    if (!solveOutputFactor(hidden, adapter)) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    // Gradient of the loss with respect to A, holding the fitted B.
    const double scale = 2.0 / static_cast<double>(count);
    const QVector<float>& b = adapter.b();
    QVector<double> gradA(rank * dim, 0.0);
    QVector<double> backHidden(rank, 0.0);
    for (int i = 0; i < count; ++i) {
        const QVector<float>& x = m_inputs.at(i);
        const QVector<float>& y = m_targets.at(i);
        const double* h = hidden.constData() + i * rank;

        std::fill(backHidden.begin(), backHidden.end(), 0.0);
        for (int o = 0; o < dim; ++o) {
            double predicted = 0.0;
            for (int r = 0; r < rank; ++r) {
                predicted += static_cast<double>(b.at(o * rank + r)) * h[r];
            }
            const double e = predicted - y.at(o);
            if (e == 0.0) {
                continue;
            }
            for (int r = 0; r < rank; ++r) {
                backHidden[r] += e * b.at(o * rank + r);
            }
        }
        for (int r = 0; r < rank; ++r) {
            const double g = scale * backHidden.at(r);
            if (g == 0.0) {
                continue;
            }
            for (int j = 0; j < dim; ++j) {
                gradA[r * dim + j] += g * x.at(j);
            }
        }
    }

    double norm = 0.0;
    for (double g : gradA) {
        norm += g * g;
    }
    norm = std::sqrt(norm);
    if (!std::isfinite(norm)) {
        LOG_WARN(akTraining, "Non-finite gradient norm, aborting step");
        return std::numeric_limits<double>::quiet_NaN();
    }

    double stepScale = learningRate;
    if (m_clipNorm > 0.0 && norm > m_clipNorm) {
        stepScale *= m_clipNorm / norm;
    }

    QVector<float>& aw = adapter.a();
    for (int k = 0; k < aw.size(); ++k) {
        aw[k] = static_cast<float>(aw.at(k) - stepScale * gradA.at(k));
    }

    return evaluate(adapter);
}

} // namespace ak
