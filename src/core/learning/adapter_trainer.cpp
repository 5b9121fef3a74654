#include "core/learning/adapter_trainer.h"

#include "core/learning/low_rank_adapter.h"
#include "core/learning/training_objective.h"
#include "core/shared/cancellation_token.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <cmath>
#include <limits>

namespace ak {

namespace {

void finishRun(const ConvergenceMonitor& monitor, const QElapsedTimer& timer, TrainingRun* run)
{
    run->losses = monitor.losses();
    run->stopState = monitor.state();
    run->earlyStopped = monitor.earlyStopped();
    run->timedOut = monitor.state() == ConvergenceMonitor::State::TimedOut;
    run->usable = monitor.usable();
    run->elapsedMs = timer.elapsed();
}

} // namespace

AdapterTrainer::AdapterTrainer(const AdaptationConfig& config)
    : m_config(config)
{
}

TrainingRun AdapterTrainer::train(const TrainingSet& instances,
                                  LowRankAdapter& adapter,
                                  TrainingObjective& objective,
                                  const CancellationToken* cancel) const
{
    QElapsedTimer timer;
    timer.start();

    TrainingRun run;
    run.rank = adapter.rank();
    run.learningRate = m_config.learningRate;

    ConvergenceMonitor monitor(m_config.minSteps, m_config.maxSteps, m_config.convergenceThreshold);
    const qint64 budgetMs = m_config.maxAdaptationTimeMs;

    if (adapter.isDisposed()) {
        monitor.markFailed();
        run.failureMessage = QStringLiteral("adapter already disposed");
        finishRun(monitor, timer, &run);
        return run;
    }

    adapter.initialize(m_config.initSeed);

    QString prepareError;
    if (!objective.prepare(instances, &prepareError)) {
        LOG_WARN(akTraining, "Objective rejected %d instance(s): %s",
                 static_cast<int>(instances.size()), qUtf8Printable(prepareError));
        monitor.markFailed();
        run.failureMessage = prepareError;
        finishRun(monitor, timer, &run);
        return run;
    }

    LowRankAdapter::Weights best = adapter.snapshot();
    double bestLoss = std::numeric_limits<double>::infinity();

    while (!monitor.isTerminal()) {
        if (cancel && cancel->isCancelled()) {
            monitor.markCancelled();
            break;
        }
        if (timer.elapsed() >= budgetMs) {
            monitor.markTimedOut();
            break;
        }

        const double loss = objective.step(adapter, m_config.learningRate);
        const bool overBudget = timer.elapsed() > budgetMs;
        monitor.recordStep(loss, overBudget);

        if (monitor.state() == ConvergenceMonitor::State::Failed) {
            run.failureMessage = QStringLiteral("non-finite loss at step %1").arg(monitor.steps() + 1);
            break;
        }
        if (loss < bestLoss) {
            bestLoss = loss;
            best = adapter.snapshot();
        }
    }

    if (monitor.state() == ConvergenceMonitor::State::TimedOut && std::isfinite(bestLoss)) {
        adapter.restore(best);
    }

    finishRun(monitor, timer, &run);
    LOG_INFO(akTraining,
             "Training %s after %d step(s) in %lld ms (rank=%d, final loss=%.4f)",
             qUtf8Printable(ConvergenceMonitor::stateToString(run.stopState)),
             run.stepsRun(),
             static_cast<long long>(run.elapsedMs),
             run.rank,
             run.finalLoss());
    return run;
}

} // namespace ak
