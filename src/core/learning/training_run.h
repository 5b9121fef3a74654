#pragma once

#include "core/learning/convergence_monitor.h"

#include <QString>
#include <QVector>

namespace ak {

// Outcome of one AdapterTrainer::train() call. Returned by value once the
// loop has halted; nothing mutates it afterwards.
struct TrainingRun {
    QVector<double> losses;
    ConvergenceMonitor::State stopState = ConvergenceMonitor::State::Training;
    bool earlyStopped = false;
    bool timedOut = false;
    bool usable = false;
    qint64 elapsedMs = 0;
    int rank = 0;
    double learningRate = 0.0;
    QString failureMessage;

    int stepsRun() const { return losses.size(); }
    double finalLoss() const { return losses.isEmpty() ? 0.0 : losses.last(); }
};

} // namespace ak
