#pragma once

#include <QString>
#include <QVector>

namespace ak {

// ConvergenceMonitor -- step-by-step stopping decision for adapter training.
//
//   Training -> Converged   improvement loss[k-1] - loss[k] below threshold
//            -> Exhausted   maxSteps reached without converging
//            -> TimedOut    wall-clock budget hit (takes precedence)
//            -> Cancelled   request cancelled
//            -> Failed      non-finite or negative loss
//
// Early stopping is only considered once k >= max(2, minSteps). Losses
// recorded before a terminal transition are always kept.
class ConvergenceMonitor {
public:
    enum class State {
        Training,
        Converged,
        Exhausted,
        TimedOut,
        Cancelled,
        Failed,
    };

    ConvergenceMonitor(int minSteps, int maxSteps, double convergenceThreshold);

    // Records the loss of the step just completed. When deadlineExceeded is
    // set the loss is kept and the run moves to TimedOut.
    State recordStep(double loss, bool deadlineExceeded = false);

    State markTimedOut();
    State markCancelled();
    State markFailed();

    State state() const { return m_state; }
    bool isTerminal() const { return m_state != State::Training; }
    int steps() const { return m_losses.size(); }
    const QVector<double>& losses() const { return m_losses; }

    bool earlyStopped() const { return m_state == State::Converged; }
    bool usable() const;

    static QString stateToString(State state);

private:
    State transition(State next);

    int m_minSteps;
    int m_maxSteps;
    double m_threshold;
    State m_state = State::Training;
    QVector<double> m_losses;
};

} // namespace ak
