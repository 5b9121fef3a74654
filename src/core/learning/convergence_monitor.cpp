#include "core/learning/convergence_monitor.h"

#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace ak {

ConvergenceMonitor::ConvergenceMonitor(int minSteps, int maxSteps, double convergenceThreshold)
    : m_minSteps(std::max(1, minSteps))
    , m_maxSteps(std::max(m_minSteps, maxSteps))
    , m_threshold(convergenceThreshold)
{
}

ConvergenceMonitor::State ConvergenceMonitor::recordStep(double loss, bool deadlineExceeded)
{
    if (isTerminal()) {
        return m_state;
    }

    if (!std::isfinite(loss) || loss < 0.0) {
        LOG_WARN(akTraining, "Rejecting step %d loss %f", steps() + 1, loss);
        return transition(State::Failed);
    }

    m_losses.append(loss);
    if (deadlineExceeded) {
        return transition(State::TimedOut);
    }

    const int k = m_losses.size();
    if (k >= std::max(2, m_minSteps)) {
        const double improvement = m_losses.at(k - 2) - m_losses.at(k - 1);
        if (improvement < m_threshold) {
            return transition(State::Converged);
        }
    }
    if (k >= m_maxSteps) {
        return transition(State::Exhausted);
    }
    return m_state;
}

ConvergenceMonitor::State ConvergenceMonitor::markTimedOut()
{
    return isTerminal() ? m_state : transition(State::TimedOut);
}

ConvergenceMonitor::State ConvergenceMonitor::markCancelled()
{
    return isTerminal() ? m_state : transition(State::Cancelled);
}

ConvergenceMonitor::State ConvergenceMonitor::markFailed()
{
    return isTerminal() ? m_state : transition(State::Failed);
}

bool ConvergenceMonitor::usable() const
{
    switch (m_state) {
    case State::Converged:
    case State::Exhausted:
        return true;
    case State::TimedOut:
        return steps() >= m_minSteps;
    case State::Training:
    case State::Cancelled:
    case State::Failed:
        return false;
    }
    return false;
}

QString ConvergenceMonitor::stateToString(State state)
{
    switch (state) {
    case State::Training:  return QStringLiteral("training");
    case State::Converged: return QStringLiteral("converged");
    case State::Exhausted: return QStringLiteral("exhausted");
    case State::TimedOut:  return QStringLiteral("timed_out");
    case State::Cancelled: return QStringLiteral("cancelled");
    case State::Failed:    return QStringLiteral("failed");
    }
    return QStringLiteral("training");
}

ConvergenceMonitor::State ConvergenceMonitor::transition(State next)
{
    LOG_DEBUG(akTraining, "Convergence monitor %s -> %s after %d step(s)",
              qUtf8Printable(stateToString(m_state)),
              qUtf8Printable(stateToString(next)),
              steps());
    m_state = next;
    return m_state;
}

} // namespace ak
