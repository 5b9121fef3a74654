#pragma once

#include "core/adaptation/adaptation_status.h"
#include "core/adaptation/adapter_arena.h"
#include "core/adaptation/task_context.h"
#include "core/learning/training_run.h"
#include "core/shared/adaptation_config.h"
#include "core/shared/types.h"

#include <QString>
#include <QVector>

#include <functional>
#include <memory>
#include <optional>

namespace ak {

class BaseGenerator;
class CancellationToken;
class MetricsSink;
class TrainingObjective;

// AdaptationLifecycleManager -- per-request orchestration of the adaptation
// pipeline and the generation call that follows it.
//
//   Idle -> Detecting -> Extracting -> Synthesizing -> Training -> Scoring
//        -> Gating -> {Attached, FallenBack}
//
// Any stage may jump straight to FallenBack with a recorded reason. The
// adapter lives in a request-scoped arena: it is handed to generation only
// when Attached and is disposed before run() returns, whatever the outcome.
//
// One instance per request. The generator and metrics sink are borrowed and
// may be shared between managers; nothing else is.
class AdaptationLifecycleManager {
public:
    enum class State {
        Idle,
        Detecting,
        Extracting,
        Synthesizing,
        Training,
        Scoring,
        Gating,
        Attached,
        FallenBack,
    };

    using ObjectiveFactory =
        std::function<std::unique_ptr<TrainingObjective>(const AdaptationConfig&)>;

    // config is normalized on construction. A null objectiveFactory selects
    // HashedProjectionObjective. metrics may be null.
    AdaptationLifecycleManager(const AdaptationConfig& config,
                               BaseGenerator* generator,
                               MetricsSink* metrics = nullptr,
                               ObjectiveFactory objectiveFactory = ObjectiveFactory());
    ~AdaptationLifecycleManager();

    AdaptationLifecycleManager(const AdaptationLifecycleManager&) = delete;
    AdaptationLifecycleManager& operator=(const AdaptationLifecycleManager&) = delete;

    // When set, a cancellation observed before generation aborts the request
    // instead of falling back to unadapted generation.
    void setAbortOnCancel(bool abort) { m_abortOnCancel = abort; }

    // Full request: adaptation decision, generation, disposal, one metrics record.
    AdaptationResponse run(const TaskContext& context, const CancellationToken* cancel = nullptr);

    // Adaptation half only. An accepted decision leaves the adapter alive in
    // the arena until release() or the next decide()/run().
    AdaptationDecision decide(const TaskContext& context, const CancellationToken* cancel = nullptr);
    void release();

    State state() const { return m_state; }
    const QVector<State>& stateTrace() const { return m_trace; }

    std::optional<PatternKind> detectedPattern() const { return m_pattern; }
    int examplesCount() const { return m_examplesCount; }
    const TrainingRun& lastRun() const { return m_run; }
    qint64 adaptationElapsedMs() const { return m_elapsedMs; }
    const AdapterArena& arena() const { return m_arena; }
    const AdaptationConfig& config() const { return m_config; }

    static QString stateToString(State state);

private:
    void enter(State state);
    AdaptationDecision fallBack(AdaptationReason reason, const QString& detail);
    // Maps an exception escaping the pipeline to a fallback for the current stage.
    AdaptationDecision failStage(const QString& what);
    AdaptationDecision runPipeline(const TaskContext& context, const CancellationToken* cancel);
    QString generationPrompt(const TaskContext& context) const;
    void emitMetrics(const TaskContext& context, const AdaptationDecision& decision);
    void resetRequestState();

    AdaptationConfig m_config;
    BaseGenerator* m_generator = nullptr;
    MetricsSink* m_metrics = nullptr;
    ObjectiveFactory m_objectiveFactory;
    bool m_abortOnCancel = false;

    AdapterArena m_arena;
    State m_state = State::Idle;
    QVector<State> m_trace;

    std::optional<PatternKind> m_pattern;
    ExampleList m_examples;
    LiveQuery m_liveQuery;
    int m_examplesCount = 0;
    TrainingRun m_run;
    qint64 m_elapsedMs = 0;
};

} // namespace ak
