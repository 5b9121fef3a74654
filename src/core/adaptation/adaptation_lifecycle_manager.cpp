#include "core/adaptation/adaptation_lifecycle_manager.h"

#include "core/adaptation/base_generator.h"
#include "core/learning/adapter_gate.h"
#include "core/learning/adapter_trainer.h"
#include "core/learning/confidence_scorer.h"
#include "core/learning/leave_one_out_synthesizer.h"
#include "core/learning/low_rank_adapter.h"
#include "core/learning/training_objective.h"
#include "core/metrics/metrics_sink.h"
#include "core/pattern/example_extractor.h"
#include "core/pattern/pattern_detector.h"
#include "core/shared/adaptation_config_manager.h"
#include "core/shared/cancellation_token.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QElapsedTimer>

#include <exception>

namespace ak {

namespace {

bool isCancelled(const CancellationToken* cancel)
{
    return cancel && cancel->isCancelled();
}

AdaptationStatus statusFor(const AdaptationDecision& decision)
{
    AdaptationStatus status;
    status.enabled = decision.accepted;
    if (decision.scored) {
        status.confidence = decision.confidence;
    }
    if (!decision.accepted) {
        status.reason = decision.reason;
    }
    return status;
}

} // namespace

AdaptationLifecycleManager::AdaptationLifecycleManager(const AdaptationConfig& config,
                                                       BaseGenerator* generator,
                                                       MetricsSink* metrics,
                                                       ObjectiveFactory objectiveFactory)
    : m_config(AdaptationConfigManager::normalized(config))
    , m_generator(generator)
    , m_metrics(metrics)
    , m_objectiveFactory(std::move(objectiveFactory))
{
    if (!m_objectiveFactory) {
        m_objectiveFactory = [](const AdaptationConfig& cfg) -> std::unique_ptr<TrainingObjective> {
            return std::make_unique<HashedProjectionObjective>(cfg.featureDim,
                                                               cfg.gradientClipNorm);
        };
    }
    m_trace.append(State::Idle);
}

AdaptationLifecycleManager::~AdaptationLifecycleManager() = default;

// ── Request entry points ────────────────────────────────────

AdaptationResponse AdaptationLifecycleManager::run(const TaskContext& context,
                                                   const CancellationToken* cancel)
{
    AdaptationResponse response;
    AdaptationDecision decision = decide(context, cancel);

    if (isCancelled(cancel)) {
        if (decision.accepted) {
            const double confidence = decision.confidence;
            const double convergence = decision.convergence;
            decision = fallBack(AdaptationReason::Cancelled,
                                QStringLiteral("cancelled before generation"));
            decision.scored = true;
            decision.confidence = confidence;
            decision.convergence = convergence;
        }
        if (m_abortOnCancel) {
            m_arena.dispose();
            LOG_INFO(akLifecycle, "Request %s aborted by cancellation",
                     qUtf8Printable(context.requestId));
            response.ok = false;
            response.status = statusFor(decision);
            response.error = QStringLiteral("request cancelled");
            emitMetrics(context, decision);
            return response;
        }
    }

    response.status = statusFor(decision);

    const LowRankAdapter* adapter = decision.accepted ? m_arena.current() : nullptr;
    const QString prompt = decision.accepted ? generationPrompt(context) : context.query;

    QString text;
    QString error;
    bool generated = false;
    if (!m_generator) {
        error = QStringLiteral("no base generator configured");
    } else {
        try {
            generated = m_generator->generate(context, prompt, adapter, &text, &error);
        } catch (const std::exception& e) {
            generated = false;
            error = QString::fromUtf8(e.what());
        } catch (...) {
            generated = false;
            error = QStringLiteral("unknown exception from base generator");
        }
    }

    // The adapter never outlives generation, successful or not.
    m_arena.dispose();

    if (generated) {
        response.ok = true;
        response.text = text;
    } else {
        if (error.isEmpty()) {
            error = QStringLiteral("base generation failed");
        }
        LOG_WARN(akLifecycle, "Generation failed for %s: %s",
                 qUtf8Printable(context.requestId), qUtf8Printable(error));
        response.ok = false;
        response.error = error;
    }

    emitMetrics(context, decision);
    return response;
}

AdaptationDecision AdaptationLifecycleManager::decide(const TaskContext& context,
                                                      const CancellationToken* cancel)
{
    resetRequestState();

    QElapsedTimer timer;
    timer.start();

    AdaptationDecision decision;
    try {
        decision = runPipeline(context, cancel);
    } catch (const std::exception& e) {
        decision = failStage(QString::fromUtf8(e.what()));
    } catch (...) {
        decision = failStage(QStringLiteral("unknown exception"));
    }

    m_elapsedMs = timer.elapsed();
    return decision;
}

void AdaptationLifecycleManager::release()
{
    m_arena.dispose();
}

// ── Pipeline ────────────────────────────────────────────────

AdaptationDecision AdaptationLifecycleManager::runPipeline(const TaskContext& context,
                                                           const CancellationToken* cancel)
{
    if (context.adaptationDisabled) {
        return fallBack(AdaptationReason::DisabledByCaller,
                        QStringLiteral("adaptation disabled by caller"));
    }
    if (isCancelled(cancel)) {
        return fallBack(AdaptationReason::Cancelled, QStringLiteral("cancelled before detection"));
    }

    enter(State::Detecting);
    const std::optional<PatternMatch> match = PatternDetector::select(context.query, m_config);
    if (!match) {
        return fallBack(AdaptationReason::PatternNotDetected,
                        QStringLiteral("no few-shot pattern in query"));
    }
    m_pattern = match->kind;

    if (isCancelled(cancel)) {
        return fallBack(AdaptationReason::Cancelled, QStringLiteral("cancelled before extraction"));
    }

    enter(State::Extracting);
    const ExtractionResult extraction =
        ExampleExtractor::extract(context.query, match->kind, m_config.rule(match->kind));
    m_examplesCount = extraction.examples.size();
    if (!extraction.ok()) {
        const AdaptationReason reason =
            extraction.status == ExtractionResult::Status::InsufficientExamples
                ? AdaptationReason::InsufficientExamples
                : AdaptationReason::ExtractionError;
        return fallBack(reason, extraction.errorMessage);
    }
    m_examples = extraction.examples;
    m_liveQuery = extraction.liveQuery;

    if (isCancelled(cancel)) {
        return fallBack(AdaptationReason::Cancelled,
                        QStringLiteral("cancelled before synthesis"));
    }

    enter(State::Synthesizing);
    const LeaveOneOutSynthesizer::Result synthesis = LeaveOneOutSynthesizer::synthesize(m_examples);
    if (synthesis.status != LeaveOneOutSynthesizer::Status::Success) {
        return fallBack(AdaptationReason::InsufficientExamples,
                        QStringLiteral("%1 examples cannot be split leave-one-out")
                            .arg(m_examples.size()));
    }

    if (isCancelled(cancel)) {
        return fallBack(AdaptationReason::Cancelled, QStringLiteral("cancelled before training"));
    }

    enter(State::Training);
    std::unique_ptr<TrainingObjective> objective = m_objectiveFactory(m_config);
    if (!objective) {
        return fallBack(AdaptationReason::TrainingFailed,
                        QStringLiteral("no training objective available"));
    }
    LowRankAdapter* adapter =
        m_arena.create(objective->inputDim(), objective->outputDim(), m_config.adapterRank);
    const AdapterTrainer trainer(m_config);
    m_run = trainer.train(synthesis.instances, *adapter, *objective, cancel);

    enter(State::Scoring);
    const ConfidenceScores scores = ConfidenceScorer::score(m_run);
    adapter->setScores(scores.confidence, scores.convergence);

    enter(State::Gating);
    GateInput gateInput;
    gateInput.runUsable = m_run.usable;
    gateInput.runState = m_run.stopState;
    gateInput.confidence = scores.confidence;
    gateInput.serializedSizeBytes = adapter->serializedSizeBytes();

    AdaptationReason reason = AdaptationReason::None;
    QString detail;
    const bool accepted = AdapterGate::passes(m_config, gateInput, &reason, &detail);

    AdaptationDecision decision;
    if (!accepted) {
        decision = fallBack(reason, detail);
    } else {
        enter(State::Attached);
        decision.accepted = true;
        decision.reason = AdaptationReason::None;
        decision.adapter = adapter;
        LOG_INFO(akLifecycle, "Adapter attached for %s: pattern=%s examples=%d steps=%d "
                 "confidence=%.3f rank=%d",
                 qUtf8Printable(context.requestId),
                 qUtf8Printable(patternKindToString(match->kind)),
                 m_examplesCount, m_run.stepsRun(), scores.confidence, adapter->rank());
    }
    decision.scored = m_run.stepsRun() > 0;
    decision.confidence = scores.confidence;
    decision.convergence = scores.convergence;
    return decision;
}

AdaptationDecision AdaptationLifecycleManager::fallBack(AdaptationReason reason,
                                                        const QString& detail)
{
    m_arena.dispose();
    const State from = m_state;
    enter(State::FallenBack);
    LOG_INFO(akLifecycle, "Adaptation fell back at %s: %s (%s)",
             qUtf8Printable(stateToString(from)),
             qUtf8Printable(adaptationReasonToString(reason)),
             qUtf8Printable(detail));

    AdaptationDecision decision;
    decision.accepted = false;
    decision.reason = reason;
    return decision;
}

AdaptationDecision AdaptationLifecycleManager::failStage(const QString& what)
{
    const AdaptationReason reason =
        (m_state == State::Detecting || m_state == State::Extracting)
            ? AdaptationReason::ExtractionError
            : AdaptationReason::TrainingFailed;
    LOG_WARN(akLifecycle, "Adaptation stage %s threw: %s",
             qUtf8Printable(stateToString(m_state)), qUtf8Printable(what));
    return fallBack(reason, what);
}

// ── Helpers ─────────────────────────────────────────────────

void AdaptationLifecycleManager::enter(State state)
{
    m_state = state;
    m_trace.append(state);
    LOG_DEBUG(akLifecycle, "-> %s", qUtf8Printable(stateToString(state)));
}

QString AdaptationLifecycleManager::generationPrompt(const TaskContext& context) const
{
    if (m_liveQuery.input.isEmpty()) {
        return context.query;
    }
    return LeaveOneOutSynthesizer::formatPrompt(m_examples, -1, m_liveQuery.input);
}

void AdaptationLifecycleManager::emitMetrics(const TaskContext& context,
                                             const AdaptationDecision& decision)
{
    if (!m_metrics) {
        return;
    }

    AdaptationMetricsRecord record;
    record.requestId = context.requestId;
    record.recordedAt = QDateTime::currentDateTimeUtc();
    record.patternDetected = m_pattern;
    record.examplesCount = m_examplesCount;
    record.stepsRun = m_run.stepsRun();
    record.elapsedMs = m_elapsedMs;
    record.confidenceScore = decision.confidence;
    record.convergenceScore = decision.convergence;
    record.accepted = decision.accepted;
    record.rejectionReason = decision.reason;

    try {
        m_metrics->record(record);
    } catch (const std::exception& e) {
        LOG_WARN(akMetrics, "Metrics sink threw for %s: %s",
                 qUtf8Printable(context.requestId), e.what());
    } catch (...) {
        LOG_WARN(akMetrics, "Metrics sink threw for %s: unknown exception",
                 qUtf8Printable(context.requestId));
    }
}

void AdaptationLifecycleManager::resetRequestState()
{
    m_arena.dispose();
    m_state = State::Idle;
    m_trace.clear();
    m_trace.append(State::Idle);
    m_pattern.reset();
    m_examples.clear();
    m_liveQuery = LiveQuery();
    m_examplesCount = 0;
    m_run = TrainingRun();
    m_elapsedMs = 0;
}

QString AdaptationLifecycleManager::stateToString(State state)
{
    switch (state) {
    case State::Idle:         return QStringLiteral("idle");
    case State::Detecting:    return QStringLiteral("detecting");
    case State::Extracting:   return QStringLiteral("extracting");
    case State::Synthesizing: return QStringLiteral("synthesizing");
    case State::Training:     return QStringLiteral("training");
    case State::Scoring:      return QStringLiteral("scoring");
    case State::Gating:       return QStringLiteral("gating");
    case State::Attached:     return QStringLiteral("attached");
    case State::FallenBack:   return QStringLiteral("fallen_back");
    }
    return QStringLiteral("unknown");
}

} // namespace ak
