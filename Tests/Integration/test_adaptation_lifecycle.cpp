#include <QtTest/QtTest>
#include "adaptation_test_utils.h"
#include "core/adaptation/adaptation_lifecycle_manager.h"
#include "core/learning/low_rank_adapter.h"
#include "core/shared/cancellation_token.h"

#include <stdexcept>

using Manager = ak::AdaptationLifecycleManager;
using State = ak::AdaptationLifecycleManager::State;

namespace {

ak::TaskContext makeContext(const QString& query, const QString& id = QStringLiteral("req-1"))
{
    ak::TaskContext context;
    context.requestId = id;
    context.query = query;
    return context;
}

// Cancels the request from inside the second training step.
class CancellingObjective final : public ak::TrainingObjective {
public:
    explicit CancellingObjective(ak::CancellationToken* token) : m_token(token) {}

    int inputDim() const override { return 16; }
    int outputDim() const override { return 16; }
    bool prepare(const ak::TrainingSet&, QString*) override { return true; }
    double step(ak::LowRankAdapter&, double) override
    {
        if (++m_steps == 2) {
            m_token->cancel();
        }
        return 1.0 / m_steps;
    }

private:
    ak::CancellationToken* m_token;
    int m_steps = 0;
};

// Throws a value that is not a std::exception from the second step, after
// the adapter already holds trained weights.
class UnknownThrowingObjective final : public ak::TrainingObjective {
public:
    int inputDim() const override { return 16; }
    int outputDim() const override { return 16; }
    bool prepare(const ak::TrainingSet&, QString*) override { return true; }
    double step(ak::LowRankAdapter&, double) override
    {
        if (++m_steps == 2) {
            throw 7;
        }
        return 0.5;
    }

private:
    int m_steps = 0;
};

} // namespace

class TestAdaptationLifecycle : public QObject {
    Q_OBJECT

private slots:
    void testExplicitExamplesAccepted();
    void testDefaultObjectiveAcceptsExplicitExamples();
    void testDecideExposesAdapterUntilRelease();
    void testUnpairedInputFallsBack();
    void testNoPatternFallsBack();
    void testTimeoutBeforeMinimumSteps();
    void testMemoryLimitExceeded();
    void testLowConfidence();
    void testDecisionIsIdempotent();
    void testDisabledByCaller();
    void testCancelledBeforeStart();
    void testCancelledDuringTraining();
    void testAbortOnCancel();
    void testObjectiveFailureFallsBack();
    void testGenerationFailureStillDisposes();
    void testGenerationExceptionStillDisposes();
    void testUnknownGenerationExceptionStillDisposes();
    void testUnknownTrainingExceptionFallsBack();
    void testThrowingMetricsSinkIsContained();
    void testStatusJson();
};

void TestAdaptationLifecycle::testExplicitExamplesAccepted()
{
    ak::test::RecordingGenerator generator;
    ak::test::RecordingSink sink;
    Manager manager(ak::AdaptationConfig(), &generator, &sink,
                    ak::test::scriptedFactory(ak::test::convergingLosses()));

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)));

    QVERIFY(response.ok);
    QVERIFY(response.error.isEmpty());
    QVERIFY(response.status.enabled);
    QVERIFY(response.status.confidence.has_value());
    QVERIFY(*response.status.confidence >= 0.7);
    QVERIFY(!response.status.reason.has_value());

    QCOMPARE(manager.detectedPattern(), std::optional<ak::PatternKind>(ak::PatternKind::ExplicitExamples));
    QCOMPARE(manager.examplesCount(), 3);
    QCOMPARE(manager.lastRun().stepsRun(), 3);
    QVERIFY(manager.lastRun().earlyStopped);

    const QVector<State> expectedTrace = {State::Idle, State::Detecting, State::Extracting,
                                          State::Synthesizing, State::Training, State::Scoring,
                                          State::Gating, State::Attached};
    QCOMPARE(manager.stateTrace(), expectedTrace);

    QCOMPARE(generator.calls().size(), size_t(1));
    const ak::test::GenerationCall& call = generator.calls().front();
    QVERIFY(call.hadAdapter);
    QVERIFY(!call.adapterDisposedDuringCall);
    QCOMPARE(call.adapterRank, 8);
    QVERIFY(call.prompt.endsWith(QStringLiteral("Input: 5,10,15\nOutput:")));
    QVERIFY(call.prompt.startsWith(QStringLiteral("Input: 2,4,6\nOutput: 8")));

    // Adapter released as soon as the response exists.
    QVERIFY(!manager.arena().hasLiveAdapter());
    QCOMPARE(manager.arena().createdCount(), 1);
    QCOMPARE(manager.arena().disposedCount(), 1);

    const auto records = sink.records();
    QCOMPARE(records.size(), size_t(1));
    QVERIFY(records.front().accepted);
    QCOMPARE(records.front().rejectionReason, ak::AdaptationReason::None);
    QCOMPARE(records.front().examplesCount, 3);
    QCOMPARE(records.front().stepsRun, 3);
    QCOMPARE(records.front().requestId, QStringLiteral("req-1"));
}

void TestAdaptationLifecycle::testDefaultObjectiveAcceptsExplicitExamples()
{
    ak::test::RecordingGenerator generator;
    ak::test::RecordingSink sink;
    Manager manager(ak::AdaptationConfig(), &generator, &sink);

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)));

    QVERIFY(response.ok);
    QVERIFY(response.status.enabled);
    QVERIFY(response.status.confidence.has_value());
    QVERIFY(*response.status.confidence >= 0.7);
    QVERIFY(!response.status.reason.has_value());

    const ak::TrainingRun& run = manager.lastRun();
    QCOMPARE(run.stopState, ak::ConvergenceMonitor::State::Converged);
    QVERIFY(run.earlyStopped);
    QVERIFY(run.stepsRun() < manager.config().maxSteps);
    QVERIFY(run.finalLoss() < 0.1);

    QCOMPARE(manager.state(), State::Attached);
    QCOMPARE(generator.calls().size(), size_t(1));
    QVERIFY(generator.calls().front().hadAdapter);
    QCOMPARE(generator.calls().front().adapterRank, 8);
    QVERIFY(!manager.arena().hasLiveAdapter());

    QCOMPARE(sink.records().size(), size_t(1));
    QVERIFY(sink.records().front().accepted);
}

void TestAdaptationLifecycle::testDecideExposesAdapterUntilRelease()
{
    ak::test::RecordingGenerator generator;
    Manager manager(ak::AdaptationConfig(), &generator, nullptr,
                    ak::test::scriptedFactory(ak::test::convergingLosses()));

    const ak::AdaptationDecision decision =
        manager.decide(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)));
    QVERIFY(decision.accepted);
    QVERIFY(decision.adapter != nullptr);
    QCOMPARE(decision.adapter->confidenceScore(), decision.confidence);
    QVERIFY(manager.arena().hasLiveAdapter());
    QCOMPARE(manager.state(), State::Attached);

    manager.release();
    QVERIFY(!manager.arena().hasLiveAdapter());
    QVERIFY(generator.calls().empty());
}

void TestAdaptationLifecycle::testUnpairedInputFallsBack()
{
    ak::test::RecordingGenerator generator;
    ak::test::RecordingSink sink;
    Manager manager(ak::AdaptationConfig(), &generator, &sink,
                    ak::test::scriptedFactory(ak::test::convergingLosses()));

    const QString query = QString::fromUtf8(ak::test::kUnpairedInputQuery);
    const ak::AdaptationResponse response = manager.run(makeContext(query));

    QVERIFY(response.ok);
    QVERIFY(!response.status.enabled);
    QCOMPARE(response.status.reason, std::optional<ak::AdaptationReason>(
                                         ak::AdaptationReason::InsufficientExamples));
    QVERIFY(!response.status.confidence.has_value());
    QCOMPARE(manager.examplesCount(), 0);
    QCOMPARE(manager.state(), State::FallenBack);
    QVERIFY(!manager.stateTrace().contains(State::Training));

    // Never trained, never allocated.
    QCOMPARE(manager.arena().createdCount(), 0);
    QCOMPARE(manager.lastRun().stepsRun(), 0);

    QCOMPARE(generator.calls().size(), size_t(1));
    QVERIFY(!generator.calls().front().hadAdapter);
    QCOMPARE(generator.calls().front().prompt, query);

    QCOMPARE(sink.records().size(), size_t(1));
    QCOMPARE(sink.records().front().rejectionReason, ak::AdaptationReason::InsufficientExamples);
}

void TestAdaptationLifecycle::testNoPatternFallsBack()
{
    ak::test::RecordingGenerator generator;
    ak::test::RecordingSink sink;
    Manager manager(ak::AdaptationConfig(), &generator, &sink);

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kPlainQuery)));

    QVERIFY(response.ok);
    QCOMPARE(response.status.reason, std::optional<ak::AdaptationReason>(
                                         ak::AdaptationReason::PatternNotDetected));
    QCOMPARE(manager.stateTrace(),
             QVector<State>({State::Idle, State::Detecting, State::FallenBack}));
    QVERIFY(!sink.records().front().patternDetected.has_value());
}

void TestAdaptationLifecycle::testTimeoutBeforeMinimumSteps()
{
    ak::AdaptationConfig config;
    config.maxAdaptationTimeMs = 50;
    ak::test::RecordingGenerator generator;
    Manager manager(config, &generator, nullptr,
                    ak::test::scriptedFactory({0.3, 0.2, 0.1}, 16, 100));

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)));

    QVERIFY(response.ok);
    QVERIFY(!response.status.enabled);
    QCOMPARE(response.status.reason,
             std::optional<ak::AdaptationReason>(ak::AdaptationReason::Timeout));
    QVERIFY(manager.lastRun().timedOut);
    QCOMPARE(manager.lastRun().stepsRun(), 1);

    QCOMPARE(generator.calls().size(), size_t(1));
    QVERIFY(!generator.calls().front().hadAdapter);
    QCOMPARE(manager.arena().createdCount(), 1);
    QCOMPARE(manager.arena().disposedCount(), 1);
}

void TestAdaptationLifecycle::testMemoryLimitExceeded()
{
    ak::AdaptationConfig config;
    config.memoryLimitBytes = 100;
    ak::test::RecordingGenerator generator;
    Manager manager(config, &generator, nullptr,
                    ak::test::scriptedFactory(ak::test::convergingLosses()));

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)));

    QVERIFY(response.ok);
    QCOMPARE(response.status.reason, std::optional<ak::AdaptationReason>(
                                         ak::AdaptationReason::MemoryLimitExceeded));
    QVERIFY(response.status.confidence.has_value());
    QVERIFY(*response.status.confidence >= 0.7);
    QVERIFY(!generator.calls().front().hadAdapter);
    QVERIFY(!manager.arena().hasLiveAdapter());
}

void TestAdaptationLifecycle::testLowConfidence()
{
    ak::test::RecordingGenerator generator;
    // Improvement of 0.1 per step never converges; final loss 1.2 scores 0.28.
    Manager manager(ak::AdaptationConfig(), &generator, nullptr,
                    ak::test::scriptedFactory({1.9, 1.8, 1.7, 1.6, 1.5, 1.4, 1.3, 1.2}));

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)));

    QVERIFY(response.ok);
    QCOMPARE(response.status.reason,
             std::optional<ak::AdaptationReason>(ak::AdaptationReason::LowConfidence));
    QCOMPARE(manager.lastRun().stepsRun(), 8);
    QVERIFY(!manager.lastRun().earlyStopped);
    QVERIFY(*response.status.confidence < 0.7);
}

void TestAdaptationLifecycle::testDecisionIsIdempotent()
{
    const ak::TaskContext context = makeContext(QString::fromUtf8(ak::test::kExplicitQuery));
    ak::test::RecordingGenerator generator;

    Manager first(ak::AdaptationConfig(), &generator);
    Manager second(ak::AdaptationConfig(), &generator);
    const ak::AdaptationDecision a = first.decide(context);
    const ak::AdaptationDecision b = second.decide(context);

    QCOMPARE(a.accepted, b.accepted);
    QCOMPARE(a.reason, b.reason);
    QCOMPARE(a.confidence, b.confidence);
    QCOMPARE(first.lastRun().losses, second.lastRun().losses);

    // Same manager, same query.
    const ak::AdaptationDecision again = first.decide(context);
    QCOMPARE(again.accepted, a.accepted);
    QCOMPARE(again.reason, a.reason);
    QCOMPARE(again.confidence, a.confidence);
    QCOMPARE(first.arena().createdCount(), 2);
}

void TestAdaptationLifecycle::testDisabledByCaller()
{
    ak::test::RecordingGenerator generator;
    Manager manager(ak::AdaptationConfig(), &generator, nullptr,
                    ak::test::scriptedFactory(ak::test::convergingLosses()));

    ak::TaskContext context = makeContext(QString::fromUtf8(ak::test::kExplicitQuery));
    context.adaptationDisabled = true;
    const ak::AdaptationResponse response = manager.run(context);

    QVERIFY(response.ok);
    QCOMPARE(response.status.reason, std::optional<ak::AdaptationReason>(
                                         ak::AdaptationReason::DisabledByCaller));
    QCOMPARE(manager.stateTrace(), QVector<State>({State::Idle, State::FallenBack}));
    QVERIFY(!generator.calls().front().hadAdapter);
}

void TestAdaptationLifecycle::testCancelledBeforeStart()
{
    ak::test::RecordingGenerator generator;
    Manager manager(ak::AdaptationConfig(), &generator, nullptr,
                    ak::test::scriptedFactory(ak::test::convergingLosses()));
    ak::CancellationToken token;
    token.cancel();

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)), &token);

    QVERIFY(response.ok);
    QCOMPARE(response.status.reason,
             std::optional<ak::AdaptationReason>(ak::AdaptationReason::Cancelled));
    QCOMPARE(manager.arena().createdCount(), 0);
    QCOMPARE(generator.calls().size(), size_t(1));
    QVERIFY(!generator.calls().front().hadAdapter);
}

void TestAdaptationLifecycle::testCancelledDuringTraining()
{
    ak::test::RecordingGenerator generator;
    ak::CancellationToken token;
    Manager manager(ak::AdaptationConfig(), &generator, nullptr,
                    [&token](const ak::AdaptationConfig&) -> std::unique_ptr<ak::TrainingObjective> {
                        return std::make_unique<CancellingObjective>(&token);
                    });

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)), &token);

    QVERIFY(response.ok);
    QCOMPARE(response.status.reason,
             std::optional<ak::AdaptationReason>(ak::AdaptationReason::Cancelled));
    QCOMPARE(manager.lastRun().stepsRun(), 2);
    QVERIFY(!manager.arena().hasLiveAdapter());
    QCOMPARE(manager.arena().disposedCount(), 1);
    QVERIFY(!generator.calls().front().hadAdapter);
}

void TestAdaptationLifecycle::testAbortOnCancel()
{
    ak::test::RecordingGenerator generator;
    ak::test::RecordingSink sink;
    Manager manager(ak::AdaptationConfig(), &generator, &sink,
                    ak::test::scriptedFactory(ak::test::convergingLosses()));
    manager.setAbortOnCancel(true);
    ak::CancellationToken token;
    token.cancel();

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)), &token);

    QVERIFY(!response.ok);
    QVERIFY(!response.error.isEmpty());
    QVERIFY(generator.calls().empty());
    QCOMPARE(sink.records().size(), size_t(1));
    QCOMPARE(sink.records().front().rejectionReason, ak::AdaptationReason::Cancelled);
}

void TestAdaptationLifecycle::testObjectiveFailureFallsBack()
{
    ak::test::RecordingGenerator generator;
    Manager manager(ak::AdaptationConfig(), &generator, nullptr,
                    [](const ak::AdaptationConfig&) -> std::unique_ptr<ak::TrainingObjective> {
                        throw std::runtime_error("objective unavailable");
                    });

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)));

    QVERIFY(response.ok);
    QCOMPARE(response.status.reason,
             std::optional<ak::AdaptationReason>(ak::AdaptationReason::TrainingFailed));
    QVERIFY(!generator.calls().front().hadAdapter);
}

void TestAdaptationLifecycle::testGenerationFailureStillDisposes()
{
    ak::test::RecordingGenerator generator(ak::test::RecordingGenerator::Mode::Fail);
    ak::test::RecordingSink sink;
    Manager manager(ak::AdaptationConfig(), &generator, &sink,
                    ak::test::scriptedFactory(ak::test::convergingLosses()));

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)));

    QVERIFY(!response.ok);
    QCOMPARE(response.error, QStringLiteral("base model unavailable"));
    QVERIFY(response.status.enabled);
    QVERIFY(generator.calls().front().hadAdapter);
    QVERIFY(!manager.arena().hasLiveAdapter());
    QCOMPARE(manager.arena().disposedCount(), 1);
    QCOMPARE(sink.records().size(), size_t(1));
}

void TestAdaptationLifecycle::testGenerationExceptionStillDisposes()
{
    ak::test::RecordingGenerator generator(ak::test::RecordingGenerator::Mode::Throw);
    Manager manager(ak::AdaptationConfig(), &generator, nullptr,
                    ak::test::scriptedFactory(ak::test::convergingLosses()));

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)));

    QVERIFY(!response.ok);
    QCOMPARE(response.error, QStringLiteral("base model crashed"));
    QVERIFY(!manager.arena().hasLiveAdapter());
    QCOMPARE(manager.arena().disposedCount(), 1);
}

void TestAdaptationLifecycle::testUnknownGenerationExceptionStillDisposes()
{
    ak::test::RecordingGenerator generator(ak::test::RecordingGenerator::Mode::ThrowUnknown);
    ak::test::RecordingSink sink;
    Manager manager(ak::AdaptationConfig(), &generator, &sink,
                    ak::test::scriptedFactory(ak::test::convergingLosses()));

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)));

    QVERIFY(!response.ok);
    QCOMPARE(response.error, QStringLiteral("unknown exception from base generator"));
    QVERIFY(generator.calls().front().hadAdapter);
    QVERIFY(!manager.arena().hasLiveAdapter());
    QCOMPARE(manager.arena().disposedCount(), 1);
    QCOMPARE(sink.records().size(), size_t(1));
    QVERIFY(sink.records().front().accepted);
}

void TestAdaptationLifecycle::testUnknownTrainingExceptionFallsBack()
{
    ak::test::RecordingGenerator generator;
    ak::test::RecordingSink sink;
    Manager manager(ak::AdaptationConfig(), &generator, &sink,
                    [](const ak::AdaptationConfig&) -> std::unique_ptr<ak::TrainingObjective> {
                        return std::make_unique<UnknownThrowingObjective>();
                    });

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)));

    QVERIFY(response.ok);
    QCOMPARE(response.status.reason,
             std::optional<ak::AdaptationReason>(ak::AdaptationReason::TrainingFailed));
    QCOMPARE(manager.state(), State::FallenBack);
    QVERIFY(!manager.arena().hasLiveAdapter());
    QCOMPARE(manager.arena().createdCount(), 1);
    QCOMPARE(manager.arena().disposedCount(), 1);
    QVERIFY(!generator.calls().front().hadAdapter);
    QCOMPARE(sink.records().size(), size_t(1));
    QCOMPARE(sink.records().front().rejectionReason, ak::AdaptationReason::TrainingFailed);
}

void TestAdaptationLifecycle::testThrowingMetricsSinkIsContained()
{
    ak::test::RecordingGenerator generator;
    ak::test::ThrowingSink sink;
    Manager manager(ak::AdaptationConfig(), &generator, &sink,
                    ak::test::scriptedFactory(ak::test::convergingLosses()));

    const ak::AdaptationResponse response =
        manager.run(makeContext(QString::fromUtf8(ak::test::kExplicitQuery)));

    QVERIFY(response.ok);
    QVERIFY(response.status.enabled);
    QCOMPARE(sink.attempts(), 1);
}

void TestAdaptationLifecycle::testStatusJson()
{
    ak::AdaptationStatus fallback;
    fallback.reason = ak::AdaptationReason::PatternNotDetected;
    const QJsonObject fallbackJson = fallback.toJson();
    QCOMPARE(fallbackJson.value(QStringLiteral("enabled")).toBool(), false);
    QVERIFY(fallbackJson.value(QStringLiteral("confidence")).isNull());
    QCOMPARE(fallbackJson.value(QStringLiteral("reason")).toString(),
             QStringLiteral("pattern_not_detected"));

    ak::AdaptationStatus attached;
    attached.enabled = true;
    attached.confidence = 0.84;
    const QJsonObject attachedJson = attached.toJson();
    QCOMPARE(attachedJson.value(QStringLiteral("enabled")).toBool(), true);
    QCOMPARE(attachedJson.value(QStringLiteral("confidence")).toDouble(), 0.84);
    QVERIFY(attachedJson.value(QStringLiteral("reason")).isNull());
}

QTEST_MAIN(TestAdaptationLifecycle)
#include "test_adaptation_lifecycle.moc"
