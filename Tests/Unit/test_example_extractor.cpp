#include <QtTest/QtTest>
#include "core/pattern/example_extractor.h"

namespace {

const QString kExplicitQuery = QStringLiteral(
    "Example 1: 2,4,6→8. Example 2: 1,3,5→7. Example 3: 10,20,30→40. Problem: 5,10,15→?");

} // namespace

class TestExampleExtractor : public QObject {
    Q_OBJECT

private slots:
    void testExplicitExamplesInDocumentOrder();
    void testLiveQueryIsNeverAnExample();
    void testTruncatesToMaximum();
    void testUnpairedInputIsInsufficient();
    void testMissingStructureIsExtractionError();
    void testMalformedSegmentsWithoutPairs();
    void testPreambleBecomesContext();
    void testDecimalOutputsKeepTheirPoint();
    void testNumberedSequence();
    void testRuleChain();
    void testAnalogyProportionNeedsMoreExamples();
};

void TestExampleExtractor::testExplicitExamplesInDocumentOrder()
{
    const ak::AdaptationConfig config;
    const ak::ExtractionResult result = ak::ExampleExtractor::extract(
        kExplicitQuery, ak::PatternKind::ExplicitExamples,
        config.rule(ak::PatternKind::ExplicitExamples));

    QVERIFY(result.ok());
    QCOMPARE(result.examples.size(), 3);
    QCOMPARE(result.parsedCount, 3);
    QCOMPARE(result.examples.at(0).input, QStringLiteral("2,4,6"));
    QCOMPARE(result.examples.at(0).output, QStringLiteral("8"));
    QCOMPARE(result.examples.at(1).input, QStringLiteral("1,3,5"));
    QCOMPARE(result.examples.at(1).output, QStringLiteral("7"));
    QCOMPARE(result.examples.at(2).input, QStringLiteral("10,20,30"));
    QCOMPARE(result.examples.at(2).output, QStringLiteral("40"));
}

void TestExampleExtractor::testLiveQueryIsNeverAnExample()
{
    const ak::AdaptationConfig config;
    const ak::ExtractionResult result = ak::ExampleExtractor::extract(
        kExplicitQuery, ak::PatternKind::ExplicitExamples,
        config.rule(ak::PatternKind::ExplicitExamples));

    QVERIFY(result.ok());
    QCOMPARE(result.liveQuery.input, QStringLiteral("5,10,15"));
    for (const ak::Example& example : result.examples) {
        QVERIFY(example.input != result.liveQuery.input);
    }
}

void TestExampleExtractor::testTruncatesToMaximum()
{
    ak::PatternRule rule;
    rule.minExamples = 2;
    rule.maxExamples = 2;

    const ak::ExtractionResult result = ak::ExampleExtractor::extract(
        kExplicitQuery, ak::PatternKind::ExplicitExamples, rule);

    QVERIFY(result.ok());
    QCOMPARE(result.parsedCount, 3);
    QCOMPARE(result.examples.size(), 2);
    QCOMPARE(result.examples.at(0).output, QStringLiteral("8"));
    QCOMPARE(result.examples.at(1).output, QStringLiteral("7"));
    QCOMPARE(result.liveQuery.input, QStringLiteral("5,10,15"));
}

void TestExampleExtractor::testUnpairedInputIsInsufficient()
{
    const ak::AdaptationConfig config;
    const ak::ExtractionResult result = ak::ExampleExtractor::extract(
        QStringLiteral("Input: x → Output:"), ak::PatternKind::InputOutputPairs,
        config.rule(ak::PatternKind::InputOutputPairs));

    QCOMPARE(result.status, ak::ExtractionResult::Status::InsufficientExamples);
    QVERIFY(result.examples.isEmpty());
    QCOMPARE(result.parsedCount, 0);
    QCOMPARE(result.liveQuery.input, QStringLiteral("x"));
    QVERIFY(!result.errorMessage.isEmpty());
}

void TestExampleExtractor::testMissingStructureIsExtractionError()
{
    const ak::AdaptationConfig config;
    const ak::ExtractionResult result = ak::ExampleExtractor::extract(
        QStringLiteral("What is the capital of France?"), ak::PatternKind::ExplicitExamples,
        config.rule(ak::PatternKind::ExplicitExamples));

    QCOMPARE(result.status, ak::ExtractionResult::Status::ExtractionError);
    QVERIFY(result.examples.isEmpty());
}

void TestExampleExtractor::testMalformedSegmentsWithoutPairs()
{
    const ak::AdaptationConfig config;
    const ak::ExtractionResult result = ak::ExampleExtractor::extract(
        QStringLiteral("Example 1: foo bar. Example 2: baz qux. Example 3: what?"),
        ak::PatternKind::ExplicitExamples,
        config.rule(ak::PatternKind::ExplicitExamples));

    QCOMPARE(result.status, ak::ExtractionResult::Status::ExtractionError);
    QVERIFY(result.examples.isEmpty());
}

void TestExampleExtractor::testPreambleBecomesContext()
{
    const ak::AdaptationConfig config;
    const ak::ExtractionResult result = ak::ExampleExtractor::extract(
        QStringLiteral("Convert to plural.\nInput: cat\nOutput: cats\nInput: dog\nOutput: dogs\n"
                       "Input: fox\nOutput:"),
        ak::PatternKind::InputOutputPairs,
        config.rule(ak::PatternKind::InputOutputPairs));

    QVERIFY(result.ok());
    QCOMPARE(result.examples.size(), 2);
    QCOMPARE(result.examples.at(0).context, QStringLiteral("Convert to plural."));
    QCOMPARE(result.examples.at(1).context, QStringLiteral("Convert to plural."));
    QCOMPARE(result.examples.at(1).input, QStringLiteral("dog"));
    QCOMPARE(result.examples.at(1).output, QStringLiteral("dogs"));
    QCOMPARE(result.liveQuery.input, QStringLiteral("fox"));
}

void TestExampleExtractor::testDecimalOutputsKeepTheirPoint()
{
    const ak::AdaptationConfig config;
    const ak::ExtractionResult result = ak::ExampleExtractor::extract(
        QStringLiteral("Example 1: 1.5 → 3.0. Example 2: 2.5 → 5.0. Problem: 4.5 → ?"),
        ak::PatternKind::ExplicitExamples,
        config.rule(ak::PatternKind::ExplicitExamples));

    QVERIFY(result.ok());
    QCOMPARE(result.examples.size(), 2);
    QCOMPARE(result.examples.at(0).input, QStringLiteral("1.5"));
    QCOMPARE(result.examples.at(0).output, QStringLiteral("3.0"));
    QCOMPARE(result.examples.at(1).output, QStringLiteral("5.0"));
    QCOMPARE(result.liveQuery.input, QStringLiteral("4.5"));
}

void TestExampleExtractor::testNumberedSequence()
{
    const ak::AdaptationConfig config;
    const ak::ExtractionResult result = ak::ExampleExtractor::extract(
        QStringLiteral("1. 2 -> 4\n2. 3 -> 6\n3. 5 -> ?"),
        ak::PatternKind::NumberedSequence,
        config.rule(ak::PatternKind::NumberedSequence));

    QVERIFY(result.ok());
    QCOMPARE(result.examples.size(), 2);
    QCOMPARE(result.examples.at(0).input, QStringLiteral("2"));
    QCOMPARE(result.examples.at(0).output, QStringLiteral("4"));
    QCOMPARE(result.examples.at(1).input, QStringLiteral("3"));
    QCOMPARE(result.examples.at(1).output, QStringLiteral("6"));
    QCOMPARE(result.liveQuery.input, QStringLiteral("5"));
}

void TestExampleExtractor::testRuleChain()
{
    const ak::AdaptationConfig config;
    const ak::ExtractionResult result = ak::ExampleExtractor::extract(
        QStringLiteral("If it rains then the ground is wet. If it is cold then water freezes. "
                       "If it is hot then ?"),
        ak::PatternKind::RuleChain,
        config.rule(ak::PatternKind::RuleChain));

    QVERIFY(result.ok());
    QCOMPARE(result.examples.size(), 2);
    QCOMPARE(result.examples.at(0).input, QStringLiteral("it rains"));
    QCOMPARE(result.examples.at(0).output, QStringLiteral("the ground is wet"));
    QCOMPARE(result.examples.at(1).output, QStringLiteral("water freezes"));
    QCOMPARE(result.liveQuery.input, QStringLiteral("it is hot"));
}

void TestExampleExtractor::testAnalogyProportionNeedsMoreExamples()
{
    const ak::AdaptationConfig config;
    const ak::ExtractionResult result = ak::ExampleExtractor::extract(
        QStringLiteral("hot : cold :: up : ?"),
        ak::PatternKind::Analogy,
        config.rule(ak::PatternKind::Analogy));

    QCOMPARE(result.status, ak::ExtractionResult::Status::InsufficientExamples);
    QCOMPARE(result.parsedCount, 1);
    QCOMPARE(result.liveQuery.input, QStringLiteral("up"));
}

QTEST_MAIN(TestExampleExtractor)
#include "test_example_extractor.moc"
