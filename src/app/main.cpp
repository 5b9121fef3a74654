#include "dry_run_generator.h"

#include "core/adaptation/adaptation_lifecycle_manager.h"
#include "core/metrics/async_metrics_sink.h"
#include "core/metrics/metrics_collector.h"
#include "core/metrics/sqlite_metrics_store.h"
#include "core/shared/adaptation_config_manager.h"
#include "core/shared/logging.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <QUuid>

#include <memory>
#include <optional>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("adaptkit-cli"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Run one query through the test-time adaptation pipeline."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption queryOption(
        {QStringLiteral("q"), QStringLiteral("query")},
        QStringLiteral("Query text containing few-shot examples."), QStringLiteral("text"));
    const QCommandLineOption configOption(
        {QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Adaptation config JSON (defaults to the data location file)."),
        QStringLiteral("path"));
    const QCommandLineOption metricsDbOption(
        QStringLiteral("metrics-db"),
        QStringLiteral("SQLite database receiving one metrics row per request."),
        QStringLiteral("path"));
    const QCommandLineOption disableOption(
        QStringLiteral("disable-adaptation"),
        QStringLiteral("Skip adaptation and generate with the base model only."));
    const QCommandLineOption printConfigOption(
        QStringLiteral("print-config"),
        QStringLiteral("Print the effective configuration and exit."));
    parser.addOption(queryOption);
    parser.addOption(configOption);
    parser.addOption(metricsDbOption);
    parser.addOption(disableOption);
    parser.addOption(printConfigOption);
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    ak::AdaptationConfig config;
    const QString configPath = parser.isSet(configOption)
        ? parser.value(configOption)
        : ak::AdaptationConfigManager::configFilePath();
    if (auto loaded = ak::AdaptationConfigManager::load(configPath)) {
        config = *loaded;
    } else if (parser.isSet(configOption)) {
        err << "Could not read config: " << configPath << Qt::endl;
        return 2;
    } else {
        config = ak::AdaptationConfigManager::normalized(config);
    }

    if (parser.isSet(printConfigOption)) {
        out << QJsonDocument(ak::AdaptationConfigManager::toJson(config)).toJson(QJsonDocument::Indented);
        return 0;
    }

    if (!parser.isSet(queryOption)) {
        err << "Missing --query" << Qt::endl;
        parser.showHelp(1);
    }

    auto collector = std::make_shared<ak::MetricsCollector>();
    auto fanout = std::make_shared<ak::FanoutMetricsSink>();
    fanout->addSink(collector);
    if (parser.isSet(metricsDbOption)) {
        std::optional<ak::SqliteMetricsStore> store =
            ak::SqliteMetricsStore::open(parser.value(metricsDbOption));
        if (!store) {
            err << "Could not open metrics database: " << parser.value(metricsDbOption) << Qt::endl;
            return 2;
        }
        fanout->addSink(std::make_shared<ak::SqliteMetricsStore>(std::move(*store)));
    }
    ak::AsyncMetricsSink metrics(fanout);

    ak::DryRunGenerator generator;
    ak::AdaptationLifecycleManager manager(config, &generator, &metrics);

    ak::TaskContext context;
    context.requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    context.query = parser.value(queryOption);
    context.adaptationDisabled = parser.isSet(disableOption);

    const ak::AdaptationResponse response = manager.run(context);
    metrics.flush();

    QStringList trace;
    for (ak::AdaptationLifecycleManager::State state : manager.stateTrace()) {
        trace << ak::AdaptationLifecycleManager::stateToString(state);
    }
    LOG_DEBUG(akCore, "State trace: %s", qUtf8Printable(trace.join(QStringLiteral(" -> "))));

    if (!response.ok) {
        err << "Generation failed: " << response.error << Qt::endl;
        err << QJsonDocument(response.status.toJson()).toJson(QJsonDocument::Compact) << Qt::endl;
        return 1;
    }

    out << response.text << Qt::endl;
    out << "adaptation: "
        << QJsonDocument(response.status.toJson()).toJson(QJsonDocument::Compact) << Qt::endl;
    out << "metrics: "
        << QJsonDocument(collector->healthSnapshot()).toJson(QJsonDocument::Compact) << Qt::endl;
    return 0;
}
