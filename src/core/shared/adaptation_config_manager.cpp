#include "core/shared/adaptation_config_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace ak {

namespace {

constexpr int kMaxRank = 256;
constexpr int kMaxSteps = 1000;
constexpr int kMaxFeatureDim = 1 << 16;

QJsonObject patternRuleToJson(const PatternRule& rule)
{
    QJsonObject json;
    json.insert(QStringLiteral("weight"), rule.weight);
    json.insert(QStringLiteral("minExamples"), rule.minExamples);
    json.insert(QStringLiteral("maxExamples"), rule.maxExamples);
    json.insert(QStringLiteral("minStrength"), rule.minStrength);
    return json;
}

PatternRule patternRuleFromJson(const QJsonObject& json, const PatternRule& fallback)
{
    PatternRule rule = fallback;
    rule.weight = json.value(QStringLiteral("weight")).toDouble(rule.weight);
    rule.minExamples = json.value(QStringLiteral("minExamples")).toInt(rule.minExamples);
    rule.maxExamples = json.value(QStringLiteral("maxExamples")).toInt(rule.maxExamples);
    rule.minStrength = json.value(QStringLiteral("minStrength")).toInt(rule.minStrength);
    return rule;
}

double clampFinite(double value, double lo, double hi, double fallback)
{
    if (!std::isfinite(value)) {
        return fallback;
    }
    return std::clamp(value, lo, hi);
}

} // namespace

std::optional<AdaptationConfig> AdaptationConfigManager::load()
{
    return load(configFilePath());
}

std::optional<AdaptationConfig> AdaptationConfigManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(akCore, "Failed to open adaptation config for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(akCore,
                 "Failed to parse adaptation config JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return normalized(fromJson(doc.object()));
}

bool AdaptationConfigManager::save(const AdaptationConfig& config, const QString& filePath)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(akCore, "Failed to create config directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(config));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(akCore, "Failed to open adaptation config for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(akCore, "Failed to write adaptation config: %s", qUtf8Printable(filePath));
        return false;
    }
    return true;
}

QString AdaptationConfigManager::configFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/adaptkit/adaptation.json");
}

QJsonObject AdaptationConfigManager::toJson(const AdaptationConfig& config)
{
    QJsonObject patterns;
    for (int i = 0; i < kPatternKindCount; ++i) {
        const auto kind = static_cast<PatternKind>(i);
        patterns.insert(patternKindToString(kind), patternRuleToJson(config.rule(kind)));
    }

    QJsonArray ranks;
    for (int rank : config.allowedRanks) {
        ranks.append(rank);
    }

    QJsonObject json;
    json.insert(QStringLiteral("patterns"), patterns);
    json.insert(QStringLiteral("allowedRanks"), ranks);
    json.insert(QStringLiteral("adapterRank"), config.adapterRank);
    json.insert(QStringLiteral("featureDim"), config.featureDim);
    json.insert(QStringLiteral("initSeed"), static_cast<qint64>(config.initSeed));
    json.insert(QStringLiteral("minSteps"), config.minSteps);
    json.insert(QStringLiteral("maxSteps"), config.maxSteps);
    json.insert(QStringLiteral("learningRate"), config.learningRate);
    json.insert(QStringLiteral("convergenceThreshold"), config.convergenceThreshold);
    json.insert(QStringLiteral("gradientClipNorm"), config.gradientClipNorm);
    json.insert(QStringLiteral("maxAdaptationTimeMs"), config.maxAdaptationTimeMs);
    json.insert(QStringLiteral("confidenceThreshold"), config.confidenceThreshold);
    json.insert(QStringLiteral("memoryLimitBytes"), static_cast<qint64>(config.memoryLimitBytes));
    return json;
}

AdaptationConfig AdaptationConfigManager::fromJson(const QJsonObject& json)
{
    AdaptationConfig config;

    const QJsonObject patterns = json.value(QStringLiteral("patterns")).toObject();
    for (auto it = patterns.constBegin(); it != patterns.constEnd(); ++it) {
        PatternKind kind;
        if (!patternKindFromString(it.key(), &kind)) {
            LOG_WARN(akCore, "Ignoring unknown pattern kind in config: %s", qUtf8Printable(it.key()));
            continue;
        }
        config.rule(kind) = patternRuleFromJson(it.value().toObject(), config.rule(kind));
    }

    if (json.contains(QStringLiteral("allowedRanks"))) {
        const QJsonArray ranks = json.value(QStringLiteral("allowedRanks")).toArray();
        QVector<int> parsed;
        parsed.reserve(ranks.size());
        for (const QJsonValue& value : ranks) {
            parsed.append(value.toInt());
        }
        config.allowedRanks = parsed;
    }

    config.adapterRank = json.value(QStringLiteral("adapterRank")).toInt(config.adapterRank);
    config.featureDim = json.value(QStringLiteral("featureDim")).toInt(config.featureDim);
    if (json.contains(QStringLiteral("initSeed"))) {
        config.initSeed = static_cast<uint32_t>(
            json.value(QStringLiteral("initSeed")).toVariant().toLongLong());
    }
    config.minSteps = json.value(QStringLiteral("minSteps")).toInt(config.minSteps);
    config.maxSteps = json.value(QStringLiteral("maxSteps")).toInt(config.maxSteps);
    config.learningRate = json.value(QStringLiteral("learningRate")).toDouble(config.learningRate);
    config.convergenceThreshold = json.value(QStringLiteral("convergenceThreshold"))
                                      .toDouble(config.convergenceThreshold);
    config.gradientClipNorm = json.value(QStringLiteral("gradientClipNorm"))
                                  .toDouble(config.gradientClipNorm);
    config.maxAdaptationTimeMs = json.value(QStringLiteral("maxAdaptationTimeMs"))
                                     .toInt(config.maxAdaptationTimeMs);
    config.confidenceThreshold = json.value(QStringLiteral("confidenceThreshold"))
                                     .toDouble(config.confidenceThreshold);
    if (json.contains(QStringLiteral("memoryLimitBytes"))) {
        config.memoryLimitBytes = static_cast<int64_t>(
            json.value(QStringLiteral("memoryLimitBytes")).toVariant().toLongLong());
    }
    return config;
}

AdaptationConfig AdaptationConfigManager::normalized(AdaptationConfig config)
{
    const AdaptationConfig defaults;

    for (PatternRule& rule : config.patternRules) {
        rule.weight = clampFinite(rule.weight, 0.0, 1.0, 0.5);
        // Leave-one-out needs at least one other example to form context.
        rule.minExamples = std::max(2, rule.minExamples);
        rule.maxExamples = std::max(rule.minExamples, rule.maxExamples);
        rule.minStrength = std::max(1, rule.minStrength);
    }

    QVector<int> ranks;
    for (int rank : config.allowedRanks) {
        if (rank > 0 && rank <= kMaxRank && !ranks.contains(rank)) {
            ranks.append(rank);
        }
    }
    if (ranks.isEmpty()) {
        ranks = defaults.allowedRanks;
    }
    std::sort(ranks.begin(), ranks.end());
    config.allowedRanks = ranks;

    if (!config.allowedRanks.contains(config.adapterRank)) {
        int nearest = config.allowedRanks.first();
        for (int rank : config.allowedRanks) {
            if (std::abs(rank - config.adapterRank) < std::abs(nearest - config.adapterRank)) {
                nearest = rank;
            }
        }
        LOG_INFO(akCore, "Adapter rank %d not in allowed set, using %d",
                 config.adapterRank, nearest);
        config.adapterRank = nearest;
    }

    config.featureDim = std::clamp(config.featureDim, 8, kMaxFeatureDim);
    config.maxSteps = std::clamp(config.maxSteps, 1, kMaxSteps);
    config.minSteps = std::clamp(config.minSteps, 1, config.maxSteps);
    config.learningRate = clampFinite(config.learningRate, 1e-6, 10.0, defaults.learningRate);
    config.convergenceThreshold = clampFinite(config.convergenceThreshold, 0.0, 1.0,
                                              defaults.convergenceThreshold);
    config.gradientClipNorm = clampFinite(config.gradientClipNorm, 0.0, 1e6,
                                          defaults.gradientClipNorm);
    config.maxAdaptationTimeMs = std::max(1, config.maxAdaptationTimeMs);
    config.confidenceThreshold = clampFinite(config.confidenceThreshold, 0.0, 1.0,
                                             defaults.confidenceThreshold);
    config.memoryLimitBytes = std::max<int64_t>(0, config.memoryLimitBytes);
    return config;
}

} // namespace ak
