#pragma once

#include "core/shared/adaptation_config.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace ak {

// AdaptationConfigManager -- JSON save/load for the adaptation engine config.
//
// The deployment file lives at:
//   <GenericDataLocation>/adaptkit/adaptation.json
// Keys missing from the file keep their compiled-in defaults.
class AdaptationConfigManager {
public:
    // Load from the default location. Returns nullopt if the file doesn't
    // exist or cannot be parsed.
    static std::optional<AdaptationConfig> load();
    static std::optional<AdaptationConfig> load(const QString& filePath);

    // Save to the given path, creating parent directories.
    static bool save(const AdaptationConfig& config, const QString& filePath);

    static QString configFilePath();

    static QJsonObject toJson(const AdaptationConfig& config);
    static AdaptationConfig fromJson(const QJsonObject& json);

    // Clamp every value into its valid range. Out-of-set ranks snap to the
    // nearest allowed rank.
    static AdaptationConfig normalized(AdaptationConfig config);
};

} // namespace ak
