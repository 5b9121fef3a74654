#pragma once

#include "core/shared/adaptation_config.h"
#include "core/shared/types.h"

#include <QString>
#include <QVector>

#include <optional>

namespace ak {

struct PatternMatch {
    PatternKind kind = PatternKind::ExplicitExamples;
    double weight = 0.0;
    int strength = 0;
};

// PatternDetector -- purely lexical few-shot pattern classification.
//
// No model calls. A kind only matches when its marker strength reaches the
// configured minimum. detect() returns matches in selection order: highest
// weight first, ties broken by PatternKind declaration order.
class PatternDetector {
public:
    static QVector<PatternMatch> detect(const QString& text, const AdaptationConfig& config);
    static std::optional<PatternMatch> select(const QString& text, const AdaptationConfig& config);
};

} // namespace ak
