#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QVector>

namespace ak {

// Lexical grammar shared by PatternDetector and ExampleExtractor.
//
// parsePattern() reads the query as if it were written in the given
// pattern family and reports how strongly the text carries that family's
// markers, together with every input/output pair it could read. Pairs are
// in document order and include placeholders; the trailing unpaired
// fragment is reported separately as the live query.
namespace pattern_grammar {

struct RawPair {
    QString input;
    QString output;
};

struct ParsedPattern {
    int strength = 0;          // count of structural markers for this family
    QString preamble;          // instruction text ahead of the first example
    QVector<RawPair> pairs;    // complete pairs only
    int malformed = 0;         // non-trailing segments without a usable pair
    LiveQuery live;
};

ParsedPattern parsePattern(PatternKind kind, const QString& text);

// Splits "a -> b", "a => b", "a → b", "a = b", "a Output: b" forms.
// Returns false when no separator is present.
bool splitPair(const QString& segment, QString* inputOut, QString* outputOut);

QString cleanInput(const QString& raw);
QString cleanOutput(const QString& raw);

// "?", "___", "..." or empty.
bool isPlaceholder(const QString& output);

} // namespace pattern_grammar

} // namespace ak
