#include "core/pattern/pattern_grammar.h"

#include <QRegularExpression>
#include <QStringList>

#include <algorithm>

namespace ak {
namespace pattern_grammar {

namespace {

constexpr auto kCaseInsensitive = QRegularExpression::CaseInsensitiveOption;

// One piece of the query after family-specific segmentation.
struct Fragment {
    QString raw;
    QString input;
    QString output;
    bool complete = false;   // usable input/output pair
    bool queryLike = false;  // carries a live marker, a separator or a '?'
};

const QRegularExpression& liveMarker()
{
    static const QRegularExpression re(
        QStringLiteral(R"(\b(?:problem|solve|question|query|task|test)\s*:)"), kCaseInsensitive);
    return re;
}

QString stripTrailingQuestion(QString text)
{
    text = text.trimmed();
    while (text.endsWith(QLatin1Char('?'))) {
        text.chop(1);
        text = text.trimmed();
    }
    return text;
}

Fragment fragmentFromSegment(const QString& segment)
{
    Fragment fragment;
    fragment.raw = segment.trimmed();
    if (fragment.raw.isEmpty()) {
        return fragment;
    }

    QString body = fragment.raw;
    const QRegularExpressionMatch marker = liveMarker().match(body);
    const bool hasMarker = marker.hasMatch();
    if (hasMarker) {
        body = body.mid(marker.capturedEnd()).trimmed();
    }

    QString input;
    QString output;
    const bool separated = splitPair(body, &input, &output);
    if (separated) {
        fragment.input = cleanInput(input);
        fragment.output = cleanOutput(output);
        fragment.complete = !hasMarker && !fragment.input.isEmpty() && !isPlaceholder(fragment.output);
    } else {
        fragment.input = cleanInput(stripTrailingQuestion(body));
    }
    fragment.queryLike = hasMarker || separated || fragment.raw.contains(QLatin1Char('?'));
    return fragment;
}

Fragment fragmentFromPair(const QString& raw, const QString& input, const QString& output)
{
    Fragment fragment;
    fragment.raw = raw.trimmed();
    fragment.input = cleanInput(input);
    fragment.output = cleanOutput(output);
    fragment.complete = !fragment.input.isEmpty() && !isPlaceholder(fragment.output);
    fragment.queryLike = true;
    return fragment;
}

// A trailing "Problem: ..." style suffix in the final segment is split off
// so it can never be read as an example.
QStringList splitTrailingLive(QStringList segments)
{
    if (segments.isEmpty()) {
        return segments;
    }
    const QString last = segments.last();
    const QRegularExpressionMatch marker = liveMarker().match(last);
    if (!marker.hasMatch() || marker.capturedStart() == 0) {
        return segments;
    }
    segments.removeLast();
    segments.append(last.left(marker.capturedStart()));
    segments.append(last.mid(marker.capturedStart()));
    return segments;
}

void finalize(const QVector<Fragment>& fragments, ParsedPattern* parsed)
{
    int lastComplete = -1;
    for (int i = 0; i < fragments.size(); ++i) {
        if (fragments.at(i).complete) {
            lastComplete = i;
        }
    }

    // The live query is the last unpaired fragment after the final example,
    // preferring one that actually reads like a question.
    int liveIndex = -1;
    for (int i = fragments.size() - 1; i > lastComplete; --i) {
        const Fragment& fragment = fragments.at(i);
        if (fragment.complete || fragment.raw.isEmpty()) {
            continue;
        }
        if (liveIndex < 0) {
            liveIndex = i;
        }
        if (fragment.queryLike) {
            liveIndex = i;
            break;
        }
    }

    // Unpaired fragments between examples, or every unpaired fragment but
    // the live one when nothing paired at all, are malformed.
    for (int i = 0; i < fragments.size(); ++i) {
        const Fragment& fragment = fragments.at(i);
        if (fragment.complete) {
            parsed->pairs.append(RawPair{fragment.input, fragment.output});
        } else if (!fragment.raw.isEmpty() && i != liveIndex
                   && (i < lastComplete || lastComplete < 0)) {
            ++parsed->malformed;
        }
    }

    if (liveIndex >= 0) {
        const Fragment& fragment = fragments.at(liveIndex);
        parsed->live.raw = fragment.raw;
        parsed->live.input = fragment.input;
    }
}

ParsedPattern parseMarkedSegments(const QString& text, const QRegularExpression& marker)
{
    ParsedPattern parsed;
    QVector<QPair<int, int>> spans;
    QRegularExpressionMatchIterator it = marker.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        spans.append(qMakePair(m.capturedStart(), m.capturedEnd()));
    }
    parsed.strength = spans.size();
    if (spans.isEmpty()) {
        return parsed;
    }

    parsed.preamble = text.left(spans.first().first).trimmed();

    QStringList segments;
    for (int i = 0; i < spans.size(); ++i) {
        const int start = spans.at(i).second;
        const int end = (i + 1 < spans.size()) ? spans.at(i + 1).first : text.size();
        segments.append(text.mid(start, end - start));
    }
    segments = splitTrailingLive(segments);

    QVector<Fragment> fragments;
    fragments.reserve(segments.size());
    for (const QString& segment : segments) {
        fragments.append(fragmentFromSegment(segment));
    }
    finalize(fragments, &parsed);
    return parsed;
}

ParsedPattern parseExplicitExamples(const QString& text)
{
    static const QRegularExpression marker(
        QStringLiteral(R"(\bexample\s*\d+\s*:)"), kCaseInsensitive);
    return parseMarkedSegments(text, marker);
}

ParsedPattern parseInputOutputPairs(const QString& text)
{
    static const QRegularExpression inputMarker(
        QStringLiteral(R"(\binput\s*:)"), kCaseInsensitive);
    static const QRegularExpression outputMarker(
        QStringLiteral(R"(\boutput\s*:)"), kCaseInsensitive);

    if (!outputMarker.match(text).hasMatch()) {
        return ParsedPattern();
    }
    return parseMarkedSegments(text, inputMarker);
}

ParsedPattern parseNumberedSequence(const QString& text)
{
    static const QRegularExpression item(
        QStringLiteral(R"(^[ \t]*\d+[.)][ \t]+(.*)$)"), QRegularExpression::MultilineOption);

    ParsedPattern parsed;
    QStringList segments;
    int firstStart = -1;
    int lastEnd = 0;
    QRegularExpressionMatchIterator it = item.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        if (firstStart < 0) {
            firstStart = m.capturedStart();
        }
        lastEnd = m.capturedEnd();

        const QString content = m.captured(1);
        QString input;
        QString output;
        if (splitPair(content, &input, &output)) {
            ++parsed.strength;
        }
        segments.append(content);
    }
    if (segments.isEmpty()) {
        return parsed;
    }

    parsed.preamble = text.left(firstStart).trimmed();
    const QString trailing = text.mid(lastEnd).trimmed();
    if (!trailing.isEmpty()) {
        segments.append(trailing);
    }

    QVector<Fragment> fragments;
    fragments.reserve(segments.size());
    for (const QString& segment : segments) {
        fragments.append(fragmentFromSegment(segment));
    }
    finalize(fragments, &parsed);
    return parsed;
}

ParsedPattern parseAnalogy(const QString& text)
{
    static const QRegularExpression isTo(
        QStringLiteral(R"(([\p{L}\p{N}_'\-]+)\s+is\s+to\b\s*([\p{L}\p{N}_'\-]+|\?)?)"),
        kCaseInsensitive);
    static const QRegularExpression proportion(
        QStringLiteral(R"(([\p{L}\p{N}_'\-]+)\s*:\s*([\p{L}\p{N}_'\-]+)\s*::\s*)"
                       R"(([\p{L}\p{N}_'\-]+)\s*:\s*([\p{L}\p{N}_'\-]+|\?)?)"));

    ParsedPattern parsed;
    struct Positioned {
        int position;
        Fragment fragment;
    };
    QVector<Positioned> found;

    QRegularExpressionMatchIterator clauses = isTo.globalMatch(text);
    while (clauses.hasNext()) {
        const QRegularExpressionMatch m = clauses.next();
        found.append({m.capturedStart(), fragmentFromPair(m.captured(0), m.captured(1), m.captured(2))});
    }
    QRegularExpressionMatchIterator proportions = proportion.globalMatch(text);
    while (proportions.hasNext()) {
        const QRegularExpressionMatch m = proportions.next();
        found.append({m.capturedStart(1), fragmentFromPair(m.captured(1) + QStringLiteral(" : ") + m.captured(2),
                                                           m.captured(1), m.captured(2))});
        found.append({m.capturedStart(3), fragmentFromPair(m.captured(3) + QStringLiteral(" : ") + m.captured(4),
                                                           m.captured(3), m.captured(4))});
    }
    // Each clause is one relation, so a proportion "a : b :: c : d" counts twice.
    parsed.strength = found.size();
    if (found.isEmpty()) {
        return parsed;
    }

    std::stable_sort(found.begin(), found.end(), [](const Positioned& a, const Positioned& b) {
        return a.position < b.position;
    });

    parsed.preamble = text.left(found.first().position).trimmed();

    QVector<Fragment> fragments;
    fragments.reserve(found.size());
    for (const Positioned& entry : found) {
        fragments.append(entry.fragment);
    }
    finalize(fragments, &parsed);
    return parsed;
}

ParsedPattern parseRuleChain(const QString& text)
{
    static const QRegularExpression clauseBreak(
        QStringLiteral(R"([;\n]+|\.(?=\s|$)|(?<=[!?])\s+)"));
    static const QRegularExpression ifThen(
        QStringLiteral(R"(^if\s+(.+?)\s*,?\s*then\s+(.*)$)"), kCaseInsensitive);
    static const QRegularExpression implies(
        QStringLiteral(R"(^(.+?)\s+implies\s+(.*)$)"), kCaseInsensitive);

    ParsedPattern parsed;
    QStringList preamble;
    QVector<Fragment> fragments;

    const QStringList clauses = text.split(clauseBreak, Qt::SkipEmptyParts);
    for (const QString& rawClause : clauses) {
        const QString clause = rawClause.trimmed();
        if (clause.isEmpty()) {
            continue;
        }

        QRegularExpressionMatch m = ifThen.match(clause);
        if (!m.hasMatch()) {
            m = implies.match(clause);
        }
        if (m.hasMatch()) {
            ++parsed.strength;
            fragments.append(fragmentFromPair(clause, m.captured(1), m.captured(2)));
            continue;
        }

        if (parsed.strength == 0) {
            preamble.append(clause);
        } else {
            fragments.append(fragmentFromSegment(clause));
        }
    }

    parsed.preamble = preamble.join(QLatin1Char(' '));
    finalize(fragments, &parsed);
    return parsed;
}

} // namespace

ParsedPattern parsePattern(PatternKind kind, const QString& text)
{
    switch (kind) {
    case PatternKind::ExplicitExamples:
        return parseExplicitExamples(text);
    case PatternKind::InputOutputPairs:
        return parseInputOutputPairs(text);
    case PatternKind::NumberedSequence:
        return parseNumberedSequence(text);
    case PatternKind::Analogy:
        return parseAnalogy(text);
    case PatternKind::RuleChain:
        return parseRuleChain(text);
    }
    return ParsedPattern();
}

bool splitPair(const QString& segment, QString* inputOut, QString* outputOut)
{
    static const QRegularExpression separator(
        QStringLiteral(R"(\x{2192}|->|=>|\boutput\s*:|\banswer\s*:|=)"), kCaseInsensitive);

    const QRegularExpressionMatch m = separator.match(segment);
    if (!m.hasMatch()) {
        return false;
    }
    if (inputOut) {
        *inputOut = segment.left(m.capturedStart());
    }
    if (outputOut) {
        *outputOut = segment.mid(m.capturedEnd());
    }
    return true;
}

QString cleanInput(const QString& raw)
{
    static const QRegularExpression leadingLabel(
        QStringLiteral(R"(^\s*input\s*:\s*)"), kCaseInsensitive);
    static const QRegularExpression trailingSeparators(
        QStringLiteral(R"((?:\s|,|;|:|\x{2192}|->|=>|=)+$)"));

    QString cleaned = raw;
    cleaned.remove(leadingLabel);
    cleaned.remove(trailingSeparators);
    return cleaned.trimmed();
}

QString cleanOutput(const QString& raw)
{
    static const QRegularExpression leadingLabel(
        QStringLiteral(R"(^\s*(?:output|answer)\s*:\s*)"), kCaseInsensitive);

    QString cleaned = raw;
    cleaned.remove(leadingLabel);
    cleaned = cleaned.trimmed();
    while (cleaned.endsWith(QLatin1Char(',')) || cleaned.endsWith(QLatin1Char(';'))) {
        cleaned.chop(1);
        cleaned = cleaned.trimmed();
    }
    // Sentence period only; "3.5" keeps its decimal point.
    if (cleaned.endsWith(QLatin1Char('.'))) {
        cleaned.chop(1);
    }
    return cleaned.trimmed();
}

bool isPlaceholder(const QString& output)
{
    static const QRegularExpression placeholder(QStringLiteral(R"(^[\s?_.\x{2026}]*$)"));
    return placeholder.match(output).hasMatch();
}

} // namespace pattern_grammar
} // namespace ak
