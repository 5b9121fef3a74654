#include "dry_run_generator.h"

#include "core/learning/low_rank_adapter.h"

#include <QStringList>

namespace ak {

bool DryRunGenerator::generate(const TaskContext& context,
                               const QString& prompt,
                               const LowRankAdapter* adapter,
                               QString* textOut,
                               QString* errorOut)
{
    if (prompt.trimmed().isEmpty()) {
        if (errorOut) {
            *errorOut = QStringLiteral("empty prompt");
        }
        return false;
    }

    // The live input is whatever follows the last "Input:" block.
    QString live = prompt;
    const int marker = prompt.lastIndexOf(QStringLiteral("Input:"));
    if (adapter && marker >= 0) {
        live = prompt.mid(marker + 6);
        if (live.endsWith(QStringLiteral("Output:"))) {
            live.chop(7);
        }
    }

    QStringList lines;
    lines << QStringLiteral("[dry-run] request: %1").arg(context.requestId);
    lines << QStringLiteral("[dry-run] live query: %1").arg(live.trimmed());
    lines << (adapter ? QStringLiteral("[dry-run] adapter rank: %1").arg(adapter->rank())
                      : QStringLiteral("[dry-run] adapter: none"));
    if (textOut) {
        *textOut = lines.join(QLatin1Char('\n'));
    }
    return true;
}

} // namespace ak
