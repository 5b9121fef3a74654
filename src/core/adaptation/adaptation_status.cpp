#include "core/adaptation/adaptation_status.h"

#include <QJsonValue>

namespace ak {

QJsonObject AdaptationStatus::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("enabled")] = enabled;
    json[QStringLiteral("confidence")] = confidence ? QJsonValue(*confidence) : QJsonValue();
    json[QStringLiteral("reason")] = reason ? QJsonValue(adaptationReasonToString(*reason))
                                            : QJsonValue();
    return json;
}

} // namespace ak
