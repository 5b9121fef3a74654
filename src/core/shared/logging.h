#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(akCore)
Q_DECLARE_LOGGING_CATEGORY(akPattern)
Q_DECLARE_LOGGING_CATEGORY(akTraining)
Q_DECLARE_LOGGING_CATEGORY(akLifecycle)
Q_DECLARE_LOGGING_CATEGORY(akMetrics)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
