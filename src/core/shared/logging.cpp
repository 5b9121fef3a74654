#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(akCore, "adaptkit.core")
Q_LOGGING_CATEGORY(akPattern, "adaptkit.pattern")
Q_LOGGING_CATEGORY(akTraining, "adaptkit.training")
Q_LOGGING_CATEGORY(akLifecycle, "adaptkit.lifecycle")
Q_LOGGING_CATEGORY(akMetrics, "adaptkit.metrics")
