#pragma once

#include <QString>

namespace ak {

// Opaque per-request input handed to the engine by the caller.
struct TaskContext {
    QString requestId;
    QString query;
    bool adaptationDisabled = false;
};

} // namespace ak
