#pragma once

#include <string>
#include <variant>

/// Status values announced to observers. "failed" is only ever a
/// notification: the stored status stays Crashed.
enum class StatusNotice {
    Starting,
    Running,
    Crashed,
    Stopped,
    Failed,
};

const char* to_string(StatusNotice notice);

struct StatusChanged {
    StatusNotice status = StatusNotice::Stopped;
};

/// The worker should be started again
struct RestartNeeded {};

using LifecycleEvent = std::variant<StatusChanged, RestartNeeded>;

/// "status-changed:running", "restart-needed"
std::string describe(const LifecycleEvent& event);
