#include "supervisor/lifecycle_event.hpp"

const char* to_string(StatusNotice notice) {
    switch (notice) {
        case StatusNotice::Starting: return "starting";
        case StatusNotice::Running:  return "running";
        case StatusNotice::Crashed:  return "crashed";
        case StatusNotice::Stopped:  return "stopped";
        case StatusNotice::Failed:   return "failed";
    }
    return "unknown";
}

std::string describe(const LifecycleEvent& event) {
    if (const auto* changed = std::get_if<StatusChanged>(&event)) {
        return std::string("status-changed:") + to_string(changed->status);
    }
    return "restart-needed";
}
