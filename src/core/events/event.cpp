#include <procbridge/core/events/event.hpp>

namespace ProcBridge {

const char* toString(EventKind kind) {
    switch (kind) {
        case EventKind::PROCESS_STATE_CHANGED:    return "ProcessStateChanged";
        case EventKind::SUPERVISOR_STATE_CHANGED: return "SupervisorStateChanged";
        default:                                  return "Unknown";
    }
}

const char* toString(ProcessState state) {
    switch (state) {
        case ProcessState::STARTING: return "STARTING";
        case ProcessState::RUNNING:  return "RUNNING";
        case ProcessState::BACKOFF:  return "BACKOFF";
        case ProcessState::STOPPING: return "STOPPING";
        case ProcessState::EXITED:   return "EXITED";
        case ProcessState::STOPPED:  return "STOPPED";
        case ProcessState::FATAL:    return "FATAL";
        case ProcessState::UNKNOWN:  return "UNKNOWN";
        default:                     return "UNKNOWN";
    }
}

std::optional<ProcessState> parseProcessState(const std::string& token) {
    if (token == "STARTING") return ProcessState::STARTING;
    if (token == "RUNNING")  return ProcessState::RUNNING;
    if (token == "BACKOFF")  return ProcessState::BACKOFF;
    if (token == "STOPPING") return ProcessState::STOPPING;
    if (token == "EXITED")   return ProcessState::EXITED;
    if (token == "STOPPED")  return ProcessState::STOPPED;
    if (token == "FATAL")    return ProcessState::FATAL;
    if (token == "UNKNOWN")  return ProcessState::UNKNOWN;
    return std::nullopt;
}

std::string Event::describe() const {
    std::string prefix;
    if (!groupName.empty() && groupName != processName) prefix += groupName + ": ";
    prefix += processName.empty() ? "supervisord" : processName;
    if (pid) prefix += " (" + std::to_string(*pid) + ")";

    std::string out = "[" + prefix + "] " + eventName + ":";
    out += fromState ? std::string(" ") + toString(*fromState) : std::string(" ?");
    out += std::string(" -> ") + toString(toState);
    if (expected) out += *expected ? ": expected" : ": unexpected";
    return out;
}

} // namespace ProcBridge
