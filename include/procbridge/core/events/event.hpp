#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace ProcBridge {

enum class EventKind : uint8_t {
    PROCESS_STATE_CHANGED = 0,
    SUPERVISOR_STATE_CHANGED = 1
};

/**
 * Process states as named by the supervision daemon. Supervisor-level
 * events reuse RUNNING and STOPPING.
 */
enum class ProcessState : uint8_t {
    STARTING = 0,
    RUNNING,
    BACKOFF,
    STOPPING,
    EXITED,
    STOPPED,
    FATAL,
    UNKNOWN
};

const char* toString(EventKind kind);
const char* toString(ProcessState state);

/**
 * @brief Parse a state token ("RUNNING", "FATAL", ...), case-sensitive
 * @return std::nullopt for unrecognised tokens
 */
std::optional<ProcessState> parseProcessState(const std::string& token);

/**
 * @struct Event
 * @brief One decoded lifecycle notification
 *
 * Created by EventDecoder, read-only afterwards.
 */
struct Event {
    EventKind kind = EventKind::PROCESS_STATE_CHANGED;
    std::string eventName;          // e.g. PROCESS_STATE_FATAL
    std::string processName;
    std::string groupName;
    std::optional<ProcessState> fromState;
    ProcessState toState = ProcessState::UNKNOWN;
    std::optional<int> pid;
    std::optional<bool> expected;   // EXITED only
    std::string serial;             // daemon event serial, for logging
    std::string pool;               // listener pool name
    std::string poolSerial;
    std::string version;            // protocol version, e.g. 3.0
    std::string server;             // daemon identifier
    std::string body;               // free text after the blank line, if any
    uint64_t timestamp_ms = 0;      // wall clock at decode time

    /**
     * @brief "[group: name (pid)] EVENT: FROM -> TO: expected"
     */
    std::string describe() const;
};

} // namespace ProcBridge
