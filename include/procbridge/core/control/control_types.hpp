#pragma once
#include <procbridge/core/events/event.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ProcBridge {

enum class ControlError : uint8_t {
    NONE = 0,
    UNREACHABLE,    // daemon down, transport failure or timeout
    NOT_FOUND,      // unknown process name
    REJECTED        // daemon refused the command in the current state
};

enum class ControlOp : uint8_t {
    LIST = 0,
    INFO,
    START,
    STOP,
    RESTART,
    STOP_ALL,
    SHUTDOWN
};

const char* toString(ControlError error);
const char* toString(ControlOp op);

/**
 * @struct ProcessStatus
 * @brief One process as reported by the daemon
 */
struct ProcessStatus {
    std::string name;
    std::string group;
    ProcessState state = ProcessState::UNKNOWN;
    std::optional<int> pid;         // absent when not running
    std::string description;
    int64_t start = 0;              // epoch seconds
    int64_t stop = 0;
    int64_t exitStatus = 0;
    std::string spawnError;

    /**
     * @brief Name the daemon accepts in commands: "name", or "group:name"
     *        when the process belongs to a differently named group
     */
    std::string qualifiedName() const;
};

/**
 * @struct ControlCommand
 * @brief Parsed control request, textual form "<op> [name]"
 *
 * Grammar: list | info NAME | start NAME | stop NAME | restart NAME |
 *          stop_all | shutdown   (stop-all is accepted as well)
 * For start/stop/restart/info the name may be omitted in configuration;
 * it is then bound to the event's process at dispatch time.
 */
struct ControlCommand {
    ControlOp op = ControlOp::LIST;
    std::string name;

    static bool requiresName(ControlOp op);

    /**
     * @throws std::invalid_argument for unknown verbs or extra arguments
     */
    static ControlCommand parse(const std::string& text);

    std::string toString() const;
};

/**
 * @struct ControlResult
 * @brief Outcome of a single command against a single process
 */
struct ControlResult {
    std::string name;
    ControlOp op = ControlOp::START;
    ControlError error = ControlError::NONE;
    int faultCode = 0;              // daemon fault code when error != NONE
    std::string message;
    std::optional<ProcessState> state;

    bool ok() const { return error == ControlError::NONE; }
};

/**
 * @struct ControlOutcome
 * @brief Value-or-error returned by read operations and StopAll
 */
template <typename T>
struct ControlOutcome {
    ControlError error = ControlError::NONE;
    std::string message;
    T value{};

    bool ok() const { return error == ControlError::NONE; }
};

using ProcessList = std::vector<ProcessStatus>;
using ResultList = std::vector<ControlResult>;

} // namespace ProcBridge
