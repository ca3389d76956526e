#pragma once
#include <procbridge/core/control/control_types.hpp>
#include <string>

namespace ProcBridge {

/**
 * @class ControlClient
 * @brief Imperative commands against the supervision daemon
 *
 * Shared by the action dispatcher and operator tooling, so
 * implementations must be safe for concurrent use. Failures are returned
 * as ControlError values, never thrown.
 */
class ControlClient {
public:
    virtual ~ControlClient() = default;

    virtual ControlOutcome<ProcessList> list() = 0;
    virtual ControlOutcome<ProcessStatus> info(const std::string& name) = 0;
    virtual ControlResult start(const std::string& name) = 0;
    virtual ControlResult stop(const std::string& name) = 0;

    /**
     * Stop then start. Start is only attempted when the stop succeeded or
     * the process was already stopped.
     */
    virtual ControlResult restart(const std::string& name) = 0;

    /**
     * Stop every running process. Per-process failures are reported in
     * the result list, they do not fail the whole call.
     */
    virtual ControlOutcome<ResultList> stopAll() = 0;

    virtual ControlResult shutdown() = 0;

    /**
     * @brief Run a parsed command and fold the answer into one result
     */
    ControlResult execute(const ControlCommand& command);
};

} // namespace ProcBridge
