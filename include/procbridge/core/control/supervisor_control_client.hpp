#pragma once
#include <procbridge/core/control/control_client.hpp>
#include <procbridge/core/control/rpc_transport.hpp>
#include <procbridge/core/control/xmlrpc_value.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ProcBridge {

// Fault codes of the daemon's XML-RPC interface
namespace SupervisorFault {
constexpr int SHUTDOWN_STATE = 6;
constexpr int BAD_NAME = 10;
constexpr int SPAWN_ERROR = 50;
constexpr int ALREADY_STARTED = 60;
constexpr int NOT_RUNNING = 70;
} // namespace SupervisorFault

struct ControlOptions {
    std::chrono::milliseconds timeout{3000};        // whole public operation, retries included
    int maxRetries = 2;                             // idempotent reads only
    std::chrono::milliseconds retryBackoff{50};     // doubled per attempt
    std::vector<std::string> stopAllExclude;
};

/**
 * @class SupervisorControlClient
 * @brief ControlClient speaking the daemon's XML-RPC interface
 *
 * All calls go through one session guarded by a timed mutex: one call in
 * flight at a time, and a caller that cannot get the session within the
 * call timeout gets UNREACHABLE instead of queueing forever. The lock is
 * released before any result is returned.
 *
 * The timeout bounds each public operation as a whole: one deadline is taken
 * on entry and every lock wait, request, retry and read-back spends from it.
 * Restart and StopAll share a single deadline across their steps.
 */
class SupervisorControlClient : public ControlClient {
public:
    explicit SupervisorControlClient(std::unique_ptr<RpcTransport> transport,
                                     ControlOptions options = ControlOptions());
    ~SupervisorControlClient() override = default;

    SupervisorControlClient(const SupervisorControlClient&) = delete;
    SupervisorControlClient& operator=(const SupervisorControlClient&) = delete;

    ControlOutcome<ProcessList> list() override;
    ControlOutcome<ProcessStatus> info(const std::string& name) override;
    ControlResult start(const std::string& name) override;
    ControlResult stop(const std::string& name) override;
    ControlResult restart(const std::string& name) override;
    ControlOutcome<ResultList> stopAll() override;
    ControlResult shutdown() override;

    const ControlOptions& options() const { return options_; }
    uint64_t callCount() const { return calls_.load(std::memory_order_relaxed); }

    /**
     * @brief Convert one getProcessInfo struct
     * @throws XmlRpcParseError if the value is not a struct
     */
    static ProcessStatus toProcessStatus(const XmlRpcValue& value);

private:
    struct CallStatus {
        ControlError error = ControlError::NONE;
        int faultCode = 0;
        std::string message;
        bool ok() const { return error == ControlError::NONE; }
    };

    using Deadline = std::chrono::steady_clock::time_point;

    Deadline deadlineFromNow() const { return std::chrono::steady_clock::now() + options_.timeout; }

    CallStatus invoke(const std::string& method, const std::vector<XmlRpcValue>& params,
                      XmlRpcValue* out, Deadline deadline);
    CallStatus invokeWithRetry(const std::string& method, const std::vector<XmlRpcValue>& params,
                               XmlRpcValue* out, Deadline deadline);

    ControlOutcome<ProcessList> listUntil(Deadline deadline);
    ControlOutcome<ProcessStatus> infoUntil(const std::string& name, Deadline deadline);
    ControlResult changeState(ControlOp op, const std::string& method, const std::string& name,
                              Deadline deadline);
    std::vector<std::pair<std::string, int64_t>> configuredPriorities(Deadline deadline);
    bool excludedFromStopAll(const ProcessStatus& process) const;

    std::unique_ptr<RpcTransport> transport_;
    ControlOptions options_;
    std::timed_mutex session_mutex_;
    std::atomic<uint64_t> calls_{0};
};

} // namespace ProcBridge
