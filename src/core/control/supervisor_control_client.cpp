#include <procbridge/core/control/supervisor_control_client.hpp>
#include <procbridge/core/control/curl_rpc_transport.hpp>
#include <procbridge/core/control/xmlrpc_codec.hpp>
#include <procbridge/core/protocol/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <map>
#include <thread>

namespace ProcBridge {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool startSucceeded(ProcessState s) {
    return s == ProcessState::STARTING || s == ProcessState::RUNNING;
}

bool stopSucceeded(ProcessState s) {
    return s == ProcessState::STOPPED || s == ProcessState::EXITED ||
           s == ProcessState::FATAL || s == ProcessState::STOPPING;
}

ControlResult failedResult(const std::string& name, ControlOp op, ControlError error,
                           int faultCode, const std::string& message) {
    ControlResult r;
    r.name = name;
    r.op = op;
    r.error = error;
    r.faultCode = faultCode;
    r.message = message;
    return r;
}

} // anonymous namespace

SupervisorControlClient::SupervisorControlClient(std::unique_ptr<RpcTransport> transport, ControlOptions options)
    : transport_(std::move(transport)), options_(std::move(options)) {
    if (!transport_)
        throw std::invalid_argument("SupervisorControlClient requires a transport");
    spdlog::info("[Control] Client for {} (timeout={}ms, retries={})",
                 transport_->endpoint(), options_.timeout.count(), options_.maxRetries);
}

// ============================================================================
// Session
// ============================================================================

SupervisorControlClient::CallStatus SupervisorControlClient::invoke(
        const std::string& method, const std::vector<XmlRpcValue>& params, XmlRpcValue* out,
        Deadline deadline) {
    CallStatus status;

    std::unique_lock<std::timed_mutex> session(session_mutex_, std::defer_lock);
    if (!session.try_lock_until(deadline)) {
        status.error = ControlError::UNREACHABLE;
        status.message = "control session busy for " + std::to_string(options_.timeout.count()) + " ms";
        spdlog::warn("[Control] {}: {}", method, status.message);
        return status;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        status.error = ControlError::UNREACHABLE;
        status.message = "call timeout of " + std::to_string(options_.timeout.count()) + " ms exceeded";
        spdlog::warn("[Control] {}: {}", method, status.message);
        return status;
    }

    calls_.fetch_add(1, std::memory_order_relaxed);
    try {
        std::string response = transport_->post(encodeMethodCall(method, params), remaining);
        XmlRpcValue value = decodeMethodResponse(response);
        if (out) *out = std::move(value);
        return status;
    } catch (const RpcFault& fault) {
        status.faultCode = fault.code();
        status.error = fault.code() == SupervisorFault::BAD_NAME ? ControlError::NOT_FOUND
                                                                 : ControlError::REJECTED;
        status.message = fault.faultString();
    } catch (const RpcHttpError& e) {
        if (e.status() == 401 || e.status() == 403) {
            status.error = ControlError::REJECTED;
            status.message = "unauthorized (HTTP " + std::to_string(e.status()) + ")";
        } else {
            status.error = ControlError::UNREACHABLE;
            status.message = e.what();
        }
    } catch (const TimeoutError& e) {
        status.error = ControlError::UNREACHABLE;
        status.message = e.what();
    } catch (const TransportError& e) {
        status.error = ControlError::UNREACHABLE;
        status.message = e.what();
    } catch (const XmlRpcParseError& e) {
        status.error = ControlError::UNREACHABLE;
        status.message = std::string("invalid response: ") + e.what();
    } catch (const std::exception& e) {
        status.error = ControlError::UNREACHABLE;
        status.message = e.what();
    }

    spdlog::warn("[Control] {} failed ({}): {}", method, toString(status.error), status.message);
    return status;
}

SupervisorControlClient::CallStatus SupervisorControlClient::invokeWithRetry(
        const std::string& method, const std::vector<XmlRpcValue>& params, XmlRpcValue* out,
        Deadline deadline) {
    CallStatus status;
    for (int attempt = 0; attempt <= options_.maxRetries; ++attempt) {
        status = invoke(method, params, out, deadline);
        if (status.error != ControlError::UNREACHABLE)
            return status;
        if (attempt < options_.maxRetries) {
            auto backoff = options_.retryBackoff * (1 << attempt);
            if (std::chrono::steady_clock::now() + backoff >= deadline) {
                spdlog::debug("[Control] No time left to retry {}", method);
                break;
            }
            spdlog::debug("[Control] Retrying {} in {} ms ({}/{})",
                          method, backoff.count(), attempt + 1, options_.maxRetries);
            std::this_thread::sleep_for(backoff);
        }
    }
    return status;
}

// ============================================================================
// Reads
// ============================================================================

ProcessStatus SupervisorControlClient::toProcessStatus(const XmlRpcValue& value) {
    if (!value.isStruct())
        throw XmlRpcParseError("process info is not a struct");

    ProcessStatus p;
    p.name = value.memberString("name");
    p.group = value.memberString("group");
    p.state = parseProcessState(value.memberString("statename")).value_or(ProcessState::UNKNOWN);
    int64_t pid = value.memberInt("pid", 0);
    if (pid > 0) p.pid = static_cast<int>(pid);
    p.description = value.memberString("description");
    p.start = value.memberInt("start", 0);
    p.stop = value.memberInt("stop", 0);
    p.exitStatus = value.memberInt("exitstatus", 0);
    p.spawnError = value.memberString("spawnerr");
    return p;
}

ControlOutcome<ProcessList> SupervisorControlClient::list() {
    return listUntil(deadlineFromNow());
}

ControlOutcome<ProcessStatus> SupervisorControlClient::info(const std::string& name) {
    return infoUntil(name, deadlineFromNow());
}

ControlOutcome<ProcessList> SupervisorControlClient::listUntil(Deadline deadline) {
    ControlOutcome<ProcessList> outcome;
    XmlRpcValue reply;
    auto status = invokeWithRetry("supervisor.getAllProcessInfo", {}, &reply, deadline);
    if (!status.ok()) {
        outcome.error = status.error;
        outcome.message = status.message;
        return outcome;
    }

    try {
        for (const auto& item : reply.asArray()) {
            outcome.value.push_back(toProcessStatus(item));
        }
    } catch (const XmlRpcParseError& e) {
        outcome.value.clear();
        outcome.error = ControlError::UNREACHABLE;
        outcome.message = std::string("invalid process list: ") + e.what();
        spdlog::warn("[Control] {}", outcome.message);
    }
    return outcome;
}

ControlOutcome<ProcessStatus> SupervisorControlClient::infoUntil(const std::string& name, Deadline deadline) {
    ControlOutcome<ProcessStatus> outcome;
    XmlRpcValue reply;
    auto status = invokeWithRetry("supervisor.getProcessInfo", {XmlRpcValue(name)}, &reply, deadline);
    if (!status.ok()) {
        outcome.error = status.error;
        outcome.message = status.message;
        return outcome;
    }

    try {
        outcome.value = toProcessStatus(reply);
    } catch (const XmlRpcParseError& e) {
        outcome.error = ControlError::UNREACHABLE;
        outcome.message = std::string("invalid process info: ") + e.what();
    }
    return outcome;
}

// ============================================================================
// Commands
// ============================================================================

ControlResult SupervisorControlClient::changeState(ControlOp op, const std::string& method,
                                                   const std::string& name, Deadline deadline) {
    // wait=true: the daemon answers once the transition completed
    auto status = invoke(method, {XmlRpcValue(name), XmlRpcValue(true)}, nullptr, deadline);
    if (!status.ok()) {
        spdlog::info("[Control] {} {} -> {} ({})", toString(op), name, toString(status.error), status.message);
        return failedResult(name, op, status.error, status.faultCode, status.message);
    }

    ControlResult result;
    result.name = name;
    result.op = op;

    // Read-back only spends what is left of the call budget
    auto details = infoUntil(name, deadline);
    if (!details.ok()) {
        result.message = name + " " + toString(op) + " accepted";
        spdlog::info("[Control] {} {} -> accepted, state unknown ({})", toString(op), name, details.message);
        return result;
    }

    result.state = details.value.state;
    result.message = name + " state=" + toString(details.value.state);
    bool reached = op == ControlOp::START ? startSucceeded(details.value.state)
                                          : stopSucceeded(details.value.state);
    if (!reached)
        result.error = ControlError::REJECTED;
    spdlog::info("[Control] {} {} -> {} ({})", toString(op), name, toString(result.error), result.message);
    return result;
}

ControlResult SupervisorControlClient::start(const std::string& name) {
    return changeState(ControlOp::START, "supervisor.startProcess", name, deadlineFromNow());
}

ControlResult SupervisorControlClient::stop(const std::string& name) {
    return changeState(ControlOp::STOP, "supervisor.stopProcess", name, deadlineFromNow());
}

ControlResult SupervisorControlClient::restart(const std::string& name) {
    const Deadline deadline = deadlineFromNow();
    ControlResult stopped = changeState(ControlOp::STOP, "supervisor.stopProcess", name, deadline);
    const bool alreadyStopped = stopped.error == ControlError::REJECTED &&
                                stopped.faultCode == SupervisorFault::NOT_RUNNING;

    if (!stopped.ok() && !alreadyStopped) {
        // Unknown state after a failed stop; starting now could double-start
        return failedResult(name, ControlOp::RESTART, stopped.error, stopped.faultCode,
                            "stop failed: " + stopped.message);
    }

    ControlResult started = changeState(ControlOp::START, "supervisor.startProcess", name, deadline);
    started.op = ControlOp::RESTART;
    if (!started.ok())
        started.message = "start failed: " + started.message;
    return started;
}

std::vector<std::pair<std::string, int64_t>> SupervisorControlClient::configuredPriorities(Deadline deadline) {
    std::vector<std::pair<std::string, int64_t>> out;
    XmlRpcValue reply;
    auto status = invokeWithRetry("supervisor.getAllConfigInfo", {}, &reply, deadline);
    if (!status.ok() || !reply.isArray()) {
        spdlog::debug("[Control] Config priorities unavailable, stopping in name order");
        return out;
    }
    for (const auto& item : reply.asArray()) {
        if (!item.isStruct()) continue;
        int64_t prio = item.memberInt("process_prio", item.memberInt("priority", 999));
        ProcessStatus key;
        key.name = item.memberString("name");
        key.group = item.memberString("group");
        out.emplace_back(key.qualifiedName(), prio);
    }
    return out;
}

bool SupervisorControlClient::excludedFromStopAll(const ProcessStatus& process) const {
    const std::string name = lower(process.name);
    const std::string qualified = lower(process.qualifiedName());
    for (const auto& ex : options_.stopAllExclude) {
        const std::string e = lower(ex);
        if (e == name || e == qualified) return true;
    }
    return false;
}

ControlOutcome<ResultList> SupervisorControlClient::stopAll() {
    ControlOutcome<ResultList> outcome;
    const Deadline deadline = deadlineFromNow();

    auto listed = listUntil(deadline);
    if (!listed.ok()) {
        outcome.error = listed.error;
        outcome.message = listed.message;
        return outcome;
    }

    std::vector<ProcessStatus> targets;
    for (const auto& p : listed.value) {
        if (p.state != ProcessState::RUNNING && p.state != ProcessState::STARTING) continue;
        if (excludedFromStopAll(p)) {
            spdlog::info("[Control] stop_all: skipping excluded {}", p.qualifiedName());
            continue;
        }
        targets.push_back(p);
    }

    if (targets.empty()) {
        outcome.message = "no running processes";
        return outcome;
    }

    // Highest configured priority stops first, then by name
    std::map<std::string, int64_t> prio;
    for (const auto& kv : configuredPriorities(deadline)) prio[kv.first] = kv.second;
    auto priorityOf = [&prio](const ProcessStatus& p) {
        auto it = prio.find(p.qualifiedName());
        return it != prio.end() ? it->second : int64_t(999);
    };
    std::stable_sort(targets.begin(), targets.end(),
                     [&priorityOf](const ProcessStatus& a, const ProcessStatus& b) {
                         auto pa = priorityOf(a);
                         auto pb = priorityOf(b);
                         if (pa != pb) return pa > pb;
                         return a.qualifiedName() < b.qualifiedName();
                     });

    size_t failed = 0;
    for (const auto& p : targets) {
        ControlResult r = changeState(ControlOp::STOP, "supervisor.stopProcess", p.qualifiedName(), deadline);
        if (!r.ok()) ++failed;
        outcome.value.push_back(std::move(r));
    }

    outcome.message = "stopped " + std::to_string(targets.size() - failed) + " of " +
                      std::to_string(targets.size()) + " processes";
    spdlog::info("[Control] stop_all: {}", outcome.message);
    return outcome;
}

ControlResult SupervisorControlClient::shutdown() {
    auto status = invoke("supervisor.shutdown", {}, nullptr, deadlineFromNow());
    if (!status.ok())
        return failedResult("supervisord", ControlOp::SHUTDOWN, status.error, status.faultCode, status.message);

    ControlResult r;
    r.name = "supervisord";
    r.op = ControlOp::SHUTDOWN;
    r.message = "shutdown requested";
    spdlog::warn("[Control] Daemon shutdown requested");
    return r;
}

} // namespace ProcBridge
