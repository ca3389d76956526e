#pragma once
#include <chrono>
#include <string>

namespace ProcBridge {

/**
 * @class RpcTransport
 * @brief Carries one XML-RPC request/response exchange
 *
 * Implementations report failures by throwing:
 *   TransportError  connection refused, I/O error, bad HTTP status
 *   TimeoutError    the exchange exceeded `timeout`
 *   RpcHttpError    the server answered with a non-200 status
 *
 * Not required to be thread-safe; SupervisorControlClient serialises calls.
 */
class RpcTransport {
public:
    virtual ~RpcTransport() = default;

    virtual std::string post(const std::string& body, std::chrono::milliseconds timeout) = 0;

    virtual std::string endpoint() const = 0;
};

} // namespace ProcBridge
