#pragma once
#include <procbridge/core/control/rpc_transport.hpp>
#include <procbridge/core/protocol/errors.hpp>
#include <curl/curl.h>
#include <string>

namespace ProcBridge {

/**
 * @brief Server replied with an HTTP status other than 200
 */
class RpcHttpError : public TransportError {
public:
    RpcHttpError(long status, const std::string& what) : TransportError(what), status_(status) {}
    long status() const { return status_; }

private:
    long status_;
};

/**
 * @class CurlRpcTransport
 * @brief XML-RPC over HTTP, either TCP or a unix domain socket
 *
 * server_url forms:
 *   unix:///tmp/supervisor.sock          (request path /RPC2)
 *   http://127.0.0.1:9001                (path defaults to /RPC2)
 *   http://127.0.0.1:9001/RPC2
 *
 * One easy handle is kept for the lifetime of the transport so the
 * connection is reused; curl reconnects transparently after a failure.
 * curl_global_init() must have been called by the program.
 */
class CurlRpcTransport : public RpcTransport {
public:
    CurlRpcTransport(const std::string& serverUrl,
                     const std::string& username = std::string(),
                     const std::string& password = std::string());
    ~CurlRpcTransport() override;

    CurlRpcTransport(const CurlRpcTransport&) = delete;
    CurlRpcTransport& operator=(const CurlRpcTransport&) = delete;

    std::string post(const std::string& body, std::chrono::milliseconds timeout) override;
    std::string endpoint() const override { return server_url_; }

    const std::string& requestUrl() const { return request_url_; }
    const std::string& unixSocketPath() const { return unix_socket_path_; }

    /**
     * @brief Split a server url into the HTTP url curl requests and the
     *        unix socket path (empty for TCP)
     * @throws std::invalid_argument for unsupported schemes
     */
    static void resolveUrl(const std::string& serverUrl, std::string& requestUrl, std::string& socketPath);

private:
    std::string server_url_;
    std::string request_url_;
    std::string unix_socket_path_;
    std::string username_;
    std::string password_;
    CURL* curl_ = nullptr;
};

} // namespace ProcBridge
