#include <procbridge/core/control/curl_rpc_transport.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ProcBridge {

namespace {

size_t writeCallback(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(static_cast<const char*>(ptr), size * nmemb);
    return size * nmemb;
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // anonymous namespace

void CurlRpcTransport::resolveUrl(const std::string& serverUrl, std::string& requestUrl, std::string& socketPath) {
    if (startsWith(serverUrl, "unix://")) {
        socketPath = serverUrl.substr(7);
        if (socketPath.empty())
            throw std::invalid_argument("unix:// server url has no socket path");
        requestUrl = "http://localhost/RPC2";
        return;
    }

    if (startsWith(serverUrl, "http://") || startsWith(serverUrl, "https://")) {
        socketPath.clear();
        auto hostStart = serverUrl.find("//") + 2;
        auto pathStart = serverUrl.find('/', hostStart);
        if (pathStart == std::string::npos || pathStart == serverUrl.size() - 1) {
            std::string base = serverUrl;
            if (!base.empty() && base.back() == '/') base.pop_back();
            requestUrl = base + "/RPC2";
        } else {
            requestUrl = serverUrl;
        }
        return;
    }

    throw std::invalid_argument("Unsupported control server url: " + serverUrl);
}

CurlRpcTransport::CurlRpcTransport(const std::string& serverUrl,
                                   const std::string& username,
                                   const std::string& password)
    : server_url_(serverUrl), username_(username), password_(password) {
    resolveUrl(serverUrl, request_url_, unix_socket_path_);
    curl_ = curl_easy_init();
    if (!curl_)
        throw std::runtime_error("curl_easy_init() failed");
    spdlog::debug("[Control] Transport ready: url={} socket={}", request_url_,
                  unix_socket_path_.empty() ? "-" : unix_socket_path_);
}

CurlRpcTransport::~CurlRpcTransport() {
    if (curl_) curl_easy_cleanup(curl_);
}

std::string CurlRpcTransport::post(const std::string& body, std::chrono::milliseconds timeout) {
    std::string response;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: text/xml");

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, request_url_.c_str());
    if (!unix_socket_path_.empty())
        curl_easy_setopt(curl_, CURLOPT_UNIX_SOCKET_PATH, unix_socket_path_.c_str());
    if (!username_.empty()) {
        curl_easy_setopt(curl_, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl_, CURLOPT_USERNAME, username_.c_str());
        curl_easy_setopt(curl_, CURLOPT_PASSWORD, password_.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(curl_);
    curl_slist_free_all(headers);

    if (rc == CURLE_OPERATION_TIMEDOUT)
        throw TimeoutError("Control call to " + server_url_ + " timed out after " +
                           std::to_string(timeout.count()) + " ms");
    if (rc != CURLE_OK) {
        std::string err = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        throw TransportError("Control call to " + server_url_ + " failed: " + err);
    }

    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    if (status != 200)
        throw RpcHttpError(status, "Control server " + server_url_ + " returned HTTP " + std::to_string(status));

    return response;
}

} // namespace ProcBridge
