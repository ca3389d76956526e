#pragma once
#include <procbridge/core/control/xmlrpc_value.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace ProcBridge {

/**
 * @brief The server answered with a <fault> element
 */
class RpcFault : public std::runtime_error {
public:
    RpcFault(int code, const std::string& faultString)
        : std::runtime_error("XML-RPC fault " + std::to_string(code) + ": " + faultString),
          code_(code), fault_string_(faultString) {}

    int code() const { return code_; }
    const std::string& faultString() const { return fault_string_; }

private:
    int code_;
    std::string fault_string_;
};

/**
 * @brief Serialise a <methodCall> document
 */
std::string encodeMethodCall(const std::string& method, const std::vector<XmlRpcValue>& params);

/**
 * @brief Parse a <methodResponse> document
 * @return The single returned value
 * @throws RpcFault if the response is a fault
 * @throws XmlRpcParseError if the document is malformed
 */
XmlRpcValue decodeMethodResponse(const std::string& xml);

std::string xmlEscape(const std::string& text);

} // namespace ProcBridge
