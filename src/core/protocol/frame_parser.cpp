#include <procbridge/core/protocol/frame_parser.hpp>
#include <procbridge/core/protocol/errors.hpp>
#include <cctype>
#include <sstream>

namespace ProcBridge {

namespace {

bool parseLength(const std::string& raw, size_t& out) {
    if (raw.empty() || raw.size() > 12) return false;
    size_t value = 0;
    for (char c : raw) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    out = value;
    return true;
}

} // anonymous namespace

std::string FrameHeader::get(const std::string& key) const {
    auto it = fields.find(key);
    return it != fields.end() ? it->second : std::string();
}

FrameHeader parseHeaderLine(const std::string& line, size_t maxPayload) {
    FrameHeader header;
    std::istringstream iss(line);
    std::string token;

    while (iss >> token) {
        auto pos = token.find(':');
        if (pos == std::string::npos || pos == 0)
            throw ProtocolError("Malformed header token: '" + token + "'");
        header.fields[token.substr(0, pos)] = token.substr(pos + 1);
    }

    if (header.fields.empty())
        throw ProtocolError("Empty header line");

    auto it = header.fields.find("len");
    if (it == header.fields.end())
        throw ProtocolError("Header is missing 'len'");

    if (!parseLength(it->second, header.len))
        throw ProtocolError("Header 'len' is not numeric: '" + it->second + "'");

    if (header.len > maxPayload)
        throw ProtocolError("Payload length " + std::to_string(header.len) +
                            " exceeds limit " + std::to_string(maxPayload));

    return header;
}

std::map<std::string, std::string> parseKeyValueTokens(const std::string& text) {
    std::map<std::string, std::string> out;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
        auto pos = token.find(':');
        if (pos == std::string::npos || pos == 0) continue;
        out[token.substr(0, pos)] = token.substr(pos + 1);
    }
    return out;
}

} // namespace ProcBridge
