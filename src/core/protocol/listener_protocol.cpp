#include <procbridge/core/protocol/listener_protocol.hpp>
#include <spdlog/spdlog.h>

namespace ProcBridge {

ListenerProtocol::ListenerProtocol(DuplexStream& stream, size_t maxPayload)
    : stream_(stream), max_payload_(maxPayload) {
}

void ListenerProtocol::sendReady() {
    stream_.write(kReadyToken);
    stream_.flush();
}

FrameHeader ListenerProtocol::readHeader() {
    std::string line = stream_.readLine();
    if (!line.empty() && line.back() == '\r') line.pop_back();
    spdlog::debug("[Protocol] Header: {}", line);
    return parseHeaderLine(line, max_payload_);
}

std::string ListenerProtocol::readPayload(const FrameHeader& header) {
    std::string payload = header.len > 0 ? stream_.readExact(header.len) : std::string();
    ++frames_read_;
    return payload;
}

std::string ListenerProtocol::encodeResult(const std::string& body) {
    return "RESULT " + std::to_string(body.size()) + "\n" + body;
}

void ListenerProtocol::sendResult(bool success) {
    stream_.write(encodeResult(success ? "OK" : "FAIL"));
    stream_.flush();
}

} // namespace ProcBridge
