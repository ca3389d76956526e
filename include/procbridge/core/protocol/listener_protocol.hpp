#pragma once
#include <procbridge/core/protocol/duplex_stream.hpp>
#include <procbridge/core/protocol/frame_parser.hpp>
#include <cstdint>
#include <string>

namespace ProcBridge {

/**
 * @class ListenerProtocol
 * @brief Event listener handshake spoken with the supervision daemon
 *
 * One turn of the protocol:
 *   -> READY\n
 *   <- header line (key:value ... len:N)\n
 *   <- N payload bytes
 *   -> RESULT 2\nOK   or   RESULT 4\nFAIL
 *
 * Strictly request/acknowledge. Every write is flushed before the call
 * returns because the daemon blocks on the exact bytes.
 */
class ListenerProtocol {
public:
    static constexpr const char* kReadyToken = "READY\n";

    explicit ListenerProtocol(DuplexStream& stream, size_t maxPayload = kDefaultMaxPayloadBytes);

    void sendReady();
    FrameHeader readHeader();
    std::string readPayload(const FrameHeader& header);

    void sendResult(bool success);
    void sendOk() { sendResult(true); }
    void sendFail() { sendResult(false); }

    /**
     * @brief Encode an acknowledgement: "RESULT <len>\n<body>"
     */
    static std::string encodeResult(const std::string& body);

    uint64_t framesRead() const { return frames_read_; }

private:
    DuplexStream& stream_;
    size_t max_payload_;
    uint64_t frames_read_ = 0;
};

} // namespace ProcBridge
