// ============================================================================
// FRAME PARSER & LISTENER PROTOCOL UNIT TESTS
// ============================================================================
// Header line parsing, READY / RESULT encoding and the fd-backed channel
// ============================================================================

#include <gtest/gtest.h>
#include <procbridge/core/protocol/duplex_stream.hpp>
#include <procbridge/core/protocol/errors.hpp>
#include <procbridge/core/protocol/frame_parser.hpp>
#include <procbridge/core/protocol/listener_protocol.hpp>
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <unistd.h>

using namespace ProcBridge;
using namespace ProcBridge::Testing;

// ============================================================================
// HEADER PARSING
// ============================================================================

TEST(FrameParser, ParsesAllHeaderFields) {
    FrameHeader h = parseHeaderLine(
        "ver:3.0 server:supervisor serial:21 pool:listener poolserial:10 eventname:PROCESS_STATE_FATAL len:54",
        kDefaultMaxPayloadBytes);

    EXPECT_EQ(h.len, 54u);
    EXPECT_EQ(h.eventName(), "PROCESS_STATE_FATAL");
    EXPECT_EQ(h.serial(), "21");
    EXPECT_EQ(h.version(), "3.0");
    EXPECT_EQ(h.server(), "supervisor");
    EXPECT_EQ(h.pool(), "listener");
    EXPECT_EQ(h.poolSerial(), "10");
    EXPECT_TRUE(h.has("pool"));
    EXPECT_FALSE(h.has("missing"));
}

TEST(FrameParser, ZeroLengthPayloadIsValid) {
    FrameHeader h = parseHeaderLine("eventname:SUPERVISOR_STATE_CHANGE_RUNNING len:0", 100);
    EXPECT_EQ(h.len, 0u);
}

TEST(FrameParser, ValueMayContainColons) {
    FrameHeader h = parseHeaderLine("server:host:9001 len:1", 100);
    EXPECT_EQ(h.server(), "host:9001");
}

TEST(FrameParser, RejectsMissingLen) {
    EXPECT_THROW(parseHeaderLine("eventname:PROCESS_STATE_RUNNING", 100), ProtocolError);
}

TEST(FrameParser, RejectsNonNumericLen) {
    EXPECT_THROW(parseHeaderLine("len:abc", 100), ProtocolError);
    EXPECT_THROW(parseHeaderLine("len:-5", 100), ProtocolError);
    EXPECT_THROW(parseHeaderLine("len:", 100), ProtocolError);
}

TEST(FrameParser, RejectsTokenWithoutColon) {
    EXPECT_THROW(parseHeaderLine("garbage len:5", 100), ProtocolError);
    EXPECT_THROW(parseHeaderLine(":value len:5", 100), ProtocolError);
}

TEST(FrameParser, RejectsEmptyLine) {
    EXPECT_THROW(parseHeaderLine("", 100), ProtocolError);
    EXPECT_THROW(parseHeaderLine("   ", 100), ProtocolError);
}

TEST(FrameParser, RejectsOversizedPayload) {
    EXPECT_THROW(parseHeaderLine("len:101", 100), ProtocolError);
    EXPECT_NO_THROW(parseHeaderLine("len:100", 100));
}

TEST(FrameParser, KeyValueTokensSkipMalformed) {
    auto kv = parseKeyValueTokens("processname:api groupname:web junk pid:42");
    EXPECT_EQ(kv.size(), 3u);
    EXPECT_EQ(kv["processname"], "api");
    EXPECT_EQ(kv["pid"], "42");
}

// ============================================================================
// PROTOCOL TURN
// ============================================================================

TEST(ListenerProtocol, EncodesResults) {
    EXPECT_EQ(ListenerProtocol::encodeResult("OK"), "RESULT 2\nOK");
    EXPECT_EQ(ListenerProtocol::encodeResult("FAIL"), "RESULT 4\nFAIL");
}

TEST(ListenerProtocol, ReadyHeaderPayloadAck) {
    ScriptedStream stream("eventname:PROCESS_STATE_RUNNING len:5\nhello");
    ListenerProtocol protocol(stream);

    protocol.sendReady();
    EXPECT_EQ(stream.output, "READY\n");

    FrameHeader h = protocol.readHeader();
    EXPECT_EQ(h.len, 5u);
    EXPECT_EQ(protocol.readPayload(h), "hello");
    EXPECT_EQ(protocol.framesRead(), 1u);

    protocol.sendOk();
    EXPECT_EQ(stream.output, "READY\nRESULT 2\nOK");
}

TEST(ListenerProtocol, StripsCarriageReturn) {
    ScriptedStream stream("eventname:PROCESS_STATE_RUNNING len:0\r\n");
    ListenerProtocol protocol(stream);
    EXPECT_EQ(protocol.readHeader().len, 0u);
}

TEST(ListenerProtocol, TruncatedPayloadIsTransportError) {
    ScriptedStream stream("eventname:PROCESS_STATE_RUNNING len:50\nshort");
    ListenerProtocol protocol(stream);
    FrameHeader h = protocol.readHeader();
    EXPECT_THROW(protocol.readPayload(h), TransportError);
}

TEST(ListenerProtocol, PayloadLimitApplied) {
    ScriptedStream stream("eventname:PROCESS_STATE_RUNNING len:64\n");
    ListenerProtocol protocol(stream, 16);
    EXPECT_THROW(protocol.readHeader(), ProtocolError);
}

// ============================================================================
// FD CHANNEL
// ============================================================================

class FdDuplexStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(pipe(in_), 0);
        ASSERT_EQ(pipe(out_), 0);
    }

    void TearDown() override {
        for (int fd : {in_[0], in_[1], out_[0], out_[1]}) {
            if (fd >= 0) close(fd);
        }
    }

    void feed(const std::string& data) {
        ASSERT_EQ(::write(in_[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    std::string drain(size_t n) {
        std::string out(n, '\0');
        ssize_t got = ::read(out_[0], &out[0], n);
        out.resize(got > 0 ? static_cast<size_t>(got) : 0);
        return out;
    }

    int in_[2] = {-1, -1};
    int out_[2] = {-1, -1};
};

TEST_F(FdDuplexStreamTest, ReadsLinesAndExactBytes) {
    FdDuplexStream stream(in_[0], out_[1]);
    feed("first line\nABCDEFsecond\n");

    EXPECT_EQ(stream.readLine(), "first line");
    EXPECT_EQ(stream.readExact(6), "ABCDEF");
    EXPECT_EQ(stream.readLine(), "second");
}

TEST_F(FdDuplexStreamTest, WritesOnlyOnFlush) {
    FdDuplexStream stream(in_[0], out_[1]);
    stream.write("READY\n");
    stream.flush();
    EXPECT_EQ(drain(6), "READY\n");
}

TEST_F(FdDuplexStreamTest, IdleTimeoutRaisesTimeoutError) {
    FdDuplexStream stream(in_[0], out_[1], std::chrono::milliseconds(100));
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(stream.readLine(), TimeoutError);
    auto waited = std::chrono::steady_clock::now() - start;
    EXPECT_GE(waited, std::chrono::milliseconds(90));
    EXPECT_LT(waited, std::chrono::seconds(2));
}

TEST_F(FdDuplexStreamTest, EofRaisesTransportError) {
    FdDuplexStream stream(in_[0], out_[1]);
    feed("partial");
    close(in_[1]);
    in_[1] = -1;
    EXPECT_THROW(stream.readLine(), TransportError);
}

TEST_F(FdDuplexStreamTest, OverlongHeaderLineIsProtocolError) {
    FdDuplexStream stream(in_[0], out_[1]);
    feed(std::string(kMaxHeaderLineBytes + 100, 'x'));
    EXPECT_THROW(stream.readLine(), ProtocolError);
}

TEST_F(FdDuplexStreamTest, HeaderLineAtLimitIsAccepted) {
    FdDuplexStream stream(in_[0], out_[1]);
    feed(std::string(kMaxHeaderLineBytes, 'x') + "\n");
    EXPECT_EQ(stream.readLine().size(), kMaxHeaderLineBytes);
}

TEST_F(FdDuplexStreamTest, StopFlagRaisesInterrupted) {
    std::atomic<bool> stop{true};
    FdDuplexStream stream(in_[0], out_[1], std::chrono::milliseconds(0), &stop);
    EXPECT_THROW(stream.readLine(), InterruptedError);
}
