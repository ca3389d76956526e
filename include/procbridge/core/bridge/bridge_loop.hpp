#pragma once
#include <procbridge/core/dispatch/action_dispatcher.hpp>
#include <procbridge/core/protocol/duplex_stream.hpp>
#include <procbridge/core/protocol/frame_parser.hpp>
#include <procbridge/core/protocol/listener_protocol.hpp>
#include <procbridge/core/rules/rule_engine.hpp>
#include <cstdint>
#include <functional>

namespace ProcBridge {

enum class BridgeState : uint8_t {
    AWAITING_EVENT = 0,
    READING_HEADER,
    READING_PAYLOAD,
    DECODING,
    EVALUATING,
    DISPATCHING,
    ACKNOWLEDGING,
    STOPPED
};

const char* toString(BridgeState state);

enum class TurnResult : uint8_t {
    CONTINUE = 0,
    EXIT_OK,        // orderly stop: daemon stopping or shutdown requested
    EXIT_ERROR      // framing or transport failure
};

struct BridgeOptions {
    size_t maxPayloadBytes = kDefaultMaxPayloadBytes;
    bool exitOnSupervisorStopping = true;
};

struct BridgeStats {
    uint64_t frames = 0;
    uint64_t decodeFailures = 0;
    uint64_t acknowledgedOk = 0;
    uint64_t acknowledgedFail = 0;
    uint64_t actionsExecuted = 0;
};

/**
 * @class BridgeLoop
 * @brief Drives one listener protocol turn at a time
 *
 *   AWAITING_EVENT -> READING_HEADER -> READING_PAYLOAD -> DECODING
 *     -> EVALUATING -> DISPATCHING -> ACKNOWLEDGING -> AWAITING_EVENT
 *
 * A frame is fully processed and acknowledged before READY is sent again.
 * A malformed event is acknowledged OK and dropped. A failure while
 * reading a frame ends the loop with an error; the daemon restarts the
 * listener. A shutdown request while waiting runs the rules once more on
 * a synthetic supervisor STOPPING event and ends the loop cleanly.
 */
class BridgeLoop {
public:
    using StateObserver = std::function<void(BridgeState)>;

    BridgeLoop(DuplexStream& stream,
               RuleEngine& rules,
               ActionDispatcher& dispatcher,
               BridgeOptions options = BridgeOptions());

    TurnResult runOnce();

    /**
     * @return EXIT_SUCCESS after an orderly stop, EXIT_FAILURE otherwise
     */
    int run();

    void setStateObserver(StateObserver observer) { observer_ = std::move(observer); }

    BridgeState state() const { return state_; }
    const BridgeStats& stats() const { return stats_; }

private:
    void transition(BridgeState next);
    bool process(const Event& event);
    TurnResult acknowledge(bool success);
    TurnResult shutdownRequested();

    ListenerProtocol protocol_;
    RuleEngine& rules_;
    ActionDispatcher& dispatcher_;
    BridgeOptions options_;
    StateObserver observer_;
    BridgeState state_ = BridgeState::AWAITING_EVENT;
    BridgeStats stats_;
};

} // namespace ProcBridge
