#include <procbridge/core/bridge/bridge_loop.hpp>
#include <procbridge/core/events/event_decoder.hpp>
#include <procbridge/core/protocol/errors.hpp>
#include <procbridge/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace ProcBridge {

const char* toString(BridgeState state) {
    switch (state) {
        case BridgeState::AWAITING_EVENT:  return "AWAITING_EVENT";
        case BridgeState::READING_HEADER:  return "READING_HEADER";
        case BridgeState::READING_PAYLOAD: return "READING_PAYLOAD";
        case BridgeState::DECODING:        return "DECODING";
        case BridgeState::EVALUATING:      return "EVALUATING";
        case BridgeState::DISPATCHING:     return "DISPATCHING";
        case BridgeState::ACKNOWLEDGING:   return "ACKNOWLEDGING";
        case BridgeState::STOPPED:         return "STOPPED";
    }
    return "UNKNOWN";
}

BridgeLoop::BridgeLoop(DuplexStream& stream, RuleEngine& rules, ActionDispatcher& dispatcher, BridgeOptions options)
    : protocol_(stream, options.maxPayloadBytes),
      rules_(rules),
      dispatcher_(dispatcher),
      options_(options) {}

void BridgeLoop::transition(BridgeState next) {
    state_ = next;
    if (observer_) observer_(next);
}

// ============================================================================
// Protocol turn
// ============================================================================

TurnResult BridgeLoop::runOnce() {
    FrameHeader header;
    std::string payload;

    try {
        transition(BridgeState::AWAITING_EVENT);
        protocol_.sendReady();

        transition(BridgeState::READING_HEADER);
        header = protocol_.readHeader();

        transition(BridgeState::READING_PAYLOAD);
        payload = protocol_.readPayload(header);
    } catch (const InterruptedError&) {
        return shutdownRequested();
    } catch (const TimeoutError& e) {
        spdlog::critical("[Bridge] No event within idle timeout: {}", e.what());
        transition(BridgeState::STOPPED);
        return TurnResult::EXIT_ERROR;
    } catch (const ProtocolError& e) {
        spdlog::critical("[Bridge] Malformed frame: {}", e.what());
        transition(BridgeState::STOPPED);
        return TurnResult::EXIT_ERROR;
    } catch (const TransportError& e) {
        spdlog::critical("[Bridge] Event channel failed: {}", e.what());
        transition(BridgeState::STOPPED);
        return TurnResult::EXIT_ERROR;
    }
    ++stats_.frames;

    transition(BridgeState::DECODING);
    Event event;
    try {
        event = EventDecoder::decode(header, payload, Clock::wall_ms());
    } catch (const DecodeError& e) {
        ++stats_.decodeFailures;
        spdlog::warn("[Bridge] Dropping event {} (serial {}): {}",
                     header.eventName(), header.serial(), e.what());
        return acknowledge(true);
    }

    spdlog::info("[Bridge] {}", event.describe());
    bool handled = process(event);

    TurnResult result = acknowledge(handled);
    if (result != TurnResult::CONTINUE) return result;

    if (options_.exitOnSupervisorStopping &&
        event.kind == EventKind::SUPERVISOR_STATE_CHANGED &&
        event.toState == ProcessState::STOPPING) {
        spdlog::info("[Bridge] Daemon is stopping, listener exits");
        transition(BridgeState::STOPPED);
        return TurnResult::EXIT_OK;
    }
    return TurnResult::CONTINUE;
}

bool BridgeLoop::process(const Event& event) {
    try {
        transition(BridgeState::EVALUATING);
        std::vector<Action> actions = rules_.evaluate(event);

        transition(BridgeState::DISPATCHING);
        auto outcomes = dispatcher_.dispatch(actions, event);
        stats_.actionsExecuted += outcomes.size();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("[Bridge] Processing {} failed: {}", event.eventName, e.what());
        return false;
    }
}

TurnResult BridgeLoop::acknowledge(bool success) {
    transition(BridgeState::ACKNOWLEDGING);
    try {
        protocol_.sendResult(success);
    } catch (const TransportError& e) {
        spdlog::critical("[Bridge] Acknowledgement failed: {}", e.what());
        transition(BridgeState::STOPPED);
        return TurnResult::EXIT_ERROR;
    }
    if (success) ++stats_.acknowledgedOk;
    else ++stats_.acknowledgedFail;
    return TurnResult::CONTINUE;
}

TurnResult BridgeLoop::shutdownRequested() {
    spdlog::info("[Bridge] Shutdown requested, running stop rules");
    Event event = EventDecoder::supervisorStopping(Clock::wall_ms());
    process(event);
    transition(BridgeState::STOPPED);
    return TurnResult::EXIT_OK;
}

// ============================================================================
// Main loop
// ============================================================================

int BridgeLoop::run() {
    spdlog::info("[Bridge] Listening for events");
    TurnResult result = TurnResult::CONTINUE;
    while (result == TurnResult::CONTINUE) {
        result = runOnce();
    }
    spdlog::info("[Bridge] Stopped after {} frames ({} dropped, {} FAIL)",
                 stats_.frames, stats_.decodeFailures, stats_.acknowledgedFail);
    return result == TurnResult::EXIT_OK ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace ProcBridge
