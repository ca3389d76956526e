#pragma once
#include <procbridge/core/events/event.hpp>
#include <procbridge/core/protocol/frame_parser.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace ProcBridge {

/**
 * @brief A single event could not be decoded; the event is dropped
 */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class EventDecoder
 * @brief Turns header + payload into a typed Event
 *
 * Recognised names:
 *   PROCESS_STATE_{STARTING|RUNNING|BACKOFF|STOPPING|EXITED|STOPPED|FATAL|UNKNOWN}
 *   SUPERVISOR_STATE_CHANGE_{RUNNING|STOPPING}
 *
 * Stateless and side-effect free.
 */
class EventDecoder {
public:
    static constexpr const char* kProcessStatePrefix = "PROCESS_STATE_";
    static constexpr const char* kSupervisorStatePrefix = "SUPERVISOR_STATE_CHANGE_";
    static constexpr const char* kSupervisorName = "supervisord";

    /**
     * @param header Parsed header, `eventname` selects the event type
     * @param payload Raw payload: `key:value` tokens, optionally a blank
     *        line and free text
     * @param timestamp_ms Receive time stamped into the Event
     * @throws DecodeError on unknown event names or missing required fields
     */
    static Event decode(const FrameHeader& header, const std::string& payload, uint64_t timestamp_ms);

    /**
     * @brief Build the event the daemon sends when it begins shutting down
     */
    static Event supervisorStopping(uint64_t timestamp_ms);
};

} // namespace ProcBridge
