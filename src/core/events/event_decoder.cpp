#include <procbridge/core/events/event_decoder.hpp>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <map>

namespace ProcBridge {

namespace {

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::optional<long> toLong(const std::string& raw) {
    if (raw.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(raw.c_str(), &end, 10);
    if (errno != 0 || end == raw.c_str() || *end != '\0') return std::nullopt;
    return v;
}

std::optional<int> toPid(const std::string& raw) {
    auto v = toLong(raw);
    if (!v || *v <= 0 || *v > INT_MAX) return std::nullopt;
    return static_cast<int>(*v);
}

std::optional<bool> toExpected(const std::string& raw) {
    auto v = toLong(raw);
    if (!v || (*v != 0 && *v != 1)) return std::nullopt;
    return *v == 1;
}

// Fields first, then an optional blank line and free text
void splitPayload(const std::string& payload, std::string& fields, std::string& body) {
    auto pos = payload.find("\n\n");
    if (pos == std::string::npos) {
        fields = payload;
        body.clear();
        return;
    }
    fields = payload.substr(0, pos);
    body = payload.substr(pos + 2);
}

} // anonymous namespace

Event EventDecoder::decode(const FrameHeader& header, const std::string& payload, uint64_t timestamp_ms) {
    const std::string name = header.eventName();
    if (name.empty())
        throw DecodeError("Header has no eventname");

    std::string fieldText;
    std::string body;
    splitPayload(payload, fieldText, body);
    std::map<std::string, std::string> fields = parseKeyValueTokens(fieldText);

    Event event;
    event.eventName = name;
    event.serial = header.serial();
    event.pool = header.pool();
    event.poolSerial = header.poolSerial();
    event.version = header.version();
    event.server = header.server();
    event.body = std::move(body);
    event.timestamp_ms = timestamp_ms;

    if (startsWith(name, kProcessStatePrefix)) {
        auto state = parseProcessState(name.substr(std::char_traits<char>::length(kProcessStatePrefix)));
        if (!state)
            throw DecodeError("Unknown process state in event name: " + name);

        auto proc = fields.find("processname");
        if (proc == fields.end() || proc->second.empty())
            throw DecodeError(name + ": payload is missing 'processname'");
        auto group = fields.find("groupname");
        if (group == fields.end() || group->second.empty())
            throw DecodeError(name + ": payload is missing 'groupname'");

        event.kind = EventKind::PROCESS_STATE_CHANGED;
        event.processName = proc->second;
        event.groupName = group->second;
        event.toState = *state;

        auto from = fields.find("from_state");
        if (from != fields.end()) event.fromState = parseProcessState(from->second);
        auto pid = fields.find("pid");
        if (pid != fields.end()) event.pid = toPid(pid->second);
        auto expected = fields.find("expected");
        if (expected != fields.end()) event.expected = toExpected(expected->second);
        return event;
    }

    if (startsWith(name, kSupervisorStatePrefix)) {
        const std::string suffix = name.substr(std::char_traits<char>::length(kSupervisorStatePrefix));
        if (suffix == "RUNNING")       event.toState = ProcessState::RUNNING;
        else if (suffix == "STOPPING") event.toState = ProcessState::STOPPING;
        else throw DecodeError("Unknown supervisor state in event name: " + name);

        event.kind = EventKind::SUPERVISOR_STATE_CHANGED;
        event.processName = kSupervisorName;
        event.groupName = kSupervisorName;
        return event;
    }

    throw DecodeError("Unsupported event: " + name);
}

Event EventDecoder::supervisorStopping(uint64_t timestamp_ms) {
    Event event;
    event.kind = EventKind::SUPERVISOR_STATE_CHANGED;
    event.eventName = std::string(kSupervisorStatePrefix) + "STOPPING";
    event.processName = kSupervisorName;
    event.groupName = kSupervisorName;
    event.toState = ProcessState::STOPPING;
    event.timestamp_ms = timestamp_ms;
    return event;
}

} // namespace ProcBridge
