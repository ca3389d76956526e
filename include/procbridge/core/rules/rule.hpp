#pragma once
#include <procbridge/core/events/event.hpp>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ProcBridge {

enum class ActionKind : uint8_t {
    NOTIFY = 0,
    RESTART_DEPENDENT,
    LOG_ONLY,
    INVOKE_CONTROL
};

const char* toString(ActionKind kind);

/**
 * @brief Parse "notify", "restart_dependent", "log_only", "invoke_control"
 */
std::optional<ActionKind> parseActionKind(const std::string& token);

/**
 * @struct RuleMatch
 * @brief Fixed-schema predicate over an Event
 *
 * All configured conditions must hold:
 * - kind, if set, equals the event kind
 * - toState is one of toStates (exact equality)
 * - fromStates empty, or the event's fromState is one of them
 * - processes empty, or processName is listed (case-sensitive, no globbing)
 * - expected, if set, equals the event's expected flag
 */
struct RuleMatch {
    std::optional<EventKind> kind;
    std::set<ProcessState> toStates;
    std::set<ProcessState> fromStates;
    std::vector<std::string> processes;
    std::optional<bool> expected;

    bool matches(const Event& event) const noexcept;
};

struct Rule {
    std::string id;
    RuleMatch match;
    ActionKind action = ActionKind::LOG_ONLY;
    uint32_t cooldownSeconds = 0;
    std::string message;    // template for NOTIFY / LOG_ONLY
    std::string target;     // dependent process for RESTART_DEPENDENT
    std::string command;    // control command for INVOKE_CONTROL
};

/**
 * @brief Expand {process} {group} {event} {from_state} {to_state} {pid}
 *        {rule} placeholders; an empty template gets a default text
 */
std::string renderMessage(const std::string& tmpl, const Rule& rule, const Event& event);

} // namespace ProcBridge
