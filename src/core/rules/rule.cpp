#include <procbridge/core/rules/rule.hpp>
#include <algorithm>

namespace ProcBridge {

const char* toString(ActionKind kind) {
    switch (kind) {
        case ActionKind::NOTIFY:            return "notify";
        case ActionKind::RESTART_DEPENDENT: return "restart_dependent";
        case ActionKind::LOG_ONLY:          return "log_only";
        case ActionKind::INVOKE_CONTROL:    return "invoke_control";
        default:                            return "unknown";
    }
}

std::optional<ActionKind> parseActionKind(const std::string& token) {
    if (token == "notify")            return ActionKind::NOTIFY;
    if (token == "restart_dependent") return ActionKind::RESTART_DEPENDENT;
    if (token == "log_only")          return ActionKind::LOG_ONLY;
    if (token == "invoke_control")    return ActionKind::INVOKE_CONTROL;
    return std::nullopt;
}

bool RuleMatch::matches(const Event& event) const noexcept {
    if (kind && *kind != event.kind)
        return false;

    if (toStates.count(event.toState) == 0)
        return false;

    if (!fromStates.empty()) {
        if (!event.fromState || fromStates.count(*event.fromState) == 0)
            return false;
    }

    if (!processes.empty() &&
        std::find(processes.begin(), processes.end(), event.processName) == processes.end())
        return false;

    if (expected) {
        if (!event.expected || *event.expected != *expected)
            return false;
    }

    return true;
}

namespace {

void replaceAll(std::string& text, const std::string& placeholder, const std::string& value) {
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.length(), value);
        pos += value.length();
    }
}

} // anonymous namespace

std::string renderMessage(const std::string& tmpl, const Rule& rule, const Event& event) {
    std::string text = tmpl.empty() ? "[{rule}] {process}: {from_state} -> {to_state}" : tmpl;
    replaceAll(text, "{rule}", rule.id);
    replaceAll(text, "{process}", event.processName);
    replaceAll(text, "{group}", event.groupName);
    replaceAll(text, "{event}", event.eventName);
    replaceAll(text, "{from_state}", event.fromState ? toString(*event.fromState) : "?");
    replaceAll(text, "{to_state}", toString(event.toState));
    replaceAll(text, "{pid}", event.pid ? std::to_string(*event.pid) : "-");
    return text;
}

} // namespace ProcBridge
