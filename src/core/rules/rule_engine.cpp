#include <procbridge/core/rules/rule_engine.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <unordered_set>

namespace ProcBridge {

RuleEngine::RuleEngine(std::vector<Rule> rules, TimeSource now)
    : rules_(std::move(rules)), now_(std::move(now)) {
    std::unordered_set<std::string> ids;
    for (const auto& rule : rules_) {
        if (rule.id.empty())
            throw std::invalid_argument("Rule id must not be empty");
        if (!ids.insert(rule.id).second)
            throw std::invalid_argument("Duplicate rule id: " + rule.id);
    }
    spdlog::info("[RuleEngine] Loaded {} rules", rules_.size());
}

std::vector<Action> RuleEngine::evaluate(const Event& event) {
    std::vector<Action> actions;
    const uint64_t now = now_();

    for (const auto& rule : rules_) {
        if (!rule.match.matches(event))
            continue;

        if (!cooldowns_.eligible(rule.id, event.processName, rule.cooldownSeconds, now)) {
            ++suppressed_;
            spdlog::debug("[RuleEngine] Rule '{}' suppressed for {} (cooldown {}s)",
                          rule.id, event.processName, rule.cooldownSeconds);
            continue;
        }

        Action action;
        action.kind = rule.action;
        action.ruleId = rule.id;
        action.targetProcess = event.processName;
        switch (rule.action) {
            case ActionKind::NOTIFY:
            case ActionKind::LOG_ONLY:
                action.payload = renderMessage(rule.message, rule, event);
                break;
            case ActionKind::RESTART_DEPENDENT:
                action.payload = rule.target;
                break;
            case ActionKind::INVOKE_CONTROL:
                action.payload = rule.command;
                break;
        }

        cooldowns_.record(rule.id, event.processName, now);
        ++fired_;
        spdlog::info("[RuleEngine] Rule '{}' fired for {} -> {}", rule.id, event.processName, toString(rule.action));
        actions.push_back(std::move(action));
    }

    return actions;
}

} // namespace ProcBridge
