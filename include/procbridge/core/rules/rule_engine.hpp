#pragma once
#include <procbridge/core/rules/action.hpp>
#include <procbridge/core/rules/cooldown_state.hpp>
#include <procbridge/core/rules/rule.hpp>
#include <procbridge/core/events/event.hpp>
#include <procbridge/core/utils/clock.hpp>
#include <cstdint>
#include <functional>
#include <vector>

namespace ProcBridge {

/**
 * @class RuleEngine
 * @brief Ordered, independent evaluation of the static rule list
 *
 * Every rule is evaluated for every event (no short-circuit). A matching
 * rule fires unless its (rule, process) pair is still cooling down; a
 * suppressed rule does not affect the others. Emitted actions keep rule
 * declaration order.
 *
 * No I/O. The only mutation is the cooldown bookkeeping.
 */
class RuleEngine {
public:
    using TimeSource = std::function<uint64_t()>;

    /**
     * @throws std::invalid_argument on duplicate or empty rule ids
     */
    explicit RuleEngine(std::vector<Rule> rules, TimeSource now = &Clock::now_ms);

    std::vector<Action> evaluate(const Event& event);

    const std::vector<Rule>& rules() const { return rules_; }
    const CooldownState& cooldowns() const { return cooldowns_; }

    uint64_t firedCount() const { return fired_; }
    uint64_t suppressedCount() const { return suppressed_; }

private:
    std::vector<Rule> rules_;
    TimeSource now_;
    CooldownState cooldowns_;
    uint64_t fired_ = 0;
    uint64_t suppressed_ = 0;
};

} // namespace ProcBridge
