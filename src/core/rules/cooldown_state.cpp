#include <procbridge/core/rules/cooldown_state.hpp>

namespace ProcBridge {

std::optional<uint64_t> CooldownState::lastFired(const std::string& ruleId, const std::string& process) const {
    auto it = last_fired_.find(Key(ruleId, process));
    if (it == last_fired_.end()) return std::nullopt;
    return it->second;
}

bool CooldownState::eligible(const std::string& ruleId,
                             const std::string& process,
                             uint32_t cooldownSeconds,
                             uint64_t now_ms) const {
    if (cooldownSeconds == 0) return true;
    auto last = lastFired(ruleId, process);
    if (!last) return true;
    // Clock going backwards counts as "not yet elapsed"
    if (now_ms < *last) return false;
    return now_ms - *last >= static_cast<uint64_t>(cooldownSeconds) * 1000;
}

void CooldownState::record(const std::string& ruleId, const std::string& process, uint64_t now_ms) {
    last_fired_[Key(ruleId, process)] = now_ms;
}

} // namespace ProcBridge
