#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace ProcBridge {

/**
 * @class CooldownState
 * @brief Last fire time per (rule id, process name)
 *
 * Owned by a single RuleEngine and only touched from the bridge loop
 * thread, so there is no locking. Lost on restart.
 */
class CooldownState {
public:
    using Key = std::pair<std::string, std::string>;

    std::optional<uint64_t> lastFired(const std::string& ruleId, const std::string& process) const;

    /**
     * @brief True if never fired, or at least cooldownSeconds have elapsed
     */
    bool eligible(const std::string& ruleId,
                  const std::string& process,
                  uint32_t cooldownSeconds,
                  uint64_t now_ms) const;

    void record(const std::string& ruleId, const std::string& process, uint64_t now_ms);

    size_t size() const { return last_fired_.size(); }
    void clear() { last_fired_.clear(); }

private:
    std::map<Key, uint64_t> last_fired_;
};

} // namespace ProcBridge
