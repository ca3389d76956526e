#pragma once
#include <procbridge/core/control/control_client.hpp>
#include <procbridge/core/dispatch/notifier.hpp>
#include <procbridge/core/events/event.hpp>
#include <procbridge/core/rules/action.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ProcBridge {

/**
 * @struct ActionOutcome
 * @brief Result of executing one Action
 */
struct ActionOutcome {
    ActionKind kind = ActionKind::LOG_ONLY;
    std::string ruleId;
    bool success = false;
    ControlError controlError = ControlError::NONE;     // control actions only
    std::string detail;
};

/**
 * @class ActionDispatcher
 * @brief Executes the actions of one event strictly in order
 *
 * Nothing escapes execute(): collaborator failures and exceptions become
 * unsuccessful outcomes so the caller can always acknowledge the frame.
 * Failed actions are logged and never retried here.
 */
class ActionDispatcher {
public:
    ActionDispatcher(std::shared_ptr<ControlClient> control, NotifierPtr notifier);

    ActionOutcome execute(const Action& action, const Event& event);
    std::vector<ActionOutcome> dispatch(const std::vector<Action>& actions, const Event& event);

    uint64_t executedCount() const { return executed_; }
    uint64_t failedCount() const { return failed_; }

private:
    ActionOutcome runNotify(const Action& action, const Event& event);
    ActionOutcome runRestartDependent(const Action& action);
    ActionOutcome runInvokeControl(const Action& action);

    std::shared_ptr<ControlClient> control_;
    NotifierPtr notifier_;
    uint64_t executed_ = 0;
    uint64_t failed_ = 0;
};

} // namespace ProcBridge
