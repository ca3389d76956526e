#include <procbridge/core/dispatch/action_dispatcher.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ProcBridge {

namespace {

ActionOutcome outcomeFor(const Action& action) {
    ActionOutcome o;
    o.kind = action.kind;
    o.ruleId = action.ruleId;
    return o;
}

} // anonymous namespace

ActionDispatcher::ActionDispatcher(std::shared_ptr<ControlClient> control, NotifierPtr notifier)
    : control_(std::move(control)), notifier_(std::move(notifier)) {
    if (!notifier_) notifier_ = std::make_shared<LoggingNotifier>();
}

std::vector<ActionOutcome> ActionDispatcher::dispatch(const std::vector<Action>& actions, const Event& event) {
    std::vector<ActionOutcome> outcomes;
    outcomes.reserve(actions.size());
    for (const auto& action : actions) {
        outcomes.push_back(execute(action, event));
    }
    return outcomes;
}

ActionOutcome ActionDispatcher::execute(const Action& action, const Event& event) {
    ActionOutcome outcome = outcomeFor(action);
    try {
        switch (action.kind) {
            case ActionKind::LOG_ONLY:
                spdlog::info("[Dispatcher] {} - {}", action.ruleId, action.payload);
                outcome.success = true;
                outcome.detail = action.payload;
                break;
            case ActionKind::NOTIFY:
                outcome = runNotify(action, event);
                break;
            case ActionKind::RESTART_DEPENDENT:
                outcome = runRestartDependent(action);
                break;
            case ActionKind::INVOKE_CONTROL:
                outcome = runInvokeControl(action);
                break;
        }
    } catch (const std::exception& e) {
        outcome.success = false;
        outcome.detail = std::string("unexpected error: ") + e.what();
    }

    ++executed_;
    if (!outcome.success) {
        ++failed_;
        spdlog::warn("[Dispatcher] {} action of rule {} failed: {}",
                     toString(action.kind), action.ruleId, outcome.detail);
    } else {
        spdlog::debug("[Dispatcher] {} action of rule {} done: {}",
                      toString(action.kind), action.ruleId, outcome.detail);
    }
    return outcome;
}

// ============================================================================
// Action kinds
// ============================================================================

ActionOutcome ActionDispatcher::runNotify(const Action& action, const Event& event) {
    ActionOutcome outcome = outcomeFor(action);
    outcome.detail = action.payload;
    outcome.success = notifier_->notify(Notification::from(action.ruleId, action.payload, event));
    if (!outcome.success)
        outcome.detail = std::string(notifier_->name()) + " could not deliver: " + action.payload;
    return outcome;
}

ActionOutcome ActionDispatcher::runRestartDependent(const Action& action) {
    ActionOutcome outcome = outcomeFor(action);
    if (!control_) {
        outcome.controlError = ControlError::UNREACHABLE;
        outcome.detail = "no control client configured";
        return outcome;
    }

    ControlResult r = control_->restart(action.payload);
    outcome.success = r.ok();
    outcome.controlError = r.error;
    outcome.detail = "restart " + action.payload + ": " + (r.ok() ? r.message : std::string(toString(r.error)) + " " + r.message);
    if (r.ok())
        spdlog::info("[Dispatcher] Rule {} restarted dependent {}", action.ruleId, action.payload);
    return outcome;
}

ActionOutcome ActionDispatcher::runInvokeControl(const Action& action) {
    ActionOutcome outcome = outcomeFor(action);
    if (!control_) {
        outcome.controlError = ControlError::UNREACHABLE;
        outcome.detail = "no control client configured";
        return outcome;
    }

    ControlCommand command;
    try {
        command = ControlCommand::parse(action.payload);
    } catch (const std::invalid_argument& e) {
        outcome.controlError = ControlError::REJECTED;
        outcome.detail = std::string("invalid control command: ") + e.what();
        return outcome;
    }
    if (command.name.empty() && ControlCommand::requiresName(command.op))
        command.name = action.targetProcess;

    ControlResult r = control_->execute(command);
    outcome.success = r.ok();
    outcome.controlError = r.error;
    outcome.detail = command.toString() + ": " + (r.ok() ? r.message : std::string(toString(r.error)) + " " + r.message);
    if (r.ok())
        spdlog::info("[Dispatcher] Rule {} ran '{}': {}", action.ruleId, command.toString(), r.message);
    return outcome;
}

} // namespace ProcBridge
