#pragma once
#include <procbridge/core/rules/rule.hpp>
#include <string>

namespace ProcBridge {

/**
 * @struct Action
 * @brief One unit of dispatch work produced by a fired rule
 *
 * payload meaning depends on kind:
 *   NOTIFY / LOG_ONLY   rendered message text
 *   RESTART_DEPENDENT   name of the process to restart
 *   INVOKE_CONTROL      control command, e.g. "restart api" or "stop_all"
 */
struct Action {
    ActionKind kind = ActionKind::LOG_ONLY;
    std::string ruleId;
    std::string targetProcess;
    std::string payload;
};

} // namespace ProcBridge
