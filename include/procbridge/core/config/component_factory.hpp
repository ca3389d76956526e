#pragma once
#include <procbridge/core/config/app_config.hpp>
#include <procbridge/core/control/supervisor_control_client.hpp>
#include <procbridge/core/dispatch/notifier.hpp>
#include <memory>

namespace ProcBridge {

/**
 * @brief Control client over libcurl for the configured daemon endpoint
 * @throws std::invalid_argument for an unsupported server_url
 */
std::shared_ptr<SupervisorControlClient> makeControlClient(const AppConfig::ControlConfig& config);

/**
 * @brief Logging notifier, plus a CommandNotifier when a command is set
 */
NotifierPtr makeNotifier(const AppConfig::NotifyConfig& config);

} // namespace ProcBridge
