#include <procbridge/core/config/component_factory.hpp>
#include <procbridge/core/control/curl_rpc_transport.hpp>
#include <spdlog/spdlog.h>

namespace ProcBridge {

std::shared_ptr<SupervisorControlClient> makeControlClient(const AppConfig::ControlConfig& config) {
    auto transport = std::make_unique<CurlRpcTransport>(config.serverUrl, config.username, config.password);

    ControlOptions options;
    options.timeout = std::chrono::milliseconds(config.timeoutMs);
    options.maxRetries = config.maxRetries;
    options.stopAllExclude = config.stopAllExclude;
    return std::make_shared<SupervisorControlClient>(std::move(transport), options);
}

NotifierPtr makeNotifier(const AppConfig::NotifyConfig& config) {
    auto composite = std::make_shared<CompositeNotifier>();
    composite->addNotifier(std::make_shared<LoggingNotifier>());
    if (!config.command.empty()) {
        composite->addNotifier(std::make_shared<CommandNotifier>(
            config.command, std::chrono::milliseconds(config.timeoutMs)));
        spdlog::info("[Config] Notify command: {}", config.command);
    }
    return composite;
}

} // namespace ProcBridge
