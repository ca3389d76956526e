#pragma once
#include <procbridge/core/protocol/frame_parser.hpp>
#include <procbridge/core/rules/rule.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace ProcBridge {
namespace AppConfig {

struct ListenerConfig {
    uint32_t idleTimeoutMs = 0;                 // 0 = wait forever
    size_t maxPayloadBytes = kDefaultMaxPayloadBytes;
    bool exitOnSupervisorStopping = true;
};

struct ControlConfig {
    std::string serverUrl = "unix:///var/run/supervisor.sock";
    std::string username;
    std::string password;
    uint32_t timeoutMs = 3000;
    int maxRetries = 2;
    std::vector<std::string> stopAllExclude;
};

struct NotifyConfig {
    std::string command;                        // empty = log only
    uint32_t timeoutMs = 5000;
};

struct RulesConfig {
    uint32_t defaultCooldownSeconds = 0;
    std::vector<Rule> items;
};

struct AppConfiguration {
    std::string app_name;
    std::string log_level = "info";
    ListenerConfig listener;
    ControlConfig control;
    NotifyConfig notify;
    RulesConfig rules;
};

} // namespace AppConfig
} // namespace ProcBridge
