#include <procbridge/core/config/loader.hpp>
#include <procbridge/core/control/control_types.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>

namespace ProcBridge {

namespace {

std::string keyOf(const std::string& section, const char* field) {
    return section.empty() ? std::string(field) : section + "." + field;
}

std::runtime_error configError(const std::string& key, const std::string& what) {
    return std::runtime_error("Invalid configuration '" + key + "': " + what);
}

template <typename T>
T readValue(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw configError(key, std::string("wrong type (") + e.what() + ")");
    }
}

template <typename T>
T readOptional(const YAML::Node& parent, const std::string& section, const char* field, T fallback) {
    const YAML::Node node = parent[field];
    if (!node || node.IsNull()) return fallback;
    return readValue<T>(node, keyOf(section, field));
}

std::string readRequiredString(const YAML::Node& parent, const std::string& section, const char* field) {
    const std::string key = keyOf(section, field);
    const YAML::Node node = parent[field];
    if (!node || node.IsNull())
        throw configError(key, "missing required field");
    if (!node.IsScalar())
        throw configError(key, "expected a string");
    std::string value = node.as<std::string>();
    if (value.empty())
        throw configError(key, "must not be empty");
    return value;
}

uint32_t readNonNegative(const YAML::Node& parent, const std::string& section, const char* field, uint32_t fallback) {
    int64_t v = readOptional<int64_t>(parent, section, field, static_cast<int64_t>(fallback));
    if (v < 0 || v > std::numeric_limits<uint32_t>::max())
        throw configError(section + "." + field, "out of range: " + std::to_string(v));
    return static_cast<uint32_t>(v);
}

std::vector<std::string> readStringList(const YAML::Node& parent, const std::string& section, const char* field) {
    std::vector<std::string> out;
    const YAML::Node node = parent[field];
    if (!node || node.IsNull()) return out;
    const std::string key = section + "." + field;
    if (!node.IsSequence())
        throw configError(key, "expected a list");
    for (auto it = node.begin(); it != node.end(); ++it) {
        const YAML::Node item = *it;
        out.push_back(readValue<std::string>(item, key));
    }
    return out;
}

std::set<ProcessState> readStates(const YAML::Node& parent, const std::string& section, const char* field) {
    std::set<ProcessState> states;
    for (const auto& token : readStringList(parent, section, field)) {
        auto state = parseProcessState(token);
        if (!state)
            throw configError(section + "." + field, "unknown state '" + token + "'");
        states.insert(*state);
    }
    return states;
}

// ============================================================================
// Sections
// ============================================================================

void loadListener(const YAML::Node& node, AppConfig::ListenerConfig& cfg) {
    if (!node) return;
    cfg.idleTimeoutMs = readNonNegative(node, "listener", "idle_timeout_ms", cfg.idleTimeoutMs);
    int64_t maxPayload = readOptional<int64_t>(node, "listener", "max_payload_bytes",
                                               static_cast<int64_t>(cfg.maxPayloadBytes));
    if (maxPayload <= 0)
        throw configError("listener.max_payload_bytes", "must be positive");
    cfg.maxPayloadBytes = static_cast<size_t>(maxPayload);
    cfg.exitOnSupervisorStopping = readOptional<bool>(node, "listener", "exit_on_supervisor_stopping",
                                                      cfg.exitOnSupervisorStopping);
}

void loadControl(const YAML::Node& node, AppConfig::ControlConfig& cfg) {
    if (!node)
        throw configError("control", "missing required section");

    cfg.serverUrl = readRequiredString(node, "control", "server_url");
    if (cfg.serverUrl.rfind("unix://", 0) != 0 && cfg.serverUrl.rfind("http://", 0) != 0 &&
        cfg.serverUrl.rfind("https://", 0) != 0)
        throw configError("control.server_url", "unsupported scheme in '" + cfg.serverUrl + "'");

    cfg.username = readOptional<std::string>(node, "control", "username", "");
    cfg.password = readOptional<std::string>(node, "control", "password", "");
    cfg.timeoutMs = readNonNegative(node, "control", "timeout_ms", cfg.timeoutMs);
    if (cfg.timeoutMs == 0)
        throw configError("control.timeout_ms", "must be positive");

    int retries = readOptional<int>(node, "control", "max_retries", cfg.maxRetries);
    if (retries < 0 || retries > 10)
        throw configError("control.max_retries", "must be between 0 and 10");
    cfg.maxRetries = retries;
    cfg.stopAllExclude = readStringList(node, "control", "stop_all_exclude");
}

void loadNotify(const YAML::Node& node, AppConfig::NotifyConfig& cfg) {
    if (!node) return;
    cfg.command = readOptional<std::string>(node, "notify", "command", "");
    cfg.timeoutMs = readNonNegative(node, "notify", "timeout_ms", cfg.timeoutMs);
    if (cfg.timeoutMs == 0)
        throw configError("notify.timeout_ms", "must be positive");
}

Rule loadRule(const YAML::Node& node, size_t index, uint32_t defaultCooldown) {
    const std::string section = "rules.items[" + std::to_string(index) + "]";
    if (!node.IsMap())
        throw configError(section, "expected a mapping");

    Rule rule;
    rule.id = readRequiredString(node, section, "id");

    const std::string kind = readOptional<std::string>(node, section, "event", "any");
    if (kind == "process") rule.match.kind = EventKind::PROCESS_STATE_CHANGED;
    else if (kind == "supervisor") rule.match.kind = EventKind::SUPERVISOR_STATE_CHANGED;
    else if (kind != "any")
        throw configError(section + ".event", "expected process, supervisor or any, got '" + kind + "'");

    rule.match.toStates = readStates(node, section, "to_states");
    if (rule.match.toStates.empty())
        throw configError(section + ".to_states", "missing required field");
    rule.match.fromStates = readStates(node, section, "from_states");
    rule.match.processes = readStringList(node, section, "processes");

    const YAML::Node expected = node["expected"];
    if (expected && !expected.IsNull())
        rule.match.expected = readValue<bool>(expected, section + ".expected");

    const std::string actionName = readRequiredString(node, section, "action");
    auto action = parseActionKind(actionName);
    if (!action)
        throw configError(section + ".action", "unknown action '" + actionName + "'");
    rule.action = *action;

    rule.cooldownSeconds = readNonNegative(node, section, "cooldown_seconds", defaultCooldown);
    rule.message = readOptional<std::string>(node, section, "message", "");
    rule.target = readOptional<std::string>(node, section, "target", "");
    rule.command = readOptional<std::string>(node, section, "command", "");

    if (rule.action == ActionKind::RESTART_DEPENDENT && rule.target.empty())
        throw configError(section + ".target", "required for restart_dependent");
    if (rule.action == ActionKind::INVOKE_CONTROL) {
        if (rule.command.empty())
            throw configError(section + ".command", "required for invoke_control");
        try {
            ControlCommand::parse(rule.command);
        } catch (const std::invalid_argument& e) {
            throw configError(section + ".command", e.what());
        }
    }
    return rule;
}

void loadRules(const YAML::Node& node, AppConfig::RulesConfig& cfg) {
    if (!node) return;
    cfg.defaultCooldownSeconds = readNonNegative(node, "rules", "default_cooldown_seconds", 0);

    const YAML::Node items = node["items"];
    if (!items || items.IsNull()) return;
    if (!items.IsSequence())
        throw configError("rules.items", "expected a list");

    std::set<std::string> ids;
    size_t index = 0;
    for (auto it = items.begin(); it != items.end(); ++it, ++index) {
        const YAML::Node item = *it;
        Rule rule = loadRule(item, index, cfg.defaultCooldownSeconds);
        if (!ids.insert(rule.id).second)
            throw configError("rules.items[" + std::to_string(index) + "].id", "duplicate rule id '" + rule.id + "'");
        cfg.items.push_back(std::move(rule));
    }
}

} // anonymous namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    std::ifstream probe(filepath);
    if (!probe.good())
        throw std::runtime_error("Configuration file not found: " + filepath);

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse " + filepath + ": " + e.what());
    }
    if (!root.IsMap())
        throw std::runtime_error("Configuration root must be a mapping: " + filepath);

    AppConfig::AppConfiguration config;
    config.app_name = readRequiredString(root, "", "app_name");
    config.log_level = readOptional<std::string>(root, "", "log_level", config.log_level);
    static const std::set<std::string> kLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (!kLevels.count(config.log_level))
        throw configError("log_level", "unknown level '" + config.log_level + "'");

    loadListener(root["listener"], config.listener);
    loadControl(root["control"], config.control);
    loadNotify(root["notify"], config.notify);
    loadRules(root["rules"], config.rules);

    spdlog::info("[Config] Loaded {} from {} ({} rules)", config.app_name, filepath, config.rules.items.size());
    return config;
}

} // namespace ProcBridge
