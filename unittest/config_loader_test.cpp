// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading and validation
// ============================================================================

#include <gtest/gtest.h>
#include <procbridge/core/config/app_config.hpp>
#include <procbridge/core/config/component_factory.hpp>
#include <procbridge/core/config/loader.hpp>

using namespace ProcBridge;

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, LoadValidConfiguration) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("unittest/config/valid.yaml");

    EXPECT_EQ(config.app_name, "procbridge-test");
    EXPECT_EQ(config.log_level, "debug");

    EXPECT_EQ(config.listener.idleTimeoutMs, 1500u);
    EXPECT_EQ(config.listener.maxPayloadBytes, 4096u);
    EXPECT_FALSE(config.listener.exitOnSupervisorStopping);

    EXPECT_EQ(config.control.serverUrl, "http://127.0.0.1:9001");
    EXPECT_EQ(config.control.username, "admin");
    EXPECT_EQ(config.control.password, "secret");
    EXPECT_EQ(config.control.timeoutMs, 750u);
    EXPECT_EQ(config.control.maxRetries, 1);
    ASSERT_EQ(config.control.stopAllExclude.size(), 2u);
    EXPECT_EQ(config.control.stopAllExclude[1], "nginx");

    EXPECT_FALSE(config.notify.command.empty());
    EXPECT_EQ(config.notify.timeoutMs, 2000u);
}

TEST(ConfigLoader, LoadsRules) {
    auto config = ConfigLoader::loadConfig("unittest/config/valid.yaml");
    const auto& rules = config.rules.items;
    ASSERT_EQ(rules.size(), 3u);

    EXPECT_EQ(rules[0].id, "worker-fatal");
    ASSERT_TRUE(rules[0].match.kind.has_value());
    EXPECT_EQ(*rules[0].match.kind, EventKind::PROCESS_STATE_CHANGED);
    EXPECT_EQ(rules[0].match.toStates.count(ProcessState::FATAL), 1u);
    EXPECT_EQ(rules[0].match.fromStates.count(ProcessState::BACKOFF), 1u);
    EXPECT_EQ(rules[0].action, ActionKind::NOTIFY);
    EXPECT_EQ(rules[0].cooldownSeconds, 60u);
    EXPECT_EQ(rules[0].message, "{process} is FATAL");

    EXPECT_FALSE(rules[1].match.kind.has_value());
    ASSERT_TRUE(rules[1].match.expected.has_value());
    EXPECT_FALSE(*rules[1].match.expected);
    EXPECT_EQ(rules[1].action, ActionKind::RESTART_DEPENDENT);
    EXPECT_EQ(rules[1].target, "gateway");
    EXPECT_EQ(rules[1].cooldownSeconds, 15u);  // default_cooldown_seconds

    ASSERT_TRUE(rules[2].match.kind.has_value());
    EXPECT_EQ(*rules[2].match.kind, EventKind::SUPERVISOR_STATE_CHANGED);
    EXPECT_EQ(rules[2].action, ActionKind::INVOKE_CONTROL);
    EXPECT_EQ(rules[2].command, "stop_all");
}

TEST(ConfigLoader, AppliesDefaults) {
    auto config = ConfigLoader::loadConfig("unittest/config/minimal.yaml");

    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.listener.idleTimeoutMs, 0u);
    EXPECT_EQ(config.listener.maxPayloadBytes, kDefaultMaxPayloadBytes);
    EXPECT_TRUE(config.listener.exitOnSupervisorStopping);
    EXPECT_EQ(config.control.timeoutMs, 3000u);
    EXPECT_EQ(config.control.maxRetries, 2);
    EXPECT_TRUE(config.notify.command.empty());
    EXPECT_EQ(config.notify.timeoutMs, 5000u);
    EXPECT_TRUE(config.rules.items.empty());
}

TEST(ConfigLoader, ShippedConfigurationLoads) {
    auto config = ConfigLoader::loadConfig("config/procbridge.yaml");
    EXPECT_EQ(config.app_name, "procbridge");
    EXPECT_FALSE(config.rules.items.empty());
}

TEST(ConfigLoader, BuildsComponentsFromConfiguration) {
    auto config = ConfigLoader::loadConfig("unittest/config/valid.yaml");

    auto client = makeControlClient(config.control);
    EXPECT_EQ(client->options().timeout, std::chrono::milliseconds(750));
    EXPECT_EQ(client->options().maxRetries, 1);
    EXPECT_EQ(client->options().stopAllExclude.size(), 2u);

    NotifierPtr notifier = makeNotifier(config.notify);
    auto composite = std::dynamic_pointer_cast<CompositeNotifier>(notifier);
    ASSERT_NE(composite, nullptr);
    EXPECT_EQ(composite->size(), 2u);
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(ConfigLoader::loadConfig("config/non_existent.yaml"), std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnMalformedYaml) {
    EXPECT_THROW(ConfigLoader::loadConfig("unittest/config/not_yaml.yaml"), std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    EXPECT_THROW(ConfigLoader::loadConfig("unittest/config/missing_field.yaml"), std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(ConfigLoader::loadConfig("unittest/config/invalid_type.yaml"), std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnInvalidFieldValue) {
    EXPECT_THROW(ConfigLoader::loadConfig("unittest/config/invalid_value.yaml"), std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnInvalidRules) {
    for (const char* file : {"unknown_state", "duplicate_rule", "bad_command", "missing_target", "unknown_action"}) {
        SCOPED_TRACE(file);
        EXPECT_THROW(ConfigLoader::loadConfig(std::string("unittest/config/") + file + ".yaml"),
                     std::runtime_error);
    }
}

TEST(ConfigLoader, ErrorNamesOffendingKey) {
    try {
        ConfigLoader::loadConfig("unittest/config/unknown_state.yaml");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("rules.items[0].to_states"), std::string::npos);
    }
}
