#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <chrono>
#include <memory>
#include <unistd.h>

#include <procbridge/core/bridge/bridge_loop.hpp>
#include <procbridge/core/config/component_factory.hpp>
#include <procbridge/core/config/loader.hpp>
#include <procbridge/core/dispatch/action_dispatcher.hpp>
#include <procbridge/core/protocol/duplex_stream.hpp>
#include <procbridge/core/rules/rule_engine.hpp>
#include <procbridge/core/utils/logging.hpp>

using namespace ProcBridge;

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_stop_requested{false};

static void signalHandler(int) {
    g_stop_requested.store(true, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    Logging::init("procbridge");
    spdlog::info("procbridge v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    // A vanished daemon must surface as a write error, not kill us
    std::signal(SIGPIPE, SIG_IGN);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/procbridge.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    std::shared_ptr<SupervisorControlClient> control;
    NotifierPtr notifier;
    std::unique_ptr<RuleEngine> rules;
    std::unique_ptr<ActionDispatcher> dispatcher;
    std::unique_ptr<FdDuplexStream> channel;
    std::unique_ptr<BridgeLoop> bridge;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;

    c.control = makeControlClient(config.control);
    c.notifier = makeNotifier(config.notify);
    c.rules = std::make_unique<RuleEngine>(config.rules.items);
    c.dispatcher = std::make_unique<ActionDispatcher>(c.control, c.notifier);

    // Events arrive on stdin, acknowledgements leave on stdout
    c.channel = std::make_unique<FdDuplexStream>(
        STDIN_FILENO,
        STDOUT_FILENO,
        std::chrono::milliseconds(config.listener.idleTimeoutMs),
        &g_stop_requested
    );

    BridgeOptions options;
    options.maxPayloadBytes = config.listener.maxPayloadBytes;
    options.exitOnSupervisorStopping = config.listener.exitOnSupervisorStopping;
    c.bridge = std::make_unique<BridgeLoop>(*c.channel, *c.rules, *c.dispatcher, options);

    spdlog::info("{} rules loaded, control endpoint {}", c.rules->rules().size(), config.control.serverUrl);
    return c;
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        spdlog::critical("curl_global_init failed");
        return EXIT_FAILURE;
    }

    int status = EXIT_FAILURE;
    try {
        auto config = loadConfiguration(argc, argv);
        Logging::setLevel(config.log_level);
        spdlog::info("Configuration loaded successfully");

        auto components = initializeComponents(config);
        status = components.bridge->run();

        spdlog::info("Rules fired {} times, {} suppressed by cooldown",
                     components.rules->firedCount(), components.rules->suppressedCount());
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        status = EXIT_FAILURE;
    }

    curl_global_cleanup();
    spdlog::info("procbridge terminated with status {}", status);
    return status;
}
