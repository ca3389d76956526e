#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <curl/curl.h>
#include <getopt.h>
#include <cstdlib>
#include <string>

#include <procbridge/core/config/component_factory.hpp>
#include <procbridge/core/config/loader.hpp>
#include <procbridge/core/control/control_client.hpp>
#include <procbridge/core/utils/logging.hpp>

using namespace ProcBridge;

// sysexits.h values
static constexpr int EXIT_USAGE = 64;
static constexpr int EXIT_REJECTED = 65;
static constexpr int EXIT_NOT_FOUND = 66;
static constexpr int EXIT_UNAVAILABLE = 69;

static void printUsage(const char* prog) {
    fmt::print(stderr,
               "Usage: {} [-c config] [-v] COMMAND\n"
               "Commands:\n"
               "  list              show all processes\n"
               "  info NAME         show one process\n"
               "  start NAME\n"
               "  stop NAME\n"
               "  restart NAME      stop, then start if the stop succeeded\n"
               "  stop-all          stop every running process\n"
               "  shutdown          shut the daemon down\n",
               prog);
}

static int exitCodeFor(ControlError error) {
    switch (error) {
        case ControlError::NONE:        return EXIT_SUCCESS;
        case ControlError::REJECTED:    return EXIT_REJECTED;
        case ControlError::NOT_FOUND:   return EXIT_NOT_FOUND;
        case ControlError::UNREACHABLE: return EXIT_UNAVAILABLE;
    }
    return EXIT_FAILURE;
}

static void printProcess(const ProcessStatus& p) {
    fmt::print("{:<32} {:<9} {}\n", p.qualifiedName(), toString(p.state), p.description);
}

static int runCommand(ControlClient& client, const ControlCommand& command) {
    switch (command.op) {
        case ControlOp::LIST: {
            auto outcome = client.list();
            if (!outcome.ok()) {
                fmt::print(stderr, "list: {} ({})\n", toString(outcome.error), outcome.message);
                return exitCodeFor(outcome.error);
            }
            for (const auto& p : outcome.value) printProcess(p);
            return EXIT_SUCCESS;
        }
        case ControlOp::INFO: {
            auto outcome = client.info(command.name);
            if (!outcome.ok()) {
                fmt::print(stderr, "{}: {} ({})\n", command.name, toString(outcome.error), outcome.message);
                return exitCodeFor(outcome.error);
            }
            printProcess(outcome.value);
            if (outcome.value.pid) fmt::print("  pid: {}\n", *outcome.value.pid);
            if (!outcome.value.spawnError.empty()) fmt::print("  spawn error: {}\n", outcome.value.spawnError);
            return EXIT_SUCCESS;
        }
        case ControlOp::STOP_ALL: {
            auto outcome = client.stopAll();
            for (const auto& r : outcome.value) {
                fmt::print("{:<32} {}\n", r.name, r.ok() ? r.message : std::string(toString(r.error)) + ": " + r.message);
            }
            if (!outcome.ok()) {
                fmt::print(stderr, "stop-all: {} ({})\n", toString(outcome.error), outcome.message);
                return exitCodeFor(outcome.error);
            }
            fmt::print("{}\n", outcome.message);
            for (const auto& r : outcome.value) {
                if (!r.ok()) return exitCodeFor(r.error);
            }
            return EXIT_SUCCESS;
        }
        default:
            break;
    }

    ControlResult result = client.execute(command);
    if (result.ok()) {
        fmt::print("{}\n", result.message);
    } else {
        fmt::print(stderr, "{}: {} ({})\n", command.toString(), toString(result.error), result.message);
    }
    return exitCodeFor(result.error);
}

int main(int argc, char* argv[]) {
    Logging::init("procbridge-ctl");
    spdlog::set_level(spdlog::level::warn);

    std::string configPath = "config/procbridge.yaml";
    bool verbose = false;

    static const struct option long_options[] = {
        {"config",  required_argument, nullptr, 'c'},
        {"verbose", no_argument,       nullptr, 'v'},
        {"help",    no_argument,       nullptr, 'h'},
        {nullptr,   0,                 nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:vh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'c':
            configPath = optarg;
            break;
        case 'v':
            verbose = true;
            break;
        case 'h':
            printUsage(argv[0]);
            return EXIT_SUCCESS;
        default:
            printUsage(argv[0]);
            return EXIT_USAGE;
        }
    }

    std::string text;
    for (int i = optind; i < argc; ++i) {
        if (!text.empty()) text += " ";
        text += argv[i];
    }

    ControlCommand command;
    try {
        command = ControlCommand::parse(text);
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "{}\n", e.what());
        printUsage(argv[0]);
        return EXIT_USAGE;
    }
    if (ControlCommand::requiresName(command.op) && command.name.empty()) {
        fmt::print(stderr, "'{}' needs a process name\n", toString(command.op));
        return EXIT_USAGE;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        fmt::print(stderr, "curl_global_init failed\n");
        return EXIT_FAILURE;
    }

    int status = EXIT_FAILURE;
    try {
        auto config = ConfigLoader::loadConfig(configPath);
        spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

        auto client = makeControlClient(config.control);
        status = runCommand(*client, command);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Fatal error: {}\n", e.what());
        status = EXIT_FAILURE;
    }

    curl_global_cleanup();
    return status;
}
