#include <procbridge/core/dispatch/notifier.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace ProcBridge {

Notification Notification::from(const std::string& ruleId, const std::string& message, const Event& event) {
    Notification n;
    n.ruleId = ruleId;
    n.message = message;
    n.processName = event.processName;
    n.groupName = event.groupName;
    n.eventName = event.eventName;
    if (event.fromState) n.fromState = toString(*event.fromState);
    n.toState = toString(event.toState);
    return n;
}

// ============================================================================
// LoggingNotifier
// ============================================================================

bool LoggingNotifier::notify(const Notification& notification) {
    spdlog::warn("[Notifier] {} - {}", notification.ruleId, notification.message);
    return true;
}

// ============================================================================
// CommandNotifier
// ============================================================================

namespace {

std::vector<std::string> buildEnvironment(const Notification& n) {
    static const char* kPrefix = "PROCBRIDGE_";
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        if (std::strncmp(*e, kPrefix, std::strlen(kPrefix)) != 0)
            env.emplace_back(*e);
    }
    env.push_back("PROCBRIDGE_RULE=" + n.ruleId);
    env.push_back("PROCBRIDGE_PROCESS=" + n.processName);
    env.push_back("PROCBRIDGE_GROUP=" + n.groupName);
    env.push_back("PROCBRIDGE_EVENT=" + n.eventName);
    env.push_back("PROCBRIDGE_FROM_STATE=" + n.fromState);
    env.push_back("PROCBRIDGE_TO_STATE=" + n.toState);
    env.push_back("PROCBRIDGE_MESSAGE=" + n.message);
    return env;
}

} // anonymous namespace

CommandNotifier::CommandNotifier(std::string command, std::chrono::milliseconds timeout)
    : command_(std::move(command)), timeout_(timeout) {
    if (command_.empty())
        throw std::invalid_argument("CommandNotifier requires a command");
}

bool CommandNotifier::notify(const Notification& notification) {
    // Prepared before fork: the child only calls async-signal-safe functions
    std::vector<std::string> env = buildEnvironment(notification);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& s : env) envp.push_back(&s[0]);
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("[Notifier] fork failed: {}", std::strerror(errno));
        return false;
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(STDERR_FILENO, STDOUT_FILENO);
        execle("/bin/sh", "sh", "-c", command_.c_str(), (char*)nullptr, envp.data());
        _exit(127);
    }

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    int status = 0;
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            spdlog::error("[Notifier] waitpid failed: {}", std::strerror(errno));
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::error("[Notifier] '{}' exceeded {} ms, killing pid {}",
                          command_, timeout_.count(), pid);
            kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        spdlog::debug("[Notifier] '{}' delivered rule {}", command_, notification.ruleId);
        return true;
    }
    if (WIFEXITED(status)) {
        spdlog::warn("[Notifier] '{}' exited with status {}", command_, WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
        spdlog::warn("[Notifier] '{}' killed by signal {}", command_, WTERMSIG(status));
    }
    return false;
}

// ============================================================================
// CompositeNotifier
// ============================================================================

bool CompositeNotifier::notify(const Notification& notification) {
    bool all = true;
    for (auto& n : notifiers_) {
        try {
            if (!n->notify(notification)) all = false;
        } catch (const std::exception& e) {
            spdlog::error("[Notifier] {} threw: {}", n->name(), e.what());
            all = false;
        }
    }
    return all;
}

} // namespace ProcBridge
