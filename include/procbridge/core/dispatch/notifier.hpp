#pragma once
#include <procbridge/core/events/event.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace ProcBridge {

/**
 * @struct Notification
 * @brief Rendered NOTIFY action plus the event that caused it
 */
struct Notification {
    std::string ruleId;
    std::string message;
    std::string processName;
    std::string groupName;
    std::string eventName;
    std::string fromState;      // empty when the event carried none
    std::string toState;

    static Notification from(const std::string& ruleId, const std::string& message, const Event& event);
};

/**
 * @class Notifier
 * @brief Output interface for NOTIFY actions
 *
 * Called from the bridge loop between READY and the acknowledgement, so
 * implementations must return in bounded time.
 */
class Notifier {
public:
    virtual ~Notifier() = default;

    /**
     * @return false if the notification could not be delivered
     */
    virtual bool notify(const Notification& notification) = 0;

    virtual const char* name() const = 0;
};

using NotifierPtr = std::shared_ptr<Notifier>;

/**
 * @class LoggingNotifier
 * @brief Writes notifications to the log at warning level
 */
class LoggingNotifier : public Notifier {
public:
    bool notify(const Notification& notification) override;
    const char* name() const override { return "LoggingNotifier"; }
};

/**
 * @class CommandNotifier
 * @brief Runs a shell command per notification
 *
 * The command gets the notification in PROCBRIDGE_RULE, PROCBRIDGE_PROCESS,
 * PROCBRIDGE_GROUP, PROCBRIDGE_EVENT, PROCBRIDGE_FROM_STATE,
 * PROCBRIDGE_TO_STATE and PROCBRIDGE_MESSAGE. Its stdin is /dev/null and
 * its stdout goes to our stderr: stdout belongs to the listener protocol.
 * A child still running at the timeout is killed.
 */
class CommandNotifier : public Notifier {
public:
    explicit CommandNotifier(std::string command,
                             std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    bool notify(const Notification& notification) override;
    const char* name() const override { return "CommandNotifier"; }

    const std::string& command() const { return command_; }

private:
    std::string command_;
    std::chrono::milliseconds timeout_;
};

/**
 * @class CompositeNotifier
 * @brief Fans out to several notifiers; succeeds if every one succeeded
 *
 * A notifier that throws counts as failed and does not stop the others.
 */
class CompositeNotifier : public Notifier {
public:
    void addNotifier(NotifierPtr notifier) {
        if (notifier) notifiers_.push_back(std::move(notifier));
    }

    bool notify(const Notification& notification) override;
    const char* name() const override { return "CompositeNotifier"; }

    size_t size() const { return notifiers_.size(); }

private:
    std::vector<NotifierPtr> notifiers_;
};

/**
 * @class NullNotifier
 * @brief Discards notifications
 */
class NullNotifier : public Notifier {
public:
    bool notify(const Notification&) override { return true; }
    const char* name() const override { return "NullNotifier"; }
};

} // namespace ProcBridge
