#include <procbridge/core/control/control_client.hpp>

namespace ProcBridge {

ControlResult ControlClient::execute(const ControlCommand& command) {
    ControlResult summary;
    summary.op = command.op;
    summary.name = command.name;

    switch (command.op) {
        case ControlOp::LIST: {
            auto listed = list();
            summary.error = listed.error;
            summary.message = listed.ok()
                ? std::to_string(listed.value.size()) + " processes"
                : listed.message;
            return summary;
        }
        case ControlOp::INFO: {
            auto details = info(command.name);
            summary.error = details.error;
            if (details.ok()) {
                summary.state = details.value.state;
                summary.message = command.name + " state=" + toString(details.value.state);
            } else {
                summary.message = details.message;
            }
            return summary;
        }
        case ControlOp::START:
            return start(command.name);
        case ControlOp::STOP:
            return stop(command.name);
        case ControlOp::RESTART:
            return restart(command.name);
        case ControlOp::STOP_ALL: {
            auto stopped = stopAll();
            summary.name = "*";
            if (!stopped.ok()) {
                summary.error = stopped.error;
                summary.message = stopped.message;
                return summary;
            }
            size_t failed = 0;
            for (const auto& r : stopped.value) {
                if (r.ok()) continue;
                if (failed++ == 0) {
                    summary.error = r.error;
                    summary.faultCode = r.faultCode;
                }
            }
            summary.message = "stopped " + std::to_string(stopped.value.size() - failed) +
                              " of " + std::to_string(stopped.value.size()) + " processes";
            return summary;
        }
        case ControlOp::SHUTDOWN:
            return shutdown();
    }

    summary.error = ControlError::REJECTED;
    summary.message = "unsupported control operation";
    return summary;
}

} // namespace ProcBridge
