#include <procbridge/core/control/control_types.hpp>
#include <sstream>
#include <stdexcept>

namespace ProcBridge {

const char* toString(ControlError error) {
    switch (error) {
        case ControlError::NONE:        return "ok";
        case ControlError::UNREACHABLE: return "unreachable";
        case ControlError::NOT_FOUND:   return "not_found";
        case ControlError::REJECTED:    return "rejected";
        default:                        return "unknown";
    }
}

const char* toString(ControlOp op) {
    switch (op) {
        case ControlOp::LIST:     return "list";
        case ControlOp::INFO:     return "info";
        case ControlOp::START:    return "start";
        case ControlOp::STOP:     return "stop";
        case ControlOp::RESTART:  return "restart";
        case ControlOp::STOP_ALL: return "stop_all";
        case ControlOp::SHUTDOWN: return "shutdown";
        default:                  return "unknown";
    }
}

std::string ProcessStatus::qualifiedName() const {
    if (group.empty() || group == name) return name;
    return group + ":" + name;
}

bool ControlCommand::requiresName(ControlOp op) {
    return op == ControlOp::INFO || op == ControlOp::START ||
           op == ControlOp::STOP || op == ControlOp::RESTART;
}

ControlCommand ControlCommand::parse(const std::string& text) {
    std::istringstream iss(text);
    std::string verb;
    std::string name;
    std::string extra;
    iss >> verb >> name >> extra;

    if (verb.empty())
        throw std::invalid_argument("Empty control command");
    if (!extra.empty())
        throw std::invalid_argument("Too many arguments in control command: '" + text + "'");

    ControlCommand cmd;
    if (verb == "list")                              cmd.op = ControlOp::LIST;
    else if (verb == "info")                         cmd.op = ControlOp::INFO;
    else if (verb == "start")                        cmd.op = ControlOp::START;
    else if (verb == "stop")                         cmd.op = ControlOp::STOP;
    else if (verb == "restart")                      cmd.op = ControlOp::RESTART;
    else if (verb == "stop_all" || verb == "stop-all") cmd.op = ControlOp::STOP_ALL;
    else if (verb == "shutdown")                     cmd.op = ControlOp::SHUTDOWN;
    else throw std::invalid_argument("Unknown control command: '" + verb + "'");

    if (!requiresName(cmd.op) && !name.empty())
        throw std::invalid_argument("Control command '" + verb + "' takes no process name");

    cmd.name = name;
    return cmd;
}

std::string ControlCommand::toString() const {
    std::string out = ProcBridge::toString(op);
    if (!name.empty()) out += " " + name;
    return out;
}

} // namespace ProcBridge
