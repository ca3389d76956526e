#pragma once
#include <string>

namespace ProcBridge {
namespace Logging {

/**
 * @brief Install a colour stderr logger as the spdlog default
 *
 * stdout is reserved for the listener protocol; nothing may log there.
 */
void init(const std::string& name);

/**
 * @brief Apply a level name (trace, debug, info, warn, error, critical, off)
 */
void setLevel(const std::string& level);

} // namespace Logging
} // namespace ProcBridge
