#include <procbridge/core/utils/logging.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ProcBridge {
namespace Logging {

void init(const std::string& name) {
    auto logger = spdlog::stderr_color_mt(name);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void setLevel(const std::string& level) {
    spdlog::set_level(spdlog::level::from_str(level));
}

} // namespace Logging
} // namespace ProcBridge
