#pragma once
#include <procbridge/core/config/app_config.hpp>
#include <string>

namespace ProcBridge {

class ConfigLoader {
public:
    /**
     * @throws std::runtime_error if the file is missing, is not valid YAML,
     *         or a field is missing or invalid (the message names the key)
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};

} // namespace ProcBridge
