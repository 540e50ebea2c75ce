#pragma once
#include <streamrpc/core/config/app_config.hpp>
#include <string>

namespace StreamRpc {

class ConfigLoader {
public:
    /**
     * @brief Load and validate a YAML configuration file
     * @throws std::runtime_error on missing file, missing required field,
     *         wrong field type or out-of-range value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};

} // namespace StreamRpc
