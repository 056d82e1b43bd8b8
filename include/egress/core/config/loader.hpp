#pragma once
#include <egress/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    /**
     * @throws std::runtime_error on missing file, missing required field,
     *         wrong field type or out-of-range value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
    static AppConfig::AppConfiguration loadFromString(const std::string& yaml);
};
