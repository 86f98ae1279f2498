#pragma once
#include <hookstream/core/config/app_config.hpp>
#include <string>

namespace HookStream {

class ConfigLoader {
public:
    // Throws std::runtime_error on a missing file, bad YAML, a missing
    // required field, a wrong field type or an invalid value
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    static void validate(const AppConfig::AppConfiguration& config);
};

} // namespace HookStream
