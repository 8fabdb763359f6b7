// llamaload - Configuration Implementation

#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace llamaload {

namespace {

std::string envString(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

void envBool(const char* name, bool& target) {
    const char* value = std::getenv(name);
    if (!value) return;

    if (auto parsed = parseBool(value)) {
        target = *parsed;
    } else {
        LOGW("Ignoring %s=%s: not a boolean", name, value);
    }
}

} // namespace

std::optional<bool> parseBool(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

Config Config::fromEnvironment() {
    Config config;
    config.library_path = envString("LLAMALOAD_LIBRARY_PATH");
    config.version = envString("LLAMALOAD_VERSION");
    config.cache_dir = envString("LLAMALOAD_CACHE_DIR");
    config.embedded_dir = envString("LLAMALOAD_EMBEDDED_DIR");
    envBool("LLAMALOAD_USE_EMBEDDED", config.use_embedded);

    if (const char* value = std::getenv("LLAMALOAD_PRELOAD_SIBLINGS")) {
        config.preload_siblings = parseBool(value);
        if (!config.preload_siblings) {
            LOGW("Ignoring LLAMALOAD_PRELOAD_SIBLINGS=%s: not a boolean", value);
        }
    }

    LOGD("Config: path='%s' version='%s' cache='%s' embedded=%d",
         config.library_path.c_str(), config.version.c_str(),
         config.cache_dir.c_str(), config.use_embedded ? 1 : 0);
    return config;
}

} // namespace llamaload
