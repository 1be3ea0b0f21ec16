#include "Tempo/config.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace Tempo {

namespace {
    const char* getEnv(const char* name) {
        const char* value = std::getenv(name);
        return (value && *value) ? value : nullptr;
    }

    bool parseBool(const std::string& text, bool& out) {
        if (text == "1" || text == "true" || text == "on" || text == "yes") {
            out = true;
            return true;
        }
        if (text == "0" || text == "false" || text == "off" || text == "no") {
            out = false;
            return true;
        }
        return false;
    }
}

Config Config::fromEnvironment() {
    Config config;

    if (const char* value = getEnv("TEMPO_LOG_LEVEL")) {
        if (!log::parseLevel(value, config.logLevel)) {
            log::warn("Config: ignoring TEMPO_LOG_LEVEL='{}'", value);
        }
    }

    if (const char* value = getEnv("TEMPO_MAX_DELTA_TIME")) {
        try {
            float maxDeltaTime = std::stof(value);
            if (maxDeltaTime < 0.0f) {
                throw std::out_of_range("negative");
            }
            config.maxDeltaTime = maxDeltaTime;
        } catch (const std::exception&) {
            log::warn("Config: ignoring TEMPO_MAX_DELTA_TIME='{}'", value);
        }
    }

    if (const char* value = getEnv("TEMPO_STACKABLE_ACTIONS")) {
        if (!parseBool(value, config.stackableActions)) {
            log::warn("Config: ignoring TEMPO_STACKABLE_ACTIONS='{}'", value);
        }
    }

    if (const char* value = getEnv("TEMPO_TARGET_FPS")) {
        try {
            int fps = std::stoi(value);
            if (fps <= 0) {
                throw std::out_of_range("non-positive");
            }
            config.targetFrameRate = fps;
        } catch (const std::exception&) {
            log::warn("Config: ignoring TEMPO_TARGET_FPS='{}'", value);
        }
    }

    return config;
}

} // namespace Tempo
