#pragma once

#include "log.hpp"

namespace Tempo {

// ============================================================
// Director Configuration
// ============================================================

struct Config {
    LogLevel logLevel = LogLevel::Info;
    float maxDeltaTime = 0.25f;     // Longer frames are clamped; 0 disables
    bool stackableActions = true;   // Default for MoveBy/MoveTo/BezierBy/BezierTo
    int targetFrameRate = 60;       // Pacing for hosts that sleep between frames

    Config() = default;

    // Defaults overridden by TEMPO_LOG_LEVEL, TEMPO_MAX_DELTA_TIME,
    // TEMPO_STACKABLE_ACTIONS and TEMPO_TARGET_FPS. Malformed values are logged and skipped.
    static Config fromEnvironment();
};

} // namespace Tempo
