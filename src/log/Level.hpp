#pragma once

#include <string_view>

namespace Log
{

/**
 * Log item severity.
 */
enum class Level
{
    debug,
    info,
    warning,
    error,
    fatal
};

/**
 * Get the name of a level as it's written in configuration and log files.
 */
constexpr std::string_view getLevelName(Level level)
{
    switch (level) {
        case Level::debug: return "debug";
        case Level::info: return "info";
        case Level::warning: return "warning";
        case Level::error: return "error";
        case Level::fatal: return "fatal";
    }
    return "unknown";
}

} // namespace Log
