#pragma once

/**
 * @file transfer_logger.hpp
 * @brief Diagnostic logging for the transfer subsystem.
 *
 * Compiled in only when VEIL_DEBUG_LOG is defined (CMake: -DVEIL_DEBUG_LOG=ON).
 * Callers pass phases, counts and Redact()-ed identifiers. Never pass key
 * material, decrypted permissions, proof bytes or full nullifiers.
 */

#include "veil/core/constants.hpp"

#include <string>
#include <string_view>

#ifdef VEIL_DEBUG_LOG
#include <cstdio>
#include <fmt/core.h>
#endif

namespace veil::debug {

/**
 * @brief Truncates an identifier to a short prefix safe for log lines.
 */
inline std::string Redact(std::string_view identifier) {
    constexpr size_t keep = transfer::Constants::REDACTED_ID_CHARS;
    if (identifier.size() <= keep) {
        return std::string(identifier);
    }
    return std::string(identifier.substr(0, keep)) + "...";
}

enum class Level {
    Debug,
    Info,
    Warn,
    Error
};

#ifdef VEIL_DEBUG_LOG

inline const char* LevelToString(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "UNKNOWN";
}

template<typename... Args>
void Write(Level level, const char* component, fmt::format_string<Args...> format, Args&&... args) {
    const std::string line = fmt::format(format, std::forward<Args>(args)...);
    fprintf(stderr, "[VEIL] %s %s: %s\n", LevelToString(level), component, line.c_str());
    fflush(stderr);
}

#define VEIL_LOG_DEBUG(component, ...) \
    ::veil::debug::Write(::veil::debug::Level::Debug, component, __VA_ARGS__)
#define VEIL_LOG_INFO(component, ...) \
    ::veil::debug::Write(::veil::debug::Level::Info, component, __VA_ARGS__)
#define VEIL_LOG_WARN(component, ...) \
    ::veil::debug::Write(::veil::debug::Level::Warn, component, __VA_ARGS__)
#define VEIL_LOG_ERROR(component, ...) \
    ::veil::debug::Write(::veil::debug::Level::Error, component, __VA_ARGS__)

#else

#define VEIL_LOG_DEBUG(component, ...) do { } while(0)
#define VEIL_LOG_INFO(component, ...) do { } while(0)
#define VEIL_LOG_WARN(component, ...) do { } while(0)
#define VEIL_LOG_ERROR(component, ...) do { } while(0)

#endif

}
