#pragma once

#include "mkp/utility.hpp"

#include <cstdio>
#include <format>
#include <print>
#include <string_view>
#include <utility>

namespace makeport::log {

enum class Level { debug, info, warn, error, off };

Result<Level> parse_level(std::string_view name);
std::string_view level_name(Level level);

void set_level(Level level);
Level level();

inline bool enabled(Level l) {
    return l >= level() && l != Level::off;
}

/**
 * @brief Writes one line to stderr when `l` passes the threshold.
 *
 * Lines from concurrent executions never interleave mid-line.
 */
void write(Level l, std::string_view message);

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args &&...args) {
    if (enabled(Level::debug))
        write(Level::debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args &&...args) {
    if (enabled(Level::info))
        write(Level::info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args &&...args) {
    if (enabled(Level::warn))
        write(Level::warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args &&...args) {
    if (enabled(Level::error))
        write(Level::error, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace makeport::log
