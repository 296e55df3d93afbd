#include "mkp/log.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <format>
#include <mutex>
#include <print>
#include <string>

namespace makeport::log {

namespace {

std::atomic<Level> threshold = Level::info;
std::mutex stderr_mtx;

} // namespace

Result<Level> parse_level(std::string_view name) {
    std::string lowered;
    lowered.reserve(name.size());
    for (unsigned char c : name)
        lowered.push_back(static_cast<char>(std::tolower(c)));

    if (lowered == "debug")
        return Level::debug;
    if (lowered == "info")
        return Level::info;
    if (lowered == "warn" || lowered == "warning")
        return Level::warn;
    if (lowered == "error")
        return Level::error;
    if (lowered == "off")
        return Level::off;
    return std::unexpected(std::format("Unknown log level: {}", name));
}

std::string_view level_name(Level level) {
    switch (level) {
    case Level::debug:
        return "DEBUG";
    case Level::info:
        return "INFO";
    case Level::warn:
        return "WARN";
    case Level::error:
        return "ERROR";
    case Level::off:
        return "OFF";
    }
    return "?";
}

void set_level(Level level) {
    threshold.store(level, std::memory_order_relaxed);
}

Level level() {
    return threshold.load(std::memory_order_relaxed);
}

void write(Level l, std::string_view message) {
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    std::lock_guard lock(stderr_mtx);
    std::println(stderr, "{:%F %T} [{}] {}", now, level_name(l), message);
}

} // namespace makeport::log
