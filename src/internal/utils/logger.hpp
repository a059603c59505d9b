// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - Logger Header                                                      ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <string_view>
#include <fmt/core.h>

namespace primdb::log {

// Sinks and level are configured by the application through spdlog;
// library code only writes messages.
void debug(std::string_view message);
void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);

template<typename... Args>
void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    debug(std::string_view(fmt::format(fmt, std::forward<Args>(args)...)));
}

template<typename... Args>
void info(fmt::format_string<Args...> fmt, Args&&... args) {
    info(std::string_view(fmt::format(fmt, std::forward<Args>(args)...)));
}

template<typename... Args>
void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    warn(std::string_view(fmt::format(fmt, std::forward<Args>(args)...)));
}

template<typename... Args>
void error(fmt::format_string<Args...> fmt, Args&&... args) {
    error(std::string_view(fmt::format(fmt, std::forward<Args>(args)...)));
}

} // namespace primdb::log
