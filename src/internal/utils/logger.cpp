// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - Logger Implementation                                              ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "internal/utils/logger.hpp"
#include "primdb/config.hpp"

#include <spdlog/spdlog.h>

namespace primdb::log {

namespace {

void log_impl(spdlog::level::level_enum level, std::string_view message) {
#if PRIMDB_ENABLE_LOGGING
    spdlog::default_logger_raw()->log(level, "{}", message);
#else
    (void)level;
    (void)message;
#endif
}

} // anonymous namespace

void debug(std::string_view message) {
    log_impl(spdlog::level::debug, message);
}

void info(std::string_view message) {
    log_impl(spdlog::level::info, message);
}

void warn(std::string_view message) {
    log_impl(spdlog::level::warn, message);
}

void error(std::string_view message) {
    log_impl(spdlog::level::err, message);
}

} // namespace primdb::log
