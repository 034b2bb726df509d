#include "chatstore/core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace chatstore {

namespace {

std::shared_ptr<spdlog::logger> g_logger;

// Unknown names fall back to info.
auto parse_level(std::string_view level) -> spdlog::level::level_enum {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // anonymous namespace

void Logger::init(std::string_view name, std::string_view level) {
    // Re-initialisation replaces the registered logger of the same name.
    spdlog::drop(std::string(name));
    // stderr keeps stdout free for command output.
    g_logger = spdlog::stderr_color_mt(std::string(name));
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    g_logger->set_level(parse_level(level));
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    get()->set_level(parse_level(level));
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace chatstore
