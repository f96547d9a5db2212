#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace mockdb {

namespace {
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v";
} // namespace

void init_default_logger(spdlog::level::level_enum level) {
    auto logger = spdlog::get("mockdb-main");
    if (!logger) {
        logger = spdlog::stdout_color_mt("mockdb-main");
        logger->set_pattern(kPattern);
    }
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> make_store_logger(
    std::string_view name,
    spdlog::level::level_enum level)
{
    const std::string logger_name{name};

    // Return existing logger if already created (idempotent).
    if (auto existing = spdlog::get(logger_name)) {
        return existing;
    }

    auto logger = spdlog::stdout_color_mt(logger_name);
    logger->set_pattern(kPattern);
    logger->set_level(level);
    return logger;
}

spdlog::level::level_enum parse_log_level(const std::string& s) {
    if (s == "trace")    return spdlog::level::trace;
    if (s == "debug")    return spdlog::level::debug;
    if (s == "info")     return spdlog::level::info;
    if (s == "warn")     return spdlog::level::warn;
    if (s == "error")    return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    if (s == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

bool is_known_log_level(const std::string& s) {
    return s == "trace" || s == "debug" || s == "info" || s == "warn" ||
           s == "error" || s == "critical" || s == "off";
}

} // namespace mockdb
