#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace mockdb {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (for code that doesn't belong to a
// specific store: CLI, tools, tests).
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named store logger.
//   name   – embedded in every log line as [<name>]
//   level  – initial log level (only applied on creation)
std::shared_ptr<spdlog::logger> make_store_logger(
    std::string_view name = "mockdb",
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

// True if `s` names one of the levels accepted by parse_log_level().
[[nodiscard]] bool is_known_log_level(const std::string& s);

} // namespace mockdb
