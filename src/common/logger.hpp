#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace cvault {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger ("cvault").
// Always logs to stdout; when `log_file` is non-empty every line is also
// appended to that file.  Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info,
                         const std::string& log_file = {});

// Create (or retrieve if already exists) a per-component logger.
//   component – short name embedded in every log line as [<component>]
// The logger shares the default logger's sinks and level, so it must be
// called after init_default_logger() to pick up a configured log file.
std::shared_ptr<spdlog::logger> make_component_logger(const std::string& component);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace cvault
