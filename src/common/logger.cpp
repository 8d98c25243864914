#include "common/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace cvault {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v";

} // anonymous namespace

void init_default_logger(spdlog::level::level_enum level,
                         const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        // Throws spdlog::spdlog_ex if the file cannot be opened.
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
    }

    // Component loggers copy the default sinks, so drop them along with it.
    spdlog::drop_all();
    auto logger = std::make_shared<spdlog::logger>("cvault", sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(level);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> make_component_logger(const std::string& component) {
    // Return existing logger if already created (idempotent).
    if (auto existing = spdlog::get(component)) {
        return existing;
    }

    auto base = spdlog::default_logger();
    auto logger = std::make_shared<spdlog::logger>(
        component, base->sinks().begin(), base->sinks().end());
    logger->set_pattern(kPattern);
    logger->set_level(base->level());
    spdlog::register_logger(logger);
    return logger;
}

spdlog::level::level_enum parse_log_level(const std::string& s) {
    if (s == "trace")    return spdlog::level::trace;
    if (s == "debug")    return spdlog::level::debug;
    if (s == "info")     return spdlog::level::info;
    if (s == "warn")     return spdlog::level::warn;
    if (s == "error")    return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}

} // namespace cvault
