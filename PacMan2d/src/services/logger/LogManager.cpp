#include "LogManager.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace pm2d::logging {
namespace {
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_mtx;

    Status init_locked(const Config& cfg, void (*apply)(const Config&)) {
        if (g_logger) return Status::already_initialized;
        try {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            g_logger = std::make_shared<spdlog::logger>(cfg.name, console_sink);
            spdlog::register_logger(g_logger);
            apply(cfg);
            return Status::ok;
        } catch (const spdlog::spdlog_ex&) {
            g_logger.reset();
            return Status::error;
        }
    }
}

std::shared_ptr<spdlog::logger>& LogManager::logger() { return g_logger; }

int LogManager::to_spd(Level lvl) {
    using spd = spdlog::level::level_enum;
    switch (lvl) {
        case Level::trace: return (int)spd::trace;
        case Level::debug: return (int)spd::debug;
        case Level::info: return (int)spd::info;
        case Level::warn: return (int)spd::warn;
        case Level::err: return (int)spd::err;
        case Level::critical: return (int)spd::critical;
        case Level::off: default: return (int)spd::off;
    }
}

void LogManager::apply_config(const Config& cfg) {
    if (!g_logger) return;
    g_logger->set_level((spdlog::level::level_enum)to_spd(cfg.level));
    g_logger->set_pattern(cfg.pattern);
}

Status LogManager::init(const Config& cfg) {
    std::lock_guard<std::mutex> lock(g_mtx);
    return init_locked(cfg, &LogManager::apply_config);
}

bool LogManager::isInitialized() {
    std::lock_guard<std::mutex> lock(g_mtx);
    return (bool)g_logger;
}

Status LogManager::reconfigure(const Config& cfg) {
    std::lock_guard<std::mutex> lock(g_mtx);
    if (!g_logger) return Status::not_initialized;
    try { apply_config(cfg); return Status::ok; } catch (const spdlog::spdlog_ex&) { return Status::error; }
}

Status LogManager::shutdown() {
    std::lock_guard<std::mutex> lock(g_mtx);
    if (!g_logger) return Status::not_initialized;
    spdlog::drop(g_logger->name());
    g_logger.reset();
    return Status::ok;
}

void LogManager::log_string(Level lvl, std::string_view message) {
    std::shared_ptr<spdlog::logger> local;
    {
        std::lock_guard<std::mutex> lock(g_mtx);
        if (!g_logger) {
            (void)init_locked(Config{}, &LogManager::apply_config);
        }
        local = g_logger;
    }
    if (!local) return;
    switch (lvl) {
        case Level::trace: local->trace("{}", message); break;
        case Level::debug: local->debug("{}", message); break;
        case Level::info:  local->info("{}", message); break;
        case Level::warn:  local->warn("{}", message); break;
        case Level::err:   local->error("{}", message); break;
        case Level::critical: local->critical("{}", message); break;
        case Level::off: default: break;
    }
}

std::optional<Level> level_from_string(std::string_view text) {
    std::string s(text);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "trace") return Level::trace;
    if (s == "debug") return Level::debug;
    if (s == "info") return Level::info;
    if (s == "warn" || s == "warning") return Level::warn;
    if (s == "error" || s == "err") return Level::err;
    if (s == "critical") return Level::critical;
    if (s == "off") return Level::off;
    return std::nullopt;
}

} // namespace pm2d::logging
