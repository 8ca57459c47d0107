#pragma once
#include <string>
#include <string_view>
#include <memory>
#include <optional>
#include <spdlog/fmt/fmt.h>

namespace spdlog { class logger; }

namespace pm2d::logging {

enum class Level { trace, debug, info, warn, err, critical, off };

struct Config {
    std::string name = "PM2D";
    Level level = Level::info;
    std::string pattern = "[%H:%M:%S] [%l] %v";
};

enum class Status { ok, already_initialized, not_initialized, error };

class LogManager {
public:
    static Status init(const Config& cfg = {});
    static bool isInitialized();
    static Status reconfigure(const Config& cfg);
    static Status shutdown();

    template <typename... Args>
    static void trace(std::string_view fmt, Args&&... args) { log(Level::trace, fmt, std::forward<Args>(args)...); }
    template <typename... Args>
    static void debug(std::string_view fmt, Args&&... args) { log(Level::debug, fmt, std::forward<Args>(args)...); }
    template <typename... Args>
    static void info(std::string_view fmt, Args&&... args)  { log(Level::info,  fmt, std::forward<Args>(args)...); }
    template <typename... Args>
    static void warn(std::string_view fmt, Args&&... args)  { log(Level::warn,  fmt, std::forward<Args>(args)...); }
    template <typename... Args>
    static void error(std::string_view fmt, Args&&... args) { log(Level::err,   fmt, std::forward<Args>(args)...); }
    template <typename... Args>
    static void critical(std::string_view fmt, Args&&... args) { log(Level::critical, fmt, std::forward<Args>(args)...); }

private:
    template <typename... Args>
    static void log(Level lvl, std::string_view fmt, Args&&... args) {
        try {
            auto s = fmt::vformat(fmt, fmt::make_format_args(args...));
            log_string(lvl, s);
        } catch (const fmt::format_error& e) {
            log_string(Level::err, std::string("bad log format '") + std::string(fmt) + "': " + e.what());
        }
    }
    static void apply_config(const Config& cfg);
    static int to_spd(Level lvl);
    static std::shared_ptr<spdlog::logger>& logger();
    static void log_string(Level lvl, std::string_view message);
};

// Accepts trace|debug|info|warn|error|critical|off (case-insensitive).
std::optional<Level> level_from_string(std::string_view text);

}
