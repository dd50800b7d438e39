#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <memory>
#include <optional>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace spdlog { class logger; }

namespace fitz::logging {

// Severity, ordered; `off` only makes sense as a threshold.
enum class Level { trace, debug, info, warn, err, critical, off };

// Logger settings. `level` is the minimum severity that reaches any sink;
// `pattern` is an spdlog pattern applied to the console sink. The in-memory
// buffer keeps the bare message.
struct Config {
    std::string name = "FitzMan";
    Level level = Level::info;
    std::string pattern = "[%H:%M:%S] [%l] %v";
};

// Result of the lifecycle calls. Logging itself never fails visibly.
enum class Status {
    ok,
    already_initialized, // init() on a live logger; settings unchanged
    not_initialized,     // reconfigure()/shutdown() before init()
    error                // spdlog refused the sink or pattern
};

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
        std::string s;
        try {
            s = fmt::vformat(fmt, fmt::make_format_args(args...));
        } catch (const fmt::format_error&) {
            log_string(Level::err, std::string("bad log format: ") + std::string(fmt));
            return;
        }
        log_string(lvl, s);
    }
    static void apply_config(const Config& cfg);
    static int to_spd(Level lvl);
    static std::shared_ptr<spdlog::logger>& logger();
    static void log_string(Level lvl, std::string_view message);
};

// One buffered record, as the F1 overlay draws it.
struct LogLine {
    Level level = Level::info;
    std::string logger;
    std::chrono::system_clock::time_point time{};
    std::string text;
};

// Lines seen per level since the last clear, including ones already dropped.
struct LevelCounts {
    size_t trace = 0;
    size_t debug = 0;
    size_t info = 0;
    size_t warn = 0;
    size_t err = 0;
    size_t critical = 0;
};

// Newest max_lines buffered lines, oldest first.
std::vector<LogLine> read_log_lines_snapshot(size_t max_lines = 1000);
LevelCounts read_log_level_counts();
const char* level_to_label(Level l);
std::optional<Level> level_from_string(std::string_view name);
void clear_log_buffer();
// 0 disables buffering; counts still accumulate.
void set_log_buffer_capacity(size_t cap);
size_t log_buffer_capacity();

}
