#include "LogManager.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include "LogBufferSink.h"

namespace fitz::logging {
namespace {
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_mtx;

    Status init_locked(const Config& cfg);
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

namespace {
Status init_locked(const Config& cfg) {
    if (g_logger) return Status::already_initialized;
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto buffer_sink = create_buffer_sink();
        std::vector<spdlog::sink_ptr> sinks{ console_sink, buffer_sink };
        g_logger = std::make_shared<spdlog::logger>(cfg.name, sinks.begin(), sinks.end());
        spdlog::register_logger(g_logger);
        return Status::ok;
    } catch (const spdlog::spdlog_ex&) {
        g_logger.reset();
        return Status::error;
    }
}
}

Status LogManager::init(const Config& cfg) {
    std::lock_guard<std::mutex> lock(g_mtx);
    Status st = init_locked(cfg);
    if (st == Status::ok) apply_config(cfg);
    return st;
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
            Config cfg;
            if (init_locked(cfg) == Status::ok) apply_config(cfg);
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

std::vector<LogLine> read_log_lines_snapshot(size_t max_lines) {
    return LogBuffer::instance().tail(max_lines);
}

LevelCounts read_log_level_counts() { return LogBuffer::instance().counts(); }

const char* level_to_label(Level l) {
    switch (l) {
        case Level::trace: return "TRACE";
        case Level::debug: return "DEBUG";
        case Level::info: return "INFO";
        case Level::warn: return "WARN";
        case Level::err: return "ERROR";
        case Level::critical: return "CRIT";
        case Level::off: default: return "OFF";
    }
}

std::optional<Level> level_from_string(std::string_view name) {
    if (name == "trace") return Level::trace;
    if (name == "debug") return Level::debug;
    if (name == "info") return Level::info;
    if (name == "warn" || name == "warning") return Level::warn;
    if (name == "error" || name == "err") return Level::err;
    if (name == "critical") return Level::critical;
    if (name == "off") return Level::off;
    return std::nullopt;
}

void clear_log_buffer() { LogBuffer::instance().clear(); }
void set_log_buffer_capacity(size_t cap) { LogBuffer::instance().setCapacity(cap); }
size_t log_buffer_capacity() { return LogBuffer::instance().capacity(); }

} // namespace fitz::logging
