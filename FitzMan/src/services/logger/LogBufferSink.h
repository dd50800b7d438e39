#pragma once
#include "LogManager.h"

#include <array>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>
#include <spdlog/sinks/base_sink.h>

namespace fitz::logging {

inline constexpr std::size_t kDefaultLogBufferLines = 2000;

// Ring of recent log lines kept for the debug overlay. Per-level counts keep
// growing after old lines are dropped, until clear().
class LogBuffer {
public:
    void push(LogLine line);
    void clear();
    void setCapacity(std::size_t cap);
    std::size_t capacity() const;
    std::size_t size() const;
    std::vector<LogLine> tail(std::size_t maxLines) const;
    LevelCounts counts() const;

    static LogBuffer& instance();

private:
    mutable std::mutex mtx_;
    std::deque<LogLine> lines_{};
    std::size_t capacity_ = kDefaultLogBufferLines;
    std::array<std::size_t, 6> counts_{};
};

Level from_spd(spdlog::level::level_enum lvl);

// Stores the unformatted payload; the overlay adds its own prefix.
template <typename Mutex>
class buffer_sink : public spdlog::sinks::base_sink<Mutex> {
protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        LogLine line;
        line.level = from_spd(msg.level);
        line.logger.assign(msg.logger_name.data(), msg.logger_name.size());
        line.time = msg.time;
        line.text.assign(msg.payload.data(), msg.payload.size());
        LogBuffer::instance().push(std::move(line));
    }
    void flush_() override {}
};

using buffer_sink_mt = buffer_sink<std::mutex>;

std::shared_ptr<spdlog::sinks::sink> create_buffer_sink();

} // namespace fitz::logging
