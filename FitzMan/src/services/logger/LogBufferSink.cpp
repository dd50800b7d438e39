#include "LogBufferSink.h"

#include <algorithm>

namespace fitz::logging {

namespace {
std::size_t slot(Level lvl) {
    switch (lvl) {
        case Level::trace: return 0;
        case Level::debug: return 1;
        case Level::info: return 2;
        case Level::warn: return 3;
        case Level::err: return 4;
        case Level::critical: return 5;
        case Level::off: default: return 2;
    }
}
}

Level from_spd(spdlog::level::level_enum lvl) {
    switch (lvl) {
        case spdlog::level::trace: return Level::trace;
        case spdlog::level::debug: return Level::debug;
        case spdlog::level::warn: return Level::warn;
        case spdlog::level::err: return Level::err;
        case spdlog::level::critical: return Level::critical;
        case spdlog::level::info:
        default: return Level::info;
    }
}

LogBuffer& LogBuffer::instance() {
    static LogBuffer buf;
    return buf;
}

void LogBuffer::push(LogLine line) {
    std::lock_guard<std::mutex> lock(mtx_);
    ++counts_[slot(line.level)];
    if (capacity_ == 0) return;
    while (lines_.size() >= capacity_) lines_.pop_front();
    lines_.push_back(std::move(line));
}

void LogBuffer::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    lines_.clear();
    counts_.fill(0);
}

void LogBuffer::setCapacity(std::size_t cap) {
    std::lock_guard<std::mutex> lock(mtx_);
    capacity_ = cap;
    while (lines_.size() > capacity_) lines_.pop_front();
}

std::size_t LogBuffer::capacity() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return capacity_;
}

std::size_t LogBuffer::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return lines_.size();
}

std::vector<LogLine> LogBuffer::tail(std::size_t maxLines) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::size_t n = std::min(maxLines, lines_.size());
    return std::vector<LogLine>(lines_.end() - static_cast<std::ptrdiff_t>(n), lines_.end());
}

LevelCounts LogBuffer::counts() const {
    std::lock_guard<std::mutex> lock(mtx_);
    LevelCounts c;
    c.trace = counts_[0];
    c.debug = counts_[1];
    c.info = counts_[2];
    c.warn = counts_[3];
    c.err = counts_[4];
    c.critical = counts_[5];
    return c;
}

std::shared_ptr<spdlog::sinks::sink> create_buffer_sink() {
    return std::make_shared<buffer_sink_mt>();
}

} // namespace fitz::logging
