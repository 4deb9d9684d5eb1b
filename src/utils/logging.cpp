/**
 * @file    logging.cpp
 * @brief   spdlog sinks: console, daily file, ring buffer
 * @license MIT
 */

#include "utils/logging.hpp"
#include "core/settings.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <memory>

namespace bba::logging {

namespace {

constexpr const char* kLoggerName = "bba";
constexpr const char* kLogFileName = "bbox_tool.log";
constexpr const char* kRingPattern = "[%H:%M:%S.%e] [%l] %v";

struct LoggingState {
    spdlog::sink_ptr console;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> ring;
    size_t ring_size = 0;
};

LoggingState& state() {
    static LoggingState s;
    return s;
}

}  // anonymous namespace

std::filesystem::path default_log_dir() {
    return app_data_directory() / "logs";
}

void init(const Options& options) {
    auto& s = state();

    std::vector<spdlog::sink_ptr> sinks;

    s.console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    s.console->set_level(options.console_level);
    sinks.push_back(s.console);

    std::string file_error;
    if (options.file_sink) {
        const auto dir = options.log_dir.empty() ? default_log_dir() : options.log_dir;
        try {
            std::filesystem::create_directories(dir);
            auto file = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                to_utf8(dir / kLogFileName), 0, 0);
            file->set_level(spdlog::level::debug);
            sinks.push_back(file);
        } catch (const std::exception& e) {
            file_error = e.what();
        }
    }

    s.ring.reset();
    s.ring_size = options.ring_buffer_size;
    if (s.ring_size > 0) {
        s.ring = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(s.ring_size);
        s.ring->set_pattern(kRingPattern);
        s.ring->set_level(spdlog::level::debug);
        sinks.push_back(s.ring);
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(kLoggerName);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("[Logging] File logging disabled: {}", file_error);
    }
}

void set_console_level(spdlog::level::level_enum level) {
    if (auto& console = state().console) {
        console->set_level(level);
    }
}

std::vector<Entry> recent_entries() {
    auto& s = state();
    if (!s.ring) return {};

    const auto raw = s.ring->last_raw();
    const auto formatted = s.ring->last_formatted();
    const size_t n = std::min(raw.size(), formatted.size());

    std::vector<Entry> entries;
    entries.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        std::string text = formatted[i];
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
            text.pop_back();
        }
        entries.push_back({raw[i].level, std::move(text)});
    }
    return entries;
}

void clear_recent() {
    auto& s = state();
    if (!s.ring) return;

    // ringbuffer_sink has no clear(); swap in a fresh one
    auto fresh = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(s.ring_size);
    fresh->set_pattern(kRingPattern);
    fresh->set_level(spdlog::level::debug);

    if (auto logger = spdlog::get(kLoggerName)) {
        auto& sinks = logger->sinks();
        std::replace(sinks.begin(), sinks.end(),
                     spdlog::sink_ptr(s.ring), spdlog::sink_ptr(fresh));
    }
    s.ring = std::move(fresh);
}

}  // namespace bba::logging
