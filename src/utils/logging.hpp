/**
 * @file    logging.hpp
 * @brief   spdlog setup shared by the GUI and CLI front ends
 * @license MIT
 *
 * @details
 * The default logger "bba" writes to:
 *   - colored stdout (level chosen by the caller)
 *   - a daily file under ~/.bbox_ann_tool/logs (debug and up), optional
 *   - an in-memory ring buffer read by the GUI log viewer, optional
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace bba::logging {

struct Options {
    spdlog::level::level_enum console_level = spdlog::level::info;
    bool file_sink = true;
    std::filesystem::path log_dir;      // Empty: ~/.bbox_ann_tool/logs
    size_t ring_buffer_size = 0;        // 0: no ring buffer
};

/**
 * Install the "bba" logger as spdlog's default. Safe to call again; the
 * previous logger is replaced. A file sink that cannot be opened is
 * skipped with a warning.
 */
void init(const Options& options);

/**
 * Change the console sink level only
 */
void set_console_level(spdlog::level::level_enum level);

struct Entry {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string text;                   // Formatted line
};

/**
 * Snapshot of the ring buffer, oldest first. Empty without one.
 */
[[nodiscard]] std::vector<Entry> recent_entries();

/**
 * Drop everything held in the ring buffer
 */
void clear_recent();

[[nodiscard]] std::filesystem::path default_log_dir();

}  // namespace bba::logging
