/**
 * @file    log_viewer.hpp
 * @brief   Log viewer window over the in-memory log ring buffer
 * @license MIT
 */

#pragma once

#include "gui/app/app_controller.hpp"

#include <array>

namespace bba::gui {

class LogViewer {
public:
    explicit LogViewer(AppController& controller);

    // Non-copyable
    LogViewer(const LogViewer&) = delete;
    LogViewer& operator=(const LogViewer&) = delete;

    /**
     * Render when AppState::dialogs.show_logs is set
     */
    void render();

private:
    AppController& m_controller;

    int m_min_level{0};             // spdlog level index (trace = 0)
    bool m_auto_scroll{true};
    std::array<char, 128> m_filter{};
};

}  // namespace bba::gui
