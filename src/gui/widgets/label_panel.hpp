/**
 * @file    label_panel.hpp
 * @brief   Left side panel: images, current label, annotations, statistics
 * @license MIT
 */

#pragma once

#include "gui/app/app_controller.hpp"

#include <array>

namespace bba::gui {

class LabelPanel {
public:
    explicit LabelPanel(AppController& controller);
    ~LabelPanel() = default;

    // Non-copyable
    LabelPanel(const LabelPanel&) = delete;
    LabelPanel& operator=(const LabelPanel&) = delete;

    void render();

private:
    AppController& m_controller;

    std::array<char, 256> m_label_buffer{};
    size_t m_scrolled_to{static_cast<size_t>(-1)};  // Image index last scrolled into view

    void render_files();
    void render_current_label();
    void render_annotations();
    void render_statistics();

    void sync_label_buffer();
    void open_target_dialog(const LabelEntry& entry, bool delete_dialog);
};

}  // namespace bba::gui
