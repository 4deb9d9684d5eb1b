/**
 * @file    main_window.hpp
 * @brief   Main Window UI Component
 * @license MIT
 */

#pragma once

#include "gui/app/app_controller.hpp"
#include "gui/widgets/annotation_view.hpp"
#include "gui/widgets/appearance_dialog.hpp"
#include "gui/widgets/label_panel.hpp"
#include "gui/widgets/log_viewer.hpp"

#include <array>
#include <memory>

namespace bba::gui {

class MainWindow {
public:
    /**
     * Construct main window with controller reference
     * @param controller  Application controller (must outlive window)
     */
    explicit MainWindow(AppController& controller);

    ~MainWindow();

    // Non-copyable
    MainWindow(const MainWindow&) = delete;
    MainWindow& operator=(const MainWindow&) = delete;

    /**
     * Render the main window
     * Call this every frame within ImGui context
     */
    void render();

    /**
     * Handle SDL event
     * @param event  SDL event
     * @return       true if event was consumed
     */
    bool handle_event(const union SDL_Event& event);

    /**
     * Ask to close; goes through the unsaved-changes prompt
     */
    void request_quit();
    [[nodiscard]] bool should_quit() const noexcept { return m_quit; }

private:
    AppController& m_controller;
    std::unique_ptr<AnnotationView> m_annotation_view;
    std::unique_ptr<LabelPanel> m_label_panel;
    std::unique_ptr<AppearanceDialog> m_appearance_dialog;
    std::unique_ptr<LogViewer> m_log_viewer;

    bool m_quit{false};
    std::array<char, 256> m_rename_buffer{};

    // UI rendering
    void render_menu_bar();
    void render_toolbar();
    void render_status_bar();
    void render_about_dialog();
    void render_unsaved_dialog();
    void render_edit_label_dialog();
    void render_delete_dialog();

    // Actions
    void action_open_image();
    void action_open_directory();
    void action_change_output_dir();
    void action_save();
    void action_previous();
    void action_next();
};

}  // namespace bba::gui
