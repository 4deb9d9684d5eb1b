/**
 * @file    appearance_dialog.hpp
 * @brief   Appearance settings dialog
 * @license MIT
 */

#pragma once

#include "gui/app/app_controller.hpp"

namespace bba::gui {

/**
 * Edits colors, sizes and theme. Every change is applied and saved
 * immediately; there is no separate OK step.
 */
class AppearanceDialog {
public:
    explicit AppearanceDialog(AppController& controller);

    // Non-copyable
    AppearanceDialog(const AppearanceDialog&) = delete;
    AppearanceDialog& operator=(const AppearanceDialog&) = delete;

    /**
     * Render when AppState::dialogs.show_appearance is set
     */
    void render();

private:
    AppController& m_controller;
};

}  // namespace bba::gui
