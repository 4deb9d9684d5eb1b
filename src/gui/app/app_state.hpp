/**
 * @file    app_state.hpp
 * @brief   Application State for GUI
 * @license MIT
 *
 * @details
 * UI-only state shared by the widgets. Annotation data lives in the core
 * objects owned by AppController; this struct holds what the view layer
 * needs between frames (modes, dialogs, status text, texture).
 */

#pragma once

#include "core/settings.hpp"
#include "gui/backend/render_backend.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace bba::gui {

// =============================================================================
// Enumerations
// =============================================================================

enum class EditMode {
    Draw,
    Edit
};

[[nodiscard]] constexpr std::string_view to_string(EditMode mode) noexcept {
    switch (mode) {
        case EditMode::Draw: return "Draw";
        case EditMode::Edit: return "Edit";
        default:             return "Unknown";
    }
}

// =============================================================================
// Dialog State
// =============================================================================

/**
 * Target of the Edit Label / Delete dialogs: one annotation (by index) or
 * every annotation sharing a label (group mode)
 */
struct LabelTarget {
    std::string label;
    std::optional<size_t> index;    // nullopt: the whole label group
    size_t count = 1;
};

struct DialogState {
    bool show_about{false};
    bool show_appearance{false};
    bool show_logs{false};

    // Unsaved-changes prompt; the action runs when the user confirms
    bool show_unsaved{false};
    std::function<void()> pending_action;

    // Label dialogs
    bool show_edit_label{false};
    bool show_delete{false};
    LabelTarget target;

    void clear_pending() {
        show_unsaved = false;
        pending_action = nullptr;
    }
};

// =============================================================================
// Main Application State
// =============================================================================

struct AppState {
    // Persisted settings (appearance, directories, language)
    Settings settings;

    // Interaction
    EditMode mode{EditMode::Draw};
    bool group_similar{false};

    // Status bar
    std::string status_message{"Ready"};
    bool status_is_error{false};

    // Canvas texture
    TextureHandle canvas_texture;
    bool texture_needs_update{false};

    DialogState dialogs;

    // Display scaling
    float dpi_scale{1.0f};

    [[nodiscard]] bool edit_mode() const noexcept { return mode == EditMode::Edit; }

    [[nodiscard]] float scaled(float pixels) const noexcept {
        return pixels * dpi_scale;
    }
};

}  // namespace bba::gui
