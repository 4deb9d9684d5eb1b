/**
 * @file    app_controller.hpp
 * @brief   Application Controller
 * @license MIT
 *
 * @details
 * Coordinates between the ImGui view layer and the core layer. Owns the
 * image source, annotation store, label registry, controllers and the
 * annotation canvas, and turns their change notifications into UI state
 * (status text, texture uploads, title).
 */

#pragma once

#include "gui/app/app_state.hpp"
#include "gui/backend/render_backend.hpp"
#include "core/annotation_canvas.hpp"
#include "core/annotation_store.hpp"
#include "core/controllers.hpp"
#include "core/image_source.hpp"
#include "core/label_registry.hpp"
#include "i18n/i18n.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bba::gui {

class AppController {
public:
    /**
     * @param backend        Render backend (must outlive the controller)
     * @param settings_path  JSON settings file, loaded now and rewritten on change
     */
    AppController(IRenderBackend& backend, std::filesystem::path settings_path);

    ~AppController();

    // Non-copyable, non-movable (core objects hold references into it)
    AppController(const AppController&) = delete;
    AppController& operator=(const AppController&) = delete;
    AppController(AppController&&) = delete;
    AppController& operator=(AppController&&) = delete;

    // ==========================================================================
    // State Access
    // ==========================================================================

    [[nodiscard]] const AppState& state() const noexcept { return m_state; }
    [[nodiscard]] AppState& state() noexcept { return m_state; }

    [[nodiscard]] const ImageSource& images() const noexcept { return m_images; }
    [[nodiscard]] const AnnotationStore& store() const noexcept { return m_store; }
    [[nodiscard]] const LabelRegistry& labels() const noexcept { return m_labels; }
    [[nodiscard]] AnnotationCanvas& canvas() noexcept { return *m_canvas; }

    [[nodiscard]] const std::vector<std::string>& unique_labels() const noexcept {
        return m_unique_labels;
    }
    [[nodiscard]] bool is_annotated(const std::filesystem::path& image) const;
    [[nodiscard]] const std::string& selected_label() const noexcept { return m_selected_label; }

    [[nodiscard]] std::string window_title() const;

    // ==========================================================================
    // Unsaved-changes guard
    // ==========================================================================

    /**
     * Run the action now, or after the user confirms discarding unsaved
     * annotation changes
     */
    void request(std::function<void()> action);
    void confirm_pending();
    void cancel_pending();

    // ==========================================================================
    // Files & Navigation (call through request() from the UI)
    // ==========================================================================

    void open_directory(const std::filesystem::path& dir);
    void open_image(const std::filesystem::path& path);
    void set_output_dir(const std::filesystem::path& dir);
    void select_image(size_t index);
    void next_image();
    void previous_image();

    bool save_annotations();

    // ==========================================================================
    // Annotation editing
    // ==========================================================================

    void set_mode(EditMode mode);
    void cancel_action();
    void set_current_label(const std::string& label);
    void set_group_similar(bool group);

    void select_annotation(std::optional<size_t> index);
    void select_label_group(const std::string& label);

    /**
     * Rename / delete the target held in the dialog state
     */
    void rename_target(const std::string& new_label);
    void delete_target();

    // ==========================================================================
    // View
    // ==========================================================================

    void zoom_in();
    void zoom_out();
    void zoom_fit();
    void resize_canvas(int width, int height);

    // ==========================================================================
    // Settings
    // ==========================================================================

    void set_appearance(const Appearance& appearance);
    void set_language(i18n::Language lang);

    // ==========================================================================
    // Texture Management
    // ==========================================================================

    void update_texture_if_needed();
    [[nodiscard]] void* get_canvas_texture_id() const;

    // ==========================================================================
    // Status
    // ==========================================================================

    void set_status(std::string message);
    void set_error(std::string message);

private:
    IRenderBackend& m_backend;
    std::filesystem::path m_settings_path;
    AppState m_state;

    ImageSource m_images;
    AnnotationStore m_store;
    LabelRegistry m_labels;
    DrawingController m_drawing;
    EditingController m_editing;
    std::unique_ptr<AnnotationCanvas> m_canvas;

    std::vector<std::string> m_dir_labels;      // From the output directory
    std::vector<std::string> m_unique_labels;   // m_dir_labels + current image
    std::set<std::filesystem::path> m_annotated;
    std::string m_selected_label;       // Group highlight / drawing preview label

    ImageSource::ObserverId m_image_observer{0};
    AnnotationStore::ObserverId m_store_observer{0};
    Canvas::ObserverId m_canvas_observer{0};

    // Reactions to core notifications
    void on_image_changed();
    void on_store_event(StoreEvent event);

    void update_scene();
    void scan_output_dir();
    void merge_session_labels();
    void persist_settings();

    /**
     * Run an operation, reporting any exception in the status bar
     */
    bool guarded(const char* what, const std::function<void()>& operation);
};

}  // namespace bba::gui
