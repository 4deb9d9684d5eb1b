/**
 * @file    app_controller.cpp
 * @brief   Application Controller Implementation
 * @license MIT
 */

#include "gui/app/app_controller.hpp"
#include "gui/resources/style.hpp"
#include "utils/path_formatter.hpp"
#include "i18n/keys.hpp"

#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <algorithm>
#include <span>
#include <utility>

namespace bba::gui {

namespace fs = std::filesystem;

namespace {

constexpr float kZoomStep = 1.25f;

}  // anonymous namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

AppController::AppController(IRenderBackend& backend, fs::path settings_path)
    : m_backend(backend)
    , m_settings_path(std::move(settings_path))
{
    m_state.settings = load_settings(m_settings_path);

    if (auto lang = i18n::language_from_code(m_state.settings.language)) {
        if (!i18n::set_language(*lang)) {
            m_state.settings.language = i18n::language_code(i18n::Language::English);
        }
    } else {
        spdlog::warn("[App] Unknown language '{}', using English", m_state.settings.language);
    }
    m_state.status_message = TR(i18n::keys::STATUS_READY);

    m_labels.set_output_dir(m_state.settings.output_dir);
    m_editing.set_tolerance(m_state.settings.appearance.points_size);

    m_canvas = std::make_unique<AnnotationCanvas>(
        m_state.settings.appearance, m_drawing, m_editing, m_store, m_labels);

    m_image_observer = m_images.subscribe([this]() { on_image_changed(); });
    m_store_observer = m_store.subscribe([this](StoreEvent event) { on_store_event(event); });
    m_canvas_observer = m_canvas->subscribe_content_changed([this]() {
        m_state.texture_needs_update = true;
    });

    scan_output_dir();
    update_scene();

    spdlog::debug("[App] Controller initialized (output: {})", m_state.settings.output_dir);
}

AppController::~AppController() {
    m_canvas->unsubscribe_content_changed(m_canvas_observer);
    m_store.unsubscribe(m_store_observer);
    m_images.unsubscribe(m_image_observer);

    if (m_state.canvas_texture.valid()) {
        m_backend.destroy_texture(m_state.canvas_texture);
    }
}

// =============================================================================
// Queries
// =============================================================================

bool AppController::is_annotated(const fs::path& image) const {
    return m_annotated.count(image) > 0;
}

std::string AppController::window_title() const {
    std::string title = "bbox-annotator";
    if (!m_images.current_path().empty()) {
        title += " - " + filename_utf8(m_images.current_path());
    }
    if (m_store.has_unsaved_changes()) {
        title += " *";
    }
    return title;
}

// =============================================================================
// Unsaved-changes guard
// =============================================================================

void AppController::request(std::function<void()> action) {
    if (m_store.has_unsaved_changes()) {
        m_state.dialogs.pending_action = std::move(action);
        m_state.dialogs.show_unsaved = true;
        return;
    }
    action();
}

void AppController::confirm_pending() {
    auto action = std::move(m_state.dialogs.pending_action);
    m_state.dialogs.clear_pending();
    if (action) {
        spdlog::info("[App] Discarding unsaved changes");
        action();
    }
}

void AppController::cancel_pending() {
    m_state.dialogs.clear_pending();
}

// =============================================================================
// Files & Navigation
// =============================================================================

void AppController::open_directory(const fs::path& dir) {
    guarded("open directory", [&]() {
        m_images.open_directory(dir);
        m_state.settings.last_dir = dir;
        persist_settings();
        scan_output_dir();

        if (m_images.paths().empty()) {
            set_status(TRF(i18n::keys::CLI_NO_IMAGES, dir));
        } else {
            m_images.first();
            set_status(TRF(i18n::keys::STATUS_OPENED_DIR, m_images.paths().size(), dir));
        }
    });
}

void AppController::open_image(const fs::path& path) {
    guarded("open image", [&]() {
        m_images.open_file(path);
        m_state.settings.last_image_dir = path.parent_path();
        persist_settings();
        scan_output_dir();
    });
}

void AppController::set_output_dir(const fs::path& dir) {
    guarded("change output directory", [&]() {
        m_state.settings.output_dir = dir;
        m_labels.set_output_dir(dir);
        persist_settings();
        scan_output_dir();

        // Annotations for the current image now live elsewhere
        if (!m_images.current_path().empty()) {
            m_store.open(AnnotationStore::annotation_path_for(dir, m_images.current_path()));
        }
        set_status(TRF(i18n::keys::STATUS_OUTPUT_DIR, dir));
    });
}

void AppController::select_image(size_t index) {
    guarded("select image", [&]() { m_images.set_index(index); });
}

void AppController::next_image() {
    guarded("next image", [&]() { m_images.next(); });
}

void AppController::previous_image() {
    guarded("previous image", [&]() { m_images.previous(); });
}

bool AppController::save_annotations() {
    if (!m_store.is_loaded()) {
        return false;
    }

    bool saved = false;
    guarded("save annotations", [&]() {
        saved = m_store.save();
        if (saved) {
            set_status(TRF(i18n::keys::STATUS_SAVED, filename_utf8(m_store.path())));
        } else {
            set_status(TR(i18n::keys::STATUS_NO_CHANGES));
        }
    });
    return saved;
}

// =============================================================================
// Annotation editing
// =============================================================================

void AppController::set_mode(EditMode mode) {
    if (m_state.mode == mode) return;

    m_canvas->cancel_current_action();
    m_state.mode = mode;
    update_scene();
    set_status(TR(mode == EditMode::Edit ? i18n::keys::STATUS_MODE_EDIT
                                         : i18n::keys::STATUS_MODE_DRAW));
    spdlog::debug("[App] Mode: {}", to_string(mode));
}

void AppController::cancel_action() {
    m_canvas->cancel_current_action();
    m_selected_label.clear();
    if (m_store.is_loaded()) {
        m_store.select(std::nullopt);
    }
    update_scene();
}

void AppController::set_current_label(const std::string& label) {
    m_labels.set_current_label(label);
    update_scene();
}

void AppController::set_group_similar(bool group) {
    m_state.group_similar = group;
    update_scene();
}

void AppController::select_annotation(std::optional<size_t> index) {
    guarded("select annotation", [&]() { m_store.select(index); });
}

void AppController::select_label_group(const std::string& label) {
    m_selected_label = label;
    if (m_store.is_loaded()) {
        m_store.select(std::nullopt);
    }
    update_scene();
}

void AppController::rename_target(const std::string& new_label) {
    const LabelTarget target = m_state.dialogs.target;
    if (new_label.empty() || new_label == target.label) {
        return;
    }

    guarded("rename", [&]() {
        size_t renamed = 0;
        if (target.index) {
            m_store.select(target.index);
            m_store.rename_selected(new_label);
            renamed = 1;
        } else {
            renamed = m_store.rename_by_label(target.label, new_label);
            if (m_selected_label == target.label) {
                m_selected_label = new_label;
            }
        }
        update_scene();
        set_status(TRF(i18n::keys::STATUS_RENAMED, renamed));
    });
}

void AppController::delete_target() {
    const LabelTarget target = m_state.dialogs.target;

    guarded("delete", [&]() {
        size_t removed = 0;
        if (target.index) {
            m_store.select(target.index);
            m_store.delete_selected();
            removed = 1;
        } else {
            removed = m_store.delete_by_label(target.label);
            if (m_selected_label == target.label) {
                m_selected_label.clear();
            }
        }
        update_scene();
        set_status(TRF(i18n::keys::STATUS_DELETED, removed));
    });
}

// =============================================================================
// View
// =============================================================================

void AppController::zoom_in() {
    if (!m_canvas->has_image()) return;
    guarded("zoom", [&]() { m_canvas->viewport().zoom(kZoomStep); });
}

void AppController::zoom_out() {
    if (!m_canvas->has_image()) return;
    guarded("zoom", [&]() { m_canvas->viewport().zoom(1.0 / kZoomStep); });
}

void AppController::zoom_fit() {
    if (!m_canvas->has_image()) return;
    guarded("fit", [&]() { m_canvas->viewport().fit_to_window(); });
}

void AppController::resize_canvas(int width, int height) {
    if (width <= 0 || height <= 0) return;
    const cv::Size size(width, height);
    if (m_canvas->viewport().size() == size) return;

    guarded("resize", [&]() { m_canvas->on_resize(size); });
}

// =============================================================================
// Settings
// =============================================================================

void AppController::set_appearance(const Appearance& appearance) {
    Appearance clamped = appearance;
    clamped.clamp();
    if (clamped == m_state.settings.appearance) return;

    const bool theme_changed = clamped.theme != m_state.settings.appearance.theme;
    m_state.settings.appearance = clamped;
    m_editing.set_tolerance(clamped.points_size);

    if (theme_changed) {
        apply_style(clamped.theme);
    }
    if (m_canvas->has_image()) {
        guarded("render", [&]() { m_canvas->render(); });
    }
    persist_settings();
}

void AppController::set_language(i18n::Language lang) {
    if (!i18n::set_language(lang)) {
        set_error(fmt::format("language file for {} not found", i18n::language_code(lang)));
        return;
    }
    m_state.settings.language = i18n::language_code(lang);
    persist_settings();
    set_status(TR(i18n::keys::STATUS_READY));
}

// =============================================================================
// Texture Management
// =============================================================================

void AppController::update_texture_if_needed() {
    if (!m_state.texture_needs_update) return;
    m_state.texture_needs_update = false;

    const cv::Mat& rgba = m_canvas->displayed();
    if (rgba.empty()) {
        if (m_state.canvas_texture.valid()) {
            m_backend.destroy_texture(m_state.canvas_texture);
        }
        return;
    }

    std::span<const std::uint8_t> data(rgba.data, rgba.total() * rgba.elemSize());
    TextureHandle& tex = m_state.canvas_texture;

    if (tex.valid() && tex.width == rgba.cols && tex.height == rgba.rows) {
        if (!m_backend.update_texture(tex, data)) {
            spdlog::error("[App] Texture update failed: {}", to_string(m_backend.last_error()));
        }
        return;
    }

    if (tex.valid()) {
        m_backend.destroy_texture(tex);
    }

    TextureDesc desc;
    desc.width = rgba.cols;
    desc.height = rgba.rows;
    desc.format = TextureFormat::RGBA8;

    tex = m_backend.create_texture(desc, data);
    if (!tex.valid()) {
        spdlog::error("[App] Failed to create texture: {}", to_string(m_backend.last_error()));
    }
}

void* AppController::get_canvas_texture_id() const {
    return m_backend.get_imgui_texture_id(m_state.canvas_texture);
}

// =============================================================================
// Status
// =============================================================================

void AppController::set_status(std::string message) {
    m_state.status_message = std::move(message);
    m_state.status_is_error = false;
}

void AppController::set_error(std::string message) {
    m_state.status_message = TRF(i18n::keys::STATUS_ERROR, message);
    m_state.status_is_error = true;
}

// =============================================================================
// Core notifications
// =============================================================================

void AppController::on_image_changed() {
    const fs::path& path = m_images.current_path();
    m_selected_label.clear();

    guarded("load image", [&]() {
        if (path.empty()) {
            m_store.reset();
            m_canvas->set_image(cv::Mat());
            set_status(TR(i18n::keys::STATUS_READY));
            return;
        }

        m_store.open(AnnotationStore::annotation_path_for(m_state.settings.output_dir, path));
        const cv::Mat& image = m_images.current_image();
        m_canvas->set_image(image);
        update_scene();
        set_status(TRF(i18n::keys::STATUS_LOADED, image.cols, image.rows));
    });
}

void AppController::on_store_event(StoreEvent event) {
    switch (event) {
        case StoreEvent::Loaded:
        case StoreEvent::Changed:
            merge_session_labels();
            break;

        case StoreEvent::Saved:
            m_annotated.insert(m_images.current_path());
            scan_output_dir();
            break;

        case StoreEvent::SelectionChanged:
            if (const Annotation* ann = m_store.selected_annotation()) {
                m_selected_label = ann->label;
                update_scene();
            }
            break;

        case StoreEvent::Reset:
        case StoreEvent::DirtyChanged:
            break;
    }
}

void AppController::update_scene() {
    SceneState scene;
    if (m_state.group_similar && !m_selected_label.empty()) {
        scene.selected_label = m_selected_label;
    } else {
        scene.selected_label = m_labels.current_label();
    }
    scene.group_mode = m_state.group_similar;
    scene.edit_mode = m_state.edit_mode();

    guarded("render", [&]() { m_canvas->set_scene_state(std::move(scene)); });
}

void AppController::scan_output_dir() {
    m_dir_labels = m_labels.all_unique_labels();

    m_annotated.clear();
    const fs::path& out = m_state.settings.output_dir;
    for (const auto& image : m_images.paths()) {
        std::error_code ec;
        if (fs::exists(AnnotationStore::annotation_path_for(out, image), ec)) {
            m_annotated.insert(image);
        }
    }
    merge_session_labels();
}

void AppController::merge_session_labels() {
    m_unique_labels = m_dir_labels;
    if (m_store.is_loaded()) {
        for (const auto& ann : m_store.annotations()) {
            if (!ann.label.empty()) {
                m_unique_labels.push_back(ann.label);
            }
        }
    }
    std::sort(m_unique_labels.begin(), m_unique_labels.end());
    m_unique_labels.erase(std::unique(m_unique_labels.begin(), m_unique_labels.end()),
                          m_unique_labels.end());
}

void AppController::persist_settings() {
    try {
        save_settings(m_settings_path, m_state.settings);
    } catch (const std::exception& e) {
        spdlog::error("[App] Failed to save settings: {}", e.what());
        set_error(e.what());
    }
}

bool AppController::guarded(const char* what, const std::function<void()>& operation) {
    try {
        operation();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("[App] Failed to {}: {}", what, e.what());
        set_error(e.what());
        return false;
    }
}

}  // namespace bba::gui
