/**
 * @file    annotation_canvas.cpp
 * @brief   Annotation drawing/editing interaction on top of the Canvas
 * @license MIT
 */

#include "core/annotation_canvas.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace bba {

AnnotationCanvas::AnnotationCanvas(const Appearance& appearance,
                                   DrawingController& drawing,
                                   EditingController& editing,
                                   AnnotationStore& store,
                                   LabelRegistry& labels,
                                   cv::Size size)
    : Canvas(size)
    , m_appearance(appearance)
    , m_drawing(drawing)
    , m_editing(editing)
    , m_store(store)
    , m_labels(labels)
    , m_renderer(appearance)
{
    m_store_observer = m_store.subscribe([this](StoreEvent event) {
        if (event == StoreEvent::Reset || event == StoreEvent::Loaded) {
            cancel_current_action();
        }
        if (event != StoreEvent::DirtyChanged && event != StoreEvent::Saved && has_image()) {
            render();
        }
    });
}

AnnotationCanvas::~AnnotationCanvas() {
    m_store.unsubscribe(m_store_observer);
}

void AnnotationCanvas::set_scene_state(SceneState state) {
    m_scene = std::move(state);
    if (has_image()) {
        render();
    }
}

void AnnotationCanvas::clear_previews() noexcept {
    m_drag_preview_index.reset();
    m_drag_preview_box.reset();
    m_drawing_preview.reset();
}

void AnnotationCanvas::cancel_current_action() {
    m_drawing.cancel();
    m_editing.cancel();
    clear_previews();
}

cv::Point AnnotationCanvas::to_image_point(cv::Point2f pos) {
    const cv::Point2f p = viewport().viewport_to_image_coords(pos);
    return {static_cast<int>(p.x), static_cast<int>(p.y)};
}

// =============================================================================
// Input
// =============================================================================

bool AnnotationCanvas::on_pointer_press(const PointerEvent& event) {
    if (event.mods.ctrl) {
        return Canvas::on_pointer_press(event);
    }
    if (event.button != MouseButton::Left || !has_image()) {
        return false;
    }

    const cv::Point point = to_image_point(event.pos);

    if (m_scene.edit_mode) {
        if (!m_store.is_loaded()) return false;

        m_editing.set_tolerance(m_appearance.points_size);
        const auto selection = m_editing.find_control_point(point, m_store.annotations());
        if (!selection) return false;

        m_editing.start(point, selection);
        m_drag_preview_index = selection->index;
        m_drag_preview_box.reset();
        m_store.select(selection->index);
        render();
        return true;
    }

    if (m_labels.current_label().empty()) {
        spdlog::debug("[AnnotationCanvas] No current label, drawing disabled");
        return false;
    }

    m_drawing.start(point);
    m_drawing_preview = m_drawing.current_box();
    render();
    return true;
}

bool AnnotationCanvas::on_pointer_move(const PointerEvent& event) {
    if (is_panning()) {
        return Canvas::on_pointer_move(event);
    }
    if (!has_image()) {
        return false;
    }

    if (m_drawing.is_drawing()) {
        if (m_drawing.update(to_image_point(event.pos))) {
            m_drawing_preview = m_drawing.current_box();
            render();
            return true;
        }
        return false;
    }

    if (m_editing.is_dragging() && m_store.is_loaded()) {
        const auto edit = m_editing.update(to_image_point(event.pos), m_store.annotations());
        if (!edit) return false;

        m_drag_preview_index = edit->index;
        m_drag_preview_box = edit->box;
        // Store notification re-renders
        m_store.set_box(edit->index, edit->box);
        return true;
    }
    return false;
}

bool AnnotationCanvas::on_pointer_release(const PointerEvent& event) {
    if (is_panning()) {
        return Canvas::on_pointer_release(event);
    }
    if (event.button != MouseButton::Left) {
        return false;
    }

    bool handled = false;
    if (m_drawing.is_drawing()) {
        std::optional<Annotation> created;
        if (has_image()) {
            created = m_drawing.finish(to_image_point(event.pos), m_labels.current_label());
        } else {
            m_drawing.cancel();
        }
        m_drawing_preview.reset();
        if (created && m_store.is_loaded()) {
            m_store.add(std::move(*created));
        }
        handled = true;
    } else if (m_editing.is_dragging()) {
        m_editing.finish();
        m_drag_preview_index.reset();
        m_drag_preview_box.reset();
        handled = true;
    }

    if (handled && has_image()) {
        render();
    }
    return handled;
}

// =============================================================================
// Rendering
// =============================================================================

void AnnotationCanvas::decorate(cv::Mat& frame) {
    OverlayScene scene;
    scene.annotations = m_store.is_loaded() ? &m_store.annotations() : nullptr;
    scene.selected_index = m_store.selected_index();
    scene.selected_label = m_scene.selected_label;
    scene.group_mode = m_scene.group_mode;
    scene.edit_mode = m_scene.edit_mode;
    scene.drag_preview_index = m_drag_preview_index;
    scene.drag_preview_box = m_drag_preview_box;
    scene.drawing_preview = m_drawing_preview;

    m_renderer.render(frame, viewport(), scene);
}

}  // namespace bba
