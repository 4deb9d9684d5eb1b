/**
 * @file    annotation_canvas.hpp
 * @brief   Canvas that draws annotations and routes plain clicks to the
 *          drawing and editing controllers
 * @license MIT
 */

#pragma once

#include "core/annotation_store.hpp"
#include "core/canvas.hpp"
#include "core/controllers.hpp"
#include "core/label_registry.hpp"
#include "core/overlay_renderer.hpp"
#include "core/settings.hpp"

#include <optional>
#include <string>

namespace bba {

/**
 * Presentation flags owned by the host UI
 */
struct SceneState {
    std::string selected_label;
    bool group_mode = false;
    bool edit_mode = false;
};

class AnnotationCanvas : public Canvas {
public:
    AnnotationCanvas(const Appearance& appearance,
                     DrawingController& drawing,
                     EditingController& editing,
                     AnnotationStore& store,
                     LabelRegistry& labels,
                     cv::Size size = cv::Size(500, 500));
    ~AnnotationCanvas() override;

    [[nodiscard]] const SceneState& scene_state() const noexcept { return m_scene; }

    /**
     * Replace the presentation flags and re-render
     */
    void set_scene_state(SceneState state);

    /**
     * Abort any drawing or dragging and drop both previews
     */
    void cancel_current_action();

    bool on_pointer_press(const PointerEvent& event) override;
    bool on_pointer_move(const PointerEvent& event) override;
    bool on_pointer_release(const PointerEvent& event) override;

    [[nodiscard]] const std::optional<Box>& drawing_preview() const noexcept { return m_drawing_preview; }
    [[nodiscard]] std::optional<size_t> drag_preview_index() const noexcept { return m_drag_preview_index; }
    [[nodiscard]] const std::optional<Box>& drag_preview_box() const noexcept { return m_drag_preview_box; }

protected:
    void decorate(cv::Mat& frame) override;

private:
    const Appearance& m_appearance;
    DrawingController& m_drawing;
    EditingController& m_editing;
    AnnotationStore& m_store;
    LabelRegistry& m_labels;
    OverlayRenderer m_renderer;

    SceneState m_scene;
    std::optional<size_t> m_drag_preview_index;
    std::optional<Box> m_drag_preview_box;
    std::optional<Box> m_drawing_preview;

    AnnotationStore::ObserverId m_store_observer{0};

    /**
     * Pointer position as truncated image coordinates
     */
    [[nodiscard]] cv::Point to_image_point(cv::Point2f pos);
    void clear_previews() noexcept;
};

}  // namespace bba
