/**
 * @file    annotation_view.hpp
 * @brief   Annotation Canvas Widget
 * @license MIT
 *
 * @details
 * Shows the canvas texture at its native size and forwards mouse input to
 * the annotation canvas in display coordinates. The canvas is resized to
 * follow the space the widget gets.
 */

#pragma once

#include "gui/app/app_controller.hpp"
#include <imgui.h>

namespace bba::gui {

class AnnotationView {
public:
    explicit AnnotationView(AppController& controller);
    ~AnnotationView() = default;

    // Non-copyable
    AnnotationView(const AnnotationView&) = delete;
    AnnotationView& operator=(const AnnotationView&) = delete;

    /**
     * Render the view
     * Call within ImGui context
     */
    void render();

private:
    AppController& m_controller;

    ImVec2 m_origin{0, 0};          // Screen position of the canvas' top-left
    bool m_pointer_down{false};     // Left button pressed inside the view

    void render_placeholder();
    void render_canvas();
    void handle_input(bool hovered);
};

}  // namespace bba::gui
