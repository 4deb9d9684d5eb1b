/**
 * @file    annotation_view.cpp
 * @brief   Annotation Canvas Widget Implementation
 * @license MIT
 */

#include "gui/widgets/annotation_view.hpp"
#include "i18n/i18n.hpp"
#include "i18n/keys.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace bba::gui {

namespace {

[[nodiscard]] Modifiers current_modifiers(const ImGuiIO& io) noexcept {
    Modifiers mods;
    mods.ctrl = io.KeyCtrl;
    mods.shift = io.KeyShift;
    mods.alt = io.KeyAlt;
    return mods;
}

}  // anonymous namespace

AnnotationView::AnnotationView(AppController& controller)
    : m_controller(controller)
{
}

// =============================================================================
// Render
// =============================================================================

void AnnotationView::render() {
    // Canvas follows the widget even before an image is loaded
    const ImVec2 avail = ImGui::GetContentRegionAvail();
    m_controller.resize_canvas(static_cast<int>(avail.x), static_cast<int>(avail.y));

    if (!m_controller.canvas().has_image()) {
        m_pointer_down = false;
        render_placeholder();
        return;
    }

    render_canvas();
}

void AnnotationView::render_placeholder() {
    ImVec2 avail = ImGui::GetContentRegionAvail();
    ImVec2 content_start = ImGui::GetCursorScreenPos();

    const char* text = TR(i18n::keys::VIEW_PLACEHOLDER);
    ImVec2 text_size = ImGui::CalcTextSize(text);

    ImGui::SetCursorScreenPos(ImVec2(
        content_start.x + (avail.x - text_size.x) * 0.5f,
        content_start.y + (avail.y - text_size.y) * 0.5f));
    ImGui::TextDisabled("%s", text);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    const float margin = 10.0f;
    draw_list->AddRect(
        ImVec2(content_start.x + margin, content_start.y + margin),
        ImVec2(content_start.x + avail.x - margin, content_start.y + avail.y - margin),
        IM_COL32(128, 128, 128, 128), 0, 0, 1.0f);
}

void AnnotationView::render_canvas() {
    const TextureHandle& tex = m_controller.state().canvas_texture;
    m_origin = ImGui::GetCursorScreenPos();
    const ImVec2 avail = ImGui::GetContentRegionAvail();

    // Catches the mouse so the parent window does not start dragging
    ImGui::InvisibleButton("##canvas", ImVec2(std::max(avail.x, 1.0f), std::max(avail.y, 1.0f)),
                           ImGuiButtonFlags_MouseButtonLeft);
    const bool hovered = ImGui::IsItemHovered(ImGuiHoveredFlags_AllowWhenBlockedByActiveItem);

    if (void* tex_id = m_controller.get_canvas_texture_id()) {
        ImDrawList* draw_list = ImGui::GetWindowDrawList();
        draw_list->AddImage(
            reinterpret_cast<ImTextureID>(tex_id),
            m_origin,
            ImVec2(m_origin.x + static_cast<float>(tex.width),
                   m_origin.y + static_cast<float>(tex.height)));
    }

    handle_input(hovered);

    if (hovered && !m_pointer_down && ImGui::GetIO().KeyCtrl) {
        ImGui::SetTooltip("%s", TR(i18n::keys::VIEW_HINT));
    }
}

// =============================================================================
// Input
// =============================================================================

void AnnotationView::handle_input(bool hovered) {
    ImGuiIO& io = ImGui::GetIO();
    AnnotationCanvas& canvas = m_controller.canvas();

    const cv::Point2f pos(io.MousePos.x - m_origin.x, io.MousePos.y - m_origin.y);
    const Modifiers mods = current_modifiers(io);

    try {
        if (hovered && io.MouseWheel != 0.0f) {
            canvas.on_wheel(WheelEvent{pos, io.MouseWheel, mods});
        }

        if (hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
            m_pointer_down = true;
            canvas.on_pointer_press(PointerEvent{pos, MouseButton::Left, mods});
        } else if (hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Right)) {
            canvas.on_pointer_press(PointerEvent{pos, MouseButton::Right, mods});
        }

        // Drags keep tracking outside the view until release
        if (m_pointer_down && (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f)) {
            canvas.on_pointer_move(PointerEvent{pos, MouseButton::Left, mods});
        }

        if (m_pointer_down && ImGui::IsMouseReleased(ImGuiMouseButton_Left)) {
            m_pointer_down = false;
            canvas.on_pointer_release(PointerEvent{pos, MouseButton::Left, mods});
        }
    } catch (const std::exception& e) {
        m_pointer_down = false;
        canvas.cancel_current_action();
        spdlog::error("[AnnotationView] Input failed: {}", e.what());
        m_controller.set_error(e.what());
    }
}

}  // namespace bba::gui
