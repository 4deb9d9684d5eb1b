/**
 * @file    style.hpp
 * @brief   ImGui Style Configuration
 * @license MIT
 *
 * @details
 * Light and dark palettes sharing one layout. The theme is part of the
 * persisted appearance settings and can be switched at runtime.
 */

#pragma once

#include "core/settings.hpp"

#include <imgui.h>
#include <implot.h>

namespace bba::gui {

namespace detail {

struct Palette {
    ImVec4 bg_window;
    ImVec4 bg_child;
    ImVec4 bg_frame;
    ImVec4 bg_frame_hovered;
    ImVec4 bg_frame_active;
    ImVec4 border;
    ImVec4 border_dim;
    ImVec4 text;
    ImVec4 text_dim;
    ImVec4 scrollbar_grab;
    ImVec4 scrollbar_grab_hovered;
    ImVec4 modal_dim;
};

// Accent (shared): #3A7BD5
constexpr ImVec4 kAccent     = ImVec4(0.23f, 0.48f, 0.84f, 1.00f);
constexpr ImVec4 kAccentDim  = ImVec4(0.18f, 0.38f, 0.66f, 1.00f);
constexpr ImVec4 kAccentBg   = ImVec4(0.23f, 0.48f, 0.84f, 0.25f);

constexpr Palette kDark{
    ImVec4(0.10f, 0.10f, 0.12f, 1.00f),
    ImVec4(0.14f, 0.14f, 0.16f, 1.00f),
    ImVec4(0.18f, 0.18f, 0.20f, 1.00f),
    ImVec4(0.22f, 0.22f, 0.24f, 1.00f),
    ImVec4(0.26f, 0.26f, 0.28f, 1.00f),
    ImVec4(0.28f, 0.28f, 0.30f, 1.00f),
    ImVec4(0.20f, 0.20f, 0.22f, 1.00f),
    ImVec4(0.92f, 0.92f, 0.94f, 1.00f),
    ImVec4(0.60f, 0.60f, 0.62f, 1.00f),
    ImVec4(0.30f, 0.30f, 0.32f, 1.00f),
    ImVec4(0.40f, 0.40f, 0.42f, 1.00f),
    ImVec4(0.00f, 0.00f, 0.00f, 0.60f),
};

constexpr Palette kLight{
    ImVec4(0.94f, 0.94f, 0.95f, 1.00f),
    ImVec4(0.98f, 0.98f, 0.99f, 1.00f),
    ImVec4(0.86f, 0.86f, 0.88f, 1.00f),
    ImVec4(0.80f, 0.82f, 0.86f, 1.00f),
    ImVec4(0.74f, 0.77f, 0.83f, 1.00f),
    ImVec4(0.70f, 0.70f, 0.72f, 1.00f),
    ImVec4(0.80f, 0.80f, 0.82f, 1.00f),
    ImVec4(0.10f, 0.10f, 0.12f, 1.00f),
    ImVec4(0.45f, 0.45f, 0.48f, 1.00f),
    ImVec4(0.70f, 0.70f, 0.72f, 1.00f),
    ImVec4(0.60f, 0.60f, 0.62f, 1.00f),
    ImVec4(0.20f, 0.20f, 0.20f, 0.35f),
};

}  // namespace detail

/**
 * Apply the application's ImGui/ImPlot style for the given theme.
 * Sizes are left untouched so DPI scaling applied at startup survives
 * a theme switch.
 */
inline void apply_style(Theme theme) {
    ImGuiStyle& style = ImGui::GetStyle();
    ImVec4* colors = style.Colors;
    const detail::Palette& p = (theme == Theme::Dark) ? detail::kDark : detail::kLight;

    // ==========================================================================
    // Rounding & Borders
    // ==========================================================================
    style.WindowRounding = 6.0f;
    style.ChildRounding = 4.0f;
    style.FrameRounding = 4.0f;
    style.PopupRounding = 4.0f;
    style.ScrollbarRounding = 4.0f;
    style.GrabRounding = 3.0f;
    style.TabRounding = 4.0f;

    style.WindowBorderSize = 1.0f;
    style.ChildBorderSize = 1.0f;
    style.FrameBorderSize = (theme == Theme::Light) ? 1.0f : 0.0f;
    style.PopupBorderSize = 1.0f;
    style.TabBorderSize = 0.0f;

    // ==========================================================================
    // Colors
    // ==========================================================================
    colors[ImGuiCol_Text]                  = p.text;
    colors[ImGuiCol_TextDisabled]          = p.text_dim;

    colors[ImGuiCol_WindowBg]              = p.bg_window;
    colors[ImGuiCol_ChildBg]               = p.bg_child;
    colors[ImGuiCol_PopupBg]               = p.bg_window;

    colors[ImGuiCol_Border]                = p.border;
    colors[ImGuiCol_BorderShadow]          = ImVec4(0.00f, 0.00f, 0.00f, 0.00f);

    colors[ImGuiCol_FrameBg]               = p.bg_frame;
    colors[ImGuiCol_FrameBgHovered]        = p.bg_frame_hovered;
    colors[ImGuiCol_FrameBgActive]         = p.bg_frame_active;

    colors[ImGuiCol_TitleBg]               = p.bg_window;
    colors[ImGuiCol_TitleBgActive]         = p.bg_child;
    colors[ImGuiCol_TitleBgCollapsed]      = p.bg_window;
    colors[ImGuiCol_MenuBarBg]             = p.bg_window;

    colors[ImGuiCol_ScrollbarBg]           = p.bg_window;
    colors[ImGuiCol_ScrollbarGrab]         = p.scrollbar_grab;
    colors[ImGuiCol_ScrollbarGrabHovered]  = p.scrollbar_grab_hovered;
    colors[ImGuiCol_ScrollbarGrabActive]   = detail::kAccentDim;

    colors[ImGuiCol_CheckMark]             = detail::kAccent;
    colors[ImGuiCol_SliderGrab]            = detail::kAccentDim;
    colors[ImGuiCol_SliderGrabActive]      = detail::kAccent;

    colors[ImGuiCol_Button]                = p.bg_frame;
    colors[ImGuiCol_ButtonHovered]         = detail::kAccentDim;
    colors[ImGuiCol_ButtonActive]          = detail::kAccent;

    colors[ImGuiCol_Header]                = detail::kAccentBg;
    colors[ImGuiCol_HeaderHovered]         = ImVec4(0.23f, 0.48f, 0.84f, 0.45f);
    colors[ImGuiCol_HeaderActive]          = ImVec4(0.23f, 0.48f, 0.84f, 0.65f);

    colors[ImGuiCol_Separator]             = p.border_dim;
    colors[ImGuiCol_SeparatorHovered]      = detail::kAccentDim;
    colors[ImGuiCol_SeparatorActive]       = detail::kAccent;

    colors[ImGuiCol_ResizeGrip]            = detail::kAccentBg;
    colors[ImGuiCol_ResizeGripHovered]     = ImVec4(0.23f, 0.48f, 0.84f, 0.60f);
    colors[ImGuiCol_ResizeGripActive]      = detail::kAccent;

    colors[ImGuiCol_PlotHistogram]         = detail::kAccent;
    colors[ImGuiCol_PlotHistogramHovered]  = ImVec4(1.00f, 0.60f, 0.35f, 1.00f);

    colors[ImGuiCol_TableHeaderBg]         = p.bg_child;
    colors[ImGuiCol_TableBorderStrong]     = p.border;
    colors[ImGuiCol_TableBorderLight]      = p.border_dim;
    colors[ImGuiCol_TableRowBg]            = ImVec4(0.00f, 0.00f, 0.00f, 0.00f);
    colors[ImGuiCol_TableRowBgAlt]         = (theme == Theme::Dark)
        ? ImVec4(1.00f, 1.00f, 1.00f, 0.03f)
        : ImVec4(0.00f, 0.00f, 0.00f, 0.03f);

    colors[ImGuiCol_TextSelectedBg]        = detail::kAccentBg;
    colors[ImGuiCol_NavHighlight]          = detail::kAccent;
    colors[ImGuiCol_ModalWindowDimBg]      = p.modal_dim;

    // ImPlot follows the ImGui colors
    if (ImPlot::GetCurrentContext()) {
        ImPlot::StyleColorsAuto();
    }
}

/**
 * Status bar color for error vs. normal messages
 */
inline ImVec4 get_status_color(bool success) {
    if (success) {
        return ImVec4(0.40f, 0.80f, 0.40f, 1.00f);
    }
    return ImVec4(0.90f, 0.35f, 0.35f, 1.00f);
}

/**
 * Marker color for the unsaved indicator and annotated files
 */
inline ImVec4 get_accent_color() {
    return detail::kAccent;
}

}  // namespace bba::gui
