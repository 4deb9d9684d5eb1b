/**
 * @file    appearance_dialog.cpp
 * @brief   Appearance settings dialog implementation
 * @license MIT
 */

#include "gui/widgets/appearance_dialog.hpp"
#include "i18n/i18n.hpp"
#include "i18n/keys.hpp"

#include <imgui.h>

#include <string>

namespace bba::gui {

namespace {

/**
 * ColorEdit3 over a "#RRGGBB" setting
 * @return true if the color changed
 */
bool edit_hex_color(const char* label, std::string& hex) {
    const cv::Scalar bgr = hex_to_bgr(hex);
    float rgb[3] = {
        static_cast<float>(bgr[2] / 255.0),
        static_cast<float>(bgr[1] / 255.0),
        static_cast<float>(bgr[0] / 255.0),
    };

    if (!ImGui::ColorEdit3(label, rgb, ImGuiColorEditFlags_DisplayHex)) {
        return false;
    }

    const auto to_byte = [](float v) { return static_cast<double>(v) * 255.0 + 0.5; };
    const std::string updated = bgr_to_hex(cv::Scalar(to_byte(rgb[2]), to_byte(rgb[1]), to_byte(rgb[0])));
    if (updated == hex) {
        return false;
    }
    hex = updated;
    return true;
}

}  // anonymous namespace

AppearanceDialog::AppearanceDialog(AppController& controller)
    : m_controller(controller)
{
}

void AppearanceDialog::render() {
    auto& state = m_controller.state();
    if (!state.dialogs.show_appearance) {
        return;
    }

    const float scale = state.dpi_scale;
    ImGui::SetNextWindowSize(ImVec2(420.0f * scale, 0), ImGuiCond_Appearing);
    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));

    if (!ImGui::Begin(TR(i18n::keys::DIALOG_APPEARANCE_TITLE), &state.dialogs.show_appearance,
                      ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::End();
        return;
    }

    Appearance edited = state.settings.appearance;
    bool changed = false;

    changed |= edit_hex_color(TR(i18n::keys::DIALOG_APPEARANCE_BBOX_COLOR), edited.bbox_color);
    changed |= edit_hex_color(TR(i18n::keys::DIALOG_APPEARANCE_SELECTED_COLOR), edited.bbox_selected_color);
    changed |= edit_hex_color(TR(i18n::keys::DIALOG_APPEARANCE_LABEL_COLOR), edited.label_color);
    changed |= edit_hex_color(TR(i18n::keys::DIALOG_APPEARANCE_POINTS_COLOR), edited.points_color);

    ImGui::Separator();

    changed |= ImGui::SliderInt(TR(i18n::keys::DIALOG_APPEARANCE_LINE_WIDTH), &edited.bbox_line_width,
                                Appearance::kLineWidthMin, Appearance::kLineWidthMax);
    changed |= ImGui::SliderInt(TR(i18n::keys::DIALOG_APPEARANCE_POINTS_SIZE), &edited.points_size,
                                Appearance::kPointsSizeMin, Appearance::kPointsSizeMax);
    changed |= ImGui::SliderInt(TR(i18n::keys::DIALOG_APPEARANCE_FONT_SIZE), &edited.label_font_size,
                                Appearance::kFontSizeMin, Appearance::kFontSizeMax);

    ImGui::Separator();

    ImGui::Text("%s", TR(i18n::keys::DIALOG_APPEARANCE_THEME));
    ImGui::SameLine();
    if (ImGui::RadioButton(TR(i18n::keys::DIALOG_APPEARANCE_THEME_LIGHT), edited.theme == Theme::Light)) {
        edited.theme = Theme::Light;
        changed = true;
    }
    ImGui::SameLine();
    if (ImGui::RadioButton(TR(i18n::keys::DIALOG_APPEARANCE_THEME_DARK), edited.theme == Theme::Dark)) {
        edited.theme = Theme::Dark;
        changed = true;
    }

    ImGui::Spacing();
    if (ImGui::Button(TR(i18n::keys::DIALOG_APPEARANCE_RESET))) {
        edited = Appearance{};
        changed = true;
    }
    ImGui::SameLine();
    if (ImGui::Button(TR(i18n::keys::DIALOG_CLOSE))) {
        state.dialogs.show_appearance = false;
    }

    if (changed) {
        m_controller.set_appearance(edited);
    }

    ImGui::End();
}

}  // namespace bba::gui
