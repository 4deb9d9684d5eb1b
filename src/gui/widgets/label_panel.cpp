/**
 * @file    label_panel.cpp
 * @brief   Left side panel implementation
 * @license MIT
 */

#include "gui/widgets/label_panel.hpp"
#include "gui/resources/style.hpp"
#include "utils/path_formatter.hpp"
#include "i18n/i18n.hpp"
#include "i18n/keys.hpp"

#include <imgui.h>
#include <implot.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

namespace bba::gui {

LabelPanel::LabelPanel(AppController& controller)
    : m_controller(controller)
{
}

void LabelPanel::render() {
    const float scale = m_controller.state().dpi_scale;

    // Files get a third of the height, the rest scrolls with the panel
    const float files_height = std::max(120.0f * scale, ImGui::GetContentRegionAvail().y * 0.3f);
    ImGui::Text("%s", TR(i18n::keys::PANEL_FILES_TITLE));
    ImGui::Separator();
    ImGui::BeginChild("Files", ImVec2(0, files_height), false);
    render_files();
    ImGui::EndChild();

    ImGui::Spacing();
    render_current_label();

    ImGui::Spacing();
    render_annotations();

    ImGui::Spacing();
    render_statistics();
}

// =============================================================================
// Files
// =============================================================================

void LabelPanel::render_files() {
    const auto& images = m_controller.images();
    const auto& paths = images.paths();

    if (paths.empty()) {
        ImGui::TextDisabled("%s", TR(i18n::keys::PANEL_FILES_EMPTY));
        return;
    }

    const auto current = images.index();
    const ImVec4 accent = get_accent_color();

    for (size_t i = 0; i < paths.size(); ++i) {
        ImGui::PushID(static_cast<int>(i));

        const bool annotated = m_controller.is_annotated(paths[i]);
        ImGui::TextColored(annotated ? accent : ImVec4(0, 0, 0, 0), "*");
        ImGui::SameLine();

        const bool selected = current && *current == i;
        if (ImGui::Selectable(filename_utf8(paths[i]).c_str(), selected) && !selected) {
            m_controller.request([this, i]() { m_controller.select_image(i); });
        }
        if (selected && m_scrolled_to != i) {
            ImGui::SetScrollHereY();
            m_scrolled_to = i;
        }

        ImGui::PopID();
    }
}

// =============================================================================
// Current label
// =============================================================================

void LabelPanel::sync_label_buffer() {
    const std::string& label = m_controller.labels().current_label();
    if (label != m_label_buffer.data()) {
        const size_t n = std::min(label.size(), m_label_buffer.size() - 1);
        std::memcpy(m_label_buffer.data(), label.data(), n);
        m_label_buffer[n] = '\0';
    }
}

void LabelPanel::render_current_label() {
    ImGui::Text("%s", TR(i18n::keys::PANEL_LABEL_TITLE));
    ImGui::Separator();

    if (!ImGui::IsAnyItemActive()) {
        sync_label_buffer();
    }

    ImGui::SetNextItemWidth(-1);
    if (ImGui::InputTextWithHint("##current_label", TR(i18n::keys::PANEL_LABEL_HINT),
                                 m_label_buffer.data(), m_label_buffer.size())) {
        m_controller.set_current_label(m_label_buffer.data());
    }

    ImGui::TextDisabled("%s", TR(i18n::keys::PANEL_LABELS_USED));
    const auto& labels = m_controller.unique_labels();
    if (labels.empty()) {
        ImGui::TextDisabled("  %s", TR(i18n::keys::PANEL_LABELS_NONE));
        return;
    }

    const float scale = m_controller.state().dpi_scale;
    const float height = std::min(static_cast<float>(labels.size()) * ImGui::GetTextLineHeightWithSpacing(),
                                  120.0f * scale) + ImGui::GetStyle().FramePadding.y * 2.0f;
    if (ImGui::BeginListBox("##used_labels", ImVec2(-1, height))) {
        const std::string& current = m_controller.labels().current_label();
        for (const auto& label : labels) {
            if (ImGui::Selectable(label.c_str(), label == current)) {
                m_controller.set_current_label(label);
            }
        }
        ImGui::EndListBox();
    }
}

// =============================================================================
// Annotations
// =============================================================================

void LabelPanel::open_target_dialog(const LabelEntry& entry, bool delete_dialog) {
    auto& dialogs = m_controller.state().dialogs;
    dialogs.target = LabelTarget{entry.label, entry.index, entry.count};
    if (delete_dialog) {
        dialogs.show_delete = true;
    } else {
        dialogs.show_edit_label = true;
    }
}

void LabelPanel::render_annotations() {
    ImGui::Text("%s", TR(i18n::keys::PANEL_ANNOTATIONS_TITLE));
    ImGui::Separator();

    bool group = m_controller.state().group_similar;
    if (ImGui::Checkbox(TR(i18n::keys::PANEL_ANNOTATIONS_GROUP), &group)) {
        m_controller.set_group_similar(group);
    }

    const auto& store = m_controller.store();
    if (!store.is_loaded()) {
        return;
    }

    const auto entries = LabelRegistry::build_label_list(store.annotations(), group);
    const auto selected_index = store.selected_index();

    for (size_t row = 0; row < entries.size(); ++row) {
        const LabelEntry& entry = entries[row];
        ImGui::PushID(static_cast<int>(row));

        const bool selected = entry.index
            ? (selected_index && *selected_index == *entry.index)
            : (entry.label == m_controller.selected_label());

        if (ImGui::Selectable(entry.text.c_str(), selected)) {
            if (entry.index) {
                m_controller.select_annotation(entry.index);
            } else {
                m_controller.select_label_group(entry.label);
            }
        }

        if (ImGui::BeginPopupContextItem("##entry_menu")) {
            if (ImGui::MenuItem(TR(i18n::keys::PANEL_ANNOTATIONS_EDIT))) {
                open_target_dialog(entry, false);
            }
            if (ImGui::MenuItem(TR(i18n::keys::PANEL_ANNOTATIONS_DELETE))) {
                open_target_dialog(entry, true);
            }
            ImGui::EndPopup();
        }

        ImGui::PopID();
    }
}

// =============================================================================
// Statistics
// =============================================================================

void LabelPanel::render_statistics() {
    const auto& store = m_controller.store();
    if (!store.is_loaded() || store.annotations().empty()) {
        return;
    }

    const auto counts = LabelRegistry::label_counts(store.annotations());
    if (counts.empty()) {
        return;
    }

    if (!ImGui::CollapsingHeader(TR(i18n::keys::PANEL_STATS_TITLE), ImGuiTreeNodeFlags_DefaultOpen)) {
        return;
    }

    std::vector<double> positions;
    std::vector<double> values;
    std::vector<const char*> names;
    positions.reserve(counts.size());
    values.reserve(counts.size());
    names.reserve(counts.size());
    for (size_t i = 0; i < counts.size(); ++i) {
        positions.push_back(static_cast<double>(i));
        values.push_back(static_cast<double>(counts[i].second));
        names.push_back(counts[i].first.c_str());
    }

    const float scale = m_controller.state().dpi_scale;
    const ImPlotFlags plot_flags = ImPlotFlags_NoLegend | ImPlotFlags_NoMenus |
                                   ImPlotFlags_NoMouseText | ImPlotFlags_NoBoxSelect;
    if (ImPlot::BeginPlot("##label_counts", ImVec2(-1, 160.0f * scale), plot_flags)) {
        ImPlot::SetupAxes(nullptr, TR(i18n::keys::PANEL_STATS_COUNT),
                          ImPlotAxisFlags_AutoFit | ImPlotAxisFlags_NoGridLines,
                          ImPlotAxisFlags_AutoFit);
        ImPlot::SetupAxisTicks(ImAxis_X1, positions.data(), static_cast<int>(positions.size()),
                               names.data());
        ImPlot::PlotBars(TR(i18n::keys::PANEL_STATS_COUNT), values.data(),
                         static_cast<int>(values.size()), 0.6);
        ImPlot::EndPlot();
    }
}

}  // namespace bba::gui
