/**
 * @file    log_viewer.cpp
 * @brief   Log viewer implementation
 * @license MIT
 */

#include "gui/widgets/log_viewer.hpp"
#include "utils/logging.hpp"
#include "i18n/i18n.hpp"
#include "i18n/keys.hpp"

#include <imgui.h>

#include <iterator>
#include <string>
#include <string_view>

namespace bba::gui {

namespace {

constexpr const char* kLevelNames[] = {"trace", "debug", "info", "warning", "error", "critical"};

ImVec4 level_color(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:
        case spdlog::level::debug:    return ImVec4(0.55f, 0.55f, 0.58f, 1.0f);
        case spdlog::level::warn:     return ImVec4(0.90f, 0.70f, 0.25f, 1.0f);
        case spdlog::level::err:
        case spdlog::level::critical: return ImVec4(0.90f, 0.35f, 0.35f, 1.0f);
        default:                      return ImGui::GetStyleColorVec4(ImGuiCol_Text);
    }
}

}  // anonymous namespace

LogViewer::LogViewer(AppController& controller)
    : m_controller(controller)
{
}

void LogViewer::render() {
    auto& state = m_controller.state();
    if (!state.dialogs.show_logs) {
        return;
    }

    const float scale = state.dpi_scale;
    ImGui::SetNextWindowSize(ImVec2(760.0f * scale, 420.0f * scale), ImGuiCond_FirstUseEver);
    if (!ImGui::Begin(TR(i18n::keys::DIALOG_LOGS_TITLE), &state.dialogs.show_logs)) {
        ImGui::End();
        return;
    }

    ImGui::SetNextItemWidth(120.0f * scale);
    ImGui::Combo(TR(i18n::keys::DIALOG_LOGS_LEVEL), &m_min_level, kLevelNames,
                 static_cast<int>(std::size(kLevelNames)));
    ImGui::SameLine();
    ImGui::SetNextItemWidth(200.0f * scale);
    ImGui::InputText(TR(i18n::keys::DIALOG_LOGS_FILTER), m_filter.data(), m_filter.size());
    ImGui::SameLine();
    if (ImGui::Button(TR(i18n::keys::DIALOG_LOGS_CLEAR))) {
        logging::clear_recent();
    }
    ImGui::SameLine();
    ImGui::Checkbox(TR(i18n::keys::DIALOG_LOGS_AUTO_SCROLL), &m_auto_scroll);

    ImGui::Separator();

    ImGui::BeginChild("LogLines", ImVec2(0, 0), false, ImGuiWindowFlags_HorizontalScrollbar);

    const std::string_view filter(m_filter.data());
    for (const auto& entry : logging::recent_entries()) {
        if (static_cast<int>(entry.level) < m_min_level) continue;
        if (!filter.empty() && entry.text.find(filter) == std::string::npos) continue;

        ImGui::PushStyleColor(ImGuiCol_Text, level_color(entry.level));
        ImGui::TextUnformatted(entry.text.c_str());
        ImGui::PopStyleColor();
    }

    if (m_auto_scroll && ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) {
        ImGui::SetScrollHereY(1.0f);
    }
    ImGui::EndChild();

    ImGui::End();
}

}  // namespace bba::gui
