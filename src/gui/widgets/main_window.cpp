/**
 * @file    main_window.cpp
 * @brief   Main Window UI Implementation
 * @license MIT
 */

#include "gui/widgets/main_window.hpp"
#include "gui/resources/style.hpp"
#include "core/image_source.hpp"
#include "utils/path_formatter.hpp"
#include "i18n/i18n.hpp"
#include "i18n/keys.hpp"

#include <imgui.h>
#include <SDL3/SDL.h>
#include <nfd.h>

#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>

namespace bba::gui {

// =============================================================================
// File Dialog Helpers (Cross-platform via nativefiledialog-extended)
// With Linux fallback to zenity/kdialog when portal is unavailable
// =============================================================================

namespace {

namespace fs = std::filesystem;

#ifdef __linux__
enum class LinuxDialogTool {
    None,
    Zenity,
    Kdialog
};

// Escape single quotes for safe shell argument interpolation
std::string shell_escape(const std::string& input) {
    std::string escaped = input;
    size_t pos = 0;
    while ((pos = escaped.find('\'', pos)) != std::string::npos) {
        escaped.replace(pos, 1, "'\\''");
        pos += 4;
    }
    return escaped;
}

LinuxDialogTool detect_dialog_tool() {
    static LinuxDialogTool cached = []() {
        if (std::system("which zenity > /dev/null 2>&1") == 0)
            return LinuxDialogTool::Zenity;
        if (std::system("which kdialog > /dev/null 2>&1") == 0)
            return LinuxDialogTool::Kdialog;
        return LinuxDialogTool::None;
    }();
    return cached;
}

// Run a shell command and capture its stdout as a path
std::optional<fs::path> run_command_dialog(const std::string& cmd) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return std::nullopt;

    char buffer[4096];
    std::string result;
    while (fgets(buffer, sizeof(buffer), pipe)) {
        result += buffer;
    }

    int status = pclose(pipe);
    if (status != 0 || result.empty()) return std::nullopt;

    while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
        result.pop_back();
    }

    if (result.empty()) return std::nullopt;
    return path_from_utf8(result);
}

std::optional<fs::path> fallback_open_image_dialog(const fs::path& start_dir) {
    const std::string dir = shell_escape(to_utf8(start_dir));

    switch (detect_dialog_tool()) {
        case LinuxDialogTool::Zenity:
            return run_command_dialog(
                "zenity --file-selection --title='Open Image' "
                "--filename='" + dir + "/' "
                "--file-filter='Image Files|*.png *.jpg *.jpeg *.bmp *.gif' "
                "--file-filter='All Files|*' 2>/dev/null");
        case LinuxDialogTool::Kdialog:
            return run_command_dialog(
                "kdialog --getopenfilename '" + dir + "' "
                "'Image Files (*.png *.jpg *.jpeg *.bmp *.gif)' 2>/dev/null");
        case LinuxDialogTool::None:
            break;
    }

    spdlog::error("[MainWindow] No file dialog available. Install zenity or kdialog.");
    return std::nullopt;
}

std::optional<fs::path> fallback_pick_folder_dialog(const fs::path& start_dir) {
    const std::string dir = shell_escape(to_utf8(start_dir));

    switch (detect_dialog_tool()) {
        case LinuxDialogTool::Zenity:
            return run_command_dialog(
                "zenity --file-selection --directory --title='Select Folder' "
                "--filename='" + dir + "/' 2>/dev/null");
        case LinuxDialogTool::Kdialog:
            return run_command_dialog("kdialog --getexistingdirectory '" + dir + "' 2>/dev/null");
        case LinuxDialogTool::None:
            break;
    }

    spdlog::error("[MainWindow] No file dialog available. Install zenity or kdialog.");
    return std::nullopt;
}
#endif  // __linux__

// =============================================================================
// Cross-platform file dialogs (NFD with Linux fallback)
// =============================================================================
std::optional<fs::path> open_image_dialog(const fs::path& start_dir) {
    NFD_Init();

    nfdchar_t* out_path = nullptr;
    nfdfilteritem_t filters[] = {
        {"Image Files", "png,jpg,jpeg,bmp,gif"}
    };

    const std::string default_path = to_utf8(start_dir);
    nfdresult_t result = NFD_OpenDialog(&out_path, filters, 1,
                                        default_path.empty() ? nullptr : default_path.c_str());

    std::optional<fs::path> path;
    if (result == NFD_OKAY && out_path) {
        path = path_from_utf8(out_path);
        NFD_FreePath(out_path);
    } else if (result == NFD_ERROR) {
        spdlog::debug("[MainWindow] NFD dialog failed: {}", NFD_GetError());
#ifdef __linux__
        spdlog::info("[MainWindow] Falling back to zenity/kdialog...");
        NFD_Quit();
        return fallback_open_image_dialog(start_dir);
#endif
    }

    NFD_Quit();
    return path;
}

std::optional<fs::path> pick_folder_dialog(const fs::path& start_dir) {
    NFD_Init();

    nfdchar_t* out_path = nullptr;
    const std::string default_path = to_utf8(start_dir);
    nfdresult_t result = NFD_PickFolder(&out_path,
                                        default_path.empty() ? nullptr : default_path.c_str());

    std::optional<fs::path> path;
    if (result == NFD_OKAY && out_path) {
        path = path_from_utf8(out_path);
        NFD_FreePath(out_path);
    } else if (result == NFD_ERROR) {
        spdlog::debug("[MainWindow] NFD dialog failed: {}", NFD_GetError());
#ifdef __linux__
        spdlog::info("[MainWindow] Falling back to zenity/kdialog...");
        NFD_Quit();
        return fallback_pick_folder_dialog(start_dir);
#endif
    }

    NFD_Quit();
    return path;
}

/**
 * Open a modal popup centered on the main viewport
 */
void open_centered_popup(const char* title) {
    ImGui::OpenPopup(title);
    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
}

void copy_to_buffer(std::array<char, 256>& buffer, const std::string& text) {
    const size_t n = std::min(text.size(), buffer.size() - 1);
    std::memcpy(buffer.data(), text.data(), n);
    buffer[n] = '\0';
}

}  // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

MainWindow::MainWindow(AppController& controller)
    : m_controller(controller)
    , m_annotation_view(std::make_unique<AnnotationView>(controller))
    , m_label_panel(std::make_unique<LabelPanel>(controller))
    , m_appearance_dialog(std::make_unique<AppearanceDialog>(controller))
    , m_log_viewer(std::make_unique<LogViewer>(controller))
{
    spdlog::debug("[MainWindow] Created");
}

MainWindow::~MainWindow() = default;

void MainWindow::request_quit() {
    m_controller.request([this]() { m_quit = true; });
}

// =============================================================================
// Main Render
// =============================================================================

void MainWindow::render() {
    m_controller.update_texture_if_needed();

    const float scale = m_controller.state().dpi_scale;

    ImGuiWindowFlags window_flags =
        ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoNavFocus |
        ImGuiWindowFlags_MenuBar;

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGui::Begin("MainWindow", nullptr, window_flags);

    render_menu_bar();
    render_toolbar();

    // Same formula as render_status_bar
    float status_bar_height = ImGui::GetFrameHeight() + 8.0f * scale;
    float content_height = std::max(1.0f, ImGui::GetContentRegionAvail().y - status_bar_height);

    float panel_width = 260.0f * scale;

    ImGui::BeginChild("LabelPanel", ImVec2(panel_width, content_height), true);
    m_label_panel->render();
    ImGui::EndChild();

    ImGui::SameLine();

    ImGui::BeginChild("AnnotationArea", ImVec2(0, content_height), true,
                      ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
    m_annotation_view->render();
    ImGui::EndChild();

    ImGui::End();

    render_status_bar();

    // Dialogs
    m_appearance_dialog->render();
    m_log_viewer->render();

    auto& dialogs = m_controller.state().dialogs;
    if (dialogs.show_about) render_about_dialog();
    if (dialogs.show_unsaved) render_unsaved_dialog();
    if (dialogs.show_edit_label) render_edit_label_dialog();
    if (dialogs.show_delete) render_delete_dialog();
}

// =============================================================================
// Event Handling
// =============================================================================

bool MainWindow::handle_event(const SDL_Event& event) {
    if (event.type == SDL_EVENT_KEY_DOWN) {
        // Typing a label must not trigger shortcuts
        if (ImGui::GetIO().WantTextInput) {
            return false;
        }

        const bool ctrl = (event.key.mod & SDL_KMOD_CTRL) != 0;

        if (ctrl) {
            switch (event.key.key) {
                case SDLK_I: action_open_image(); return true;
                case SDLK_D: action_open_directory(); return true;
                case SDLK_O: action_change_output_dir(); return true;
                case SDLK_S: action_save(); return true;
                case SDLK_EQUALS: m_controller.zoom_in(); return true;
                case SDLK_MINUS: m_controller.zoom_out(); return true;
                case SDLK_0: m_controller.zoom_fit(); return true;
            }
        } else {
            switch (event.key.key) {
                case SDLK_E: m_controller.set_mode(EditMode::Edit); return true;
                case SDLK_D: m_controller.set_mode(EditMode::Draw); return true;
                case SDLK_ESCAPE: m_controller.cancel_action(); return true;
                case SDLK_LEFT:
                case SDLK_UP: action_previous(); return true;
                case SDLK_RIGHT:
                case SDLK_DOWN: action_next(); return true;
            }
        }
    }

    // SDL always delivers UTF-8 paths
    if (event.type == SDL_EVENT_DROP_FILE && event.drop.data) {
        const fs::path path = path_from_utf8(event.drop.data);
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            m_controller.request([this, path]() { m_controller.open_directory(path); });
            return true;
        }
        if (ImageSource::is_supported_image(path)) {
            m_controller.request([this, path]() { m_controller.open_image(path); });
            return true;
        }
    }

    return false;
}

// =============================================================================
// UI Components
// =============================================================================

void MainWindow::render_menu_bar() {
    if (!ImGui::BeginMenuBar()) {
        return;
    }

    auto& state = m_controller.state();
    const bool has_image = m_controller.canvas().has_image();

    if (ImGui::BeginMenu(TR(i18n::keys::MENU_FILE))) {
        if (ImGui::MenuItem(TR(i18n::keys::MENU_FILE_OPEN_IMAGE), "Ctrl+I")) {
            action_open_image();
        }
        if (ImGui::MenuItem(TR(i18n::keys::MENU_FILE_OPEN_DIR), "Ctrl+D")) {
            action_open_directory();
        }
        if (ImGui::MenuItem(TR(i18n::keys::MENU_FILE_OUTPUT_DIR), "Ctrl+O")) {
            action_change_output_dir();
        }
        ImGui::Separator();
        if (ImGui::MenuItem(TR(i18n::keys::MENU_FILE_SAVE), "Ctrl+S", false,
                            m_controller.store().has_unsaved_changes())) {
            action_save();
        }
        ImGui::Separator();
        if (ImGui::MenuItem(TR(i18n::keys::MENU_FILE_EXIT), "Alt+F4")) {
            request_quit();
        }
        ImGui::EndMenu();
    }

    if (ImGui::BeginMenu(TR(i18n::keys::MENU_VIEW))) {
        if (ImGui::MenuItem(TR(i18n::keys::MENU_VIEW_APPEARANCE))) {
            state.dialogs.show_appearance = true;
        }
        ImGui::Separator();
        if (ImGui::MenuItem(TR(i18n::keys::MENU_VIEW_FIT), "Ctrl+0", false, has_image)) {
            m_controller.zoom_fit();
        }
        if (ImGui::MenuItem(TR(i18n::keys::MENU_VIEW_ZOOM_IN), "Ctrl+=", false, has_image)) {
            m_controller.zoom_in();
        }
        if (ImGui::MenuItem(TR(i18n::keys::MENU_VIEW_ZOOM_OUT), "Ctrl+-", false, has_image)) {
            m_controller.zoom_out();
        }
        ImGui::EndMenu();
    }

    if (ImGui::BeginMenu(TR(i18n::keys::MENU_LOGGING))) {
        if (ImGui::MenuItem(TR(i18n::keys::MENU_LOGGING_VIEW), nullptr, state.dialogs.show_logs)) {
            state.dialogs.show_logs = !state.dialogs.show_logs;
        }
        ImGui::EndMenu();
    }

    if (ImGui::BeginMenu(TR(i18n::keys::MENU_HELP))) {
        if (ImGui::BeginMenu(TR(i18n::keys::MENU_HELP_LANGUAGE))) {
            const auto current = i18n::current_language();
            for (const auto& [lang, name] : i18n::available_languages()) {
                const bool is_current = (lang == current);
                if (ImGui::MenuItem(name.c_str(), nullptr, is_current) && !is_current) {
                    m_controller.set_language(lang);
                }
            }
            ImGui::EndMenu();
        }
        ImGui::Separator();
        if (ImGui::MenuItem(TR(i18n::keys::MENU_HELP_ABOUT))) {
            state.dialogs.show_about = true;
        }
        ImGui::EndMenu();
    }

    ImGui::EndMenuBar();
}

void MainWindow::render_toolbar() {
    const auto& state = m_controller.state();
    const float scale = state.dpi_scale;
    const bool has_images = !m_controller.images().paths().empty();

    ImGui::PushStyleVar(ImGuiStyleVar_FramePadding, ImVec2(8.0f * scale, 6.0f * scale));
    ImGui::Separator();

    if (ImGui::Button(TR(i18n::keys::TOOLBAR_OPEN))) {
        action_open_image();
    }
    ImGui::SameLine();
    if (ImGui::Button(TR(i18n::keys::TOOLBAR_OPEN_DIR))) {
        action_open_directory();
    }
    ImGui::SameLine();
    ImGui::BeginDisabled(!m_controller.store().has_unsaved_changes());
    if (ImGui::Button(TR(i18n::keys::TOOLBAR_SAVE))) {
        action_save();
    }
    ImGui::EndDisabled();

    ImGui::SameLine();
    ImGui::TextDisabled("|");
    ImGui::SameLine();

    if (ImGui::RadioButton(TR(i18n::keys::TOOLBAR_DRAW), state.mode == EditMode::Draw)) {
        m_controller.set_mode(EditMode::Draw);
    }
    ImGui::SameLine();
    if (ImGui::RadioButton(TR(i18n::keys::TOOLBAR_EDIT), state.mode == EditMode::Edit)) {
        m_controller.set_mode(EditMode::Edit);
    }

    ImGui::SameLine();
    ImGui::TextDisabled("|");
    ImGui::SameLine();

    ImGui::BeginDisabled(!m_controller.canvas().has_image());
    if (ImGui::Button(TR(i18n::keys::TOOLBAR_FIT))) {
        m_controller.zoom_fit();
    }
    ImGui::EndDisabled();
    ImGui::SameLine();
    ImGui::BeginDisabled(!has_images);
    if (ImGui::Button(TR(i18n::keys::TOOLBAR_PREV))) {
        action_previous();
    }
    ImGui::SameLine();
    if (ImGui::Button(TR(i18n::keys::TOOLBAR_NEXT))) {
        action_next();
    }
    ImGui::EndDisabled();

    ImGui::PopStyleVar();
    ImGui::Separator();
}

void MainWindow::render_status_bar() {
    const auto& state = m_controller.state();
    const float scale = state.dpi_scale;

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoDecoration |
        ImGuiWindowFlags_NoInputs |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoSavedSettings;

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    float height = ImGui::GetFrameHeight() + 8.0f * scale;  // match render()

    ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x, viewport->WorkPos.y + viewport->WorkSize.y - height));
    ImGui::SetNextWindowSize(ImVec2(viewport->WorkSize.x, height));

    ImGui::Begin("StatusBar", nullptr, flags);

    // Vertical centering
    float text_height = ImGui::GetTextLineHeight();
    float window_padding_y = ImGui::GetStyle().WindowPadding.y;
    float offset_y = (height - window_padding_y * 2.0f - text_height) * 0.5f;
    if (offset_y > 0) {
        ImGui::SetCursorPosY(window_padding_y + offset_y);
    }

    if (state.status_is_error) {
        ImGui::TextColored(get_status_color(false), "%s", state.status_message.c_str());
    } else {
        ImGui::Text("%s", state.status_message.c_str());
    }

    if (m_controller.store().has_unsaved_changes()) {
        ImGui::SameLine();
        ImGui::TextColored(get_accent_color(), "  %s", TR(i18n::keys::STATUS_UNSAVED));
    }

    // Zoom and image size on the right
    AnnotationCanvas& canvas = m_controller.canvas();
    if (canvas.has_image()) {
        const cv::Mat& image = canvas.image();
        const std::string info = fmt::format("{} | {}",
            TRF(i18n::keys::STATUS_ZOOM, canvas.viewport().zoom_scale() * 100.0),
            TRF(i18n::keys::STATUS_IMAGE_SIZE, image.cols, image.rows));

        float text_width = ImGui::CalcTextSize(info.c_str()).x;
        ImGui::SameLine(ImGui::GetWindowWidth() - text_width - 10.0f * scale);
        ImGui::Text("%s", info.c_str());
    }

    ImGui::End();
}

void MainWindow::render_about_dialog() {
    auto& state = m_controller.state();
    open_centered_popup(TR(i18n::keys::DIALOG_ABOUT_TITLE));

    if (ImGui::BeginPopupModal(TR(i18n::keys::DIALOG_ABOUT_TITLE), &state.dialogs.show_about,
                               ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("bbox-annotator");
        ImGui::Text("%s", TRF(i18n::keys::DIALOG_ABOUT_VERSION, APP_VERSION).c_str());
        ImGui::Separator();
        ImGui::Text("%s", TR(i18n::keys::DIALOG_ABOUT_DESCRIPTION));
        ImGui::Spacing();
        ImGui::Text("%s", TR(i18n::keys::DIALOG_ABOUT_LICENSE));
        ImGui::Spacing();

        if (ImGui::Button(TR(i18n::keys::DIALOG_OK), ImVec2(120.0f * state.dpi_scale, 0))) {
            state.dialogs.show_about = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

void MainWindow::render_unsaved_dialog() {
    auto& state = m_controller.state();
    open_centered_popup(TR(i18n::keys::DIALOG_UNSAVED_TITLE));

    bool open = true;
    if (ImGui::BeginPopupModal(TR(i18n::keys::DIALOG_UNSAVED_TITLE), &open,
                               ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("%s", TR(i18n::keys::DIALOG_UNSAVED_MESSAGE));
        ImGui::Spacing();

        const ImVec2 button_size(120.0f * state.dpi_scale, 0);
        if (ImGui::Button(TR(i18n::keys::DIALOG_YES), button_size)) {
            ImGui::CloseCurrentPopup();
            m_controller.confirm_pending();
        }
        ImGui::SameLine();
        if (ImGui::Button(TR(i18n::keys::DIALOG_NO), button_size)) {
            ImGui::CloseCurrentPopup();
            m_controller.cancel_pending();
        }
        ImGui::EndPopup();
    }

    if (!open) {
        m_controller.cancel_pending();
    }
}

void MainWindow::render_edit_label_dialog() {
    auto& dialogs = m_controller.state().dialogs;
    const char* title = TR(i18n::keys::DIALOG_EDIT_LABEL_TITLE);

    if (!ImGui::IsPopupOpen(title)) {
        copy_to_buffer(m_rename_buffer, dialogs.target.label);
    }
    open_centered_popup(title);

    if (ImGui::BeginPopupModal(title, &dialogs.show_edit_label, ImGuiWindowFlags_AlwaysAutoResize)) {
        const float scale = m_controller.state().dpi_scale;

        if (ImGui::IsWindowAppearing()) {
            ImGui::SetKeyboardFocusHere();
        }
        ImGui::SetNextItemWidth(240.0f * scale);
        const bool submitted = ImGui::InputText("##new_label", m_rename_buffer.data(), m_rename_buffer.size(),
                                                ImGuiInputTextFlags_EnterReturnsTrue);

        // Existing labels fill the text field
        ImGui::SameLine();
        ImGui::SetNextItemWidth(ImGui::GetFrameHeight());
        if (ImGui::BeginCombo("##known_labels", nullptr, ImGuiComboFlags_NoPreview)) {
            for (const auto& label : m_controller.unique_labels()) {
                if (ImGui::Selectable(label.c_str(), label == m_rename_buffer.data())) {
                    copy_to_buffer(m_rename_buffer, label);
                }
            }
            ImGui::EndCombo();
        }
        ImGui::SameLine();
        ImGui::Text("%s", TR(i18n::keys::DIALOG_EDIT_LABEL_PROMPT));

        ImGui::Spacing();
        const ImVec2 button_size(120.0f * scale, 0);
        if (ImGui::Button(TR(i18n::keys::DIALOG_OK), button_size) || submitted) {
            m_controller.rename_target(m_rename_buffer.data());
            dialogs.show_edit_label = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button(TR(i18n::keys::DIALOG_CANCEL), button_size)) {
            dialogs.show_edit_label = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

void MainWindow::render_delete_dialog() {
    auto& dialogs = m_controller.state().dialogs;
    const char* title = TR(i18n::keys::DIALOG_DELETE_TITLE);
    open_centered_popup(title);

    if (ImGui::BeginPopupModal(title, &dialogs.show_delete, ImGuiWindowFlags_AlwaysAutoResize)) {
        const LabelTarget& target = dialogs.target;
        if (target.index) {
            ImGui::Text("%s", TRF(i18n::keys::DIALOG_DELETE_SINGLE, target.label).c_str());
        } else {
            ImGui::Text("%s", TRF(i18n::keys::DIALOG_DELETE_GROUP, target.count, target.label).c_str());
        }

        ImGui::Spacing();
        const ImVec2 button_size(120.0f * m_controller.state().dpi_scale, 0);
        if (ImGui::Button(TR(i18n::keys::DIALOG_YES), button_size)) {
            m_controller.delete_target();
            dialogs.show_delete = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button(TR(i18n::keys::DIALOG_NO), button_size)) {
            dialogs.show_delete = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

// =============================================================================
// Actions
// =============================================================================

void MainWindow::action_open_image() {
    m_controller.request([this]() {
        if (auto path = open_image_dialog(m_controller.state().settings.last_image_dir)) {
            m_controller.open_image(*path);
        }
    });
}

void MainWindow::action_open_directory() {
    m_controller.request([this]() {
        if (auto dir = pick_folder_dialog(m_controller.state().settings.last_dir)) {
            m_controller.open_directory(*dir);
        }
    });
}

void MainWindow::action_change_output_dir() {
    m_controller.request([this]() {
        if (auto dir = pick_folder_dialog(m_controller.state().settings.output_dir)) {
            m_controller.set_output_dir(*dir);
        }
    });
}

void MainWindow::action_save() {
    m_controller.save_annotations();
}

void MainWindow::action_previous() {
    m_controller.request([this]() { m_controller.previous_image(); });
}

void MainWindow::action_next() {
    m_controller.request([this]() { m_controller.next_image(); });
}

}  // namespace bba::gui
