/**
 * @file    gui_app.cpp
 * @brief   GUI Application Entry Point Implementation
 * @license MIT
 */

// Must be defined before any Windows headers (including those from SDL/ImGui)
#ifdef _WIN32
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#endif

#include "gui/gui_app.hpp"
#include "gui/backend/render_backend.hpp"
#include "gui/app/app_controller.hpp"
#include "gui/widgets/main_window.hpp"
#include "gui/resources/style.hpp"
#include "core/image_source.hpp"
#include "core/settings.hpp"
#include "i18n/i18n.hpp"
#include "utils/logging.hpp"
#include "utils/path_formatter.hpp"

#include <SDL3/SDL.h>
#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <implot.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace bba::gui {

namespace {

namespace fs = std::filesystem;

// Window settings
constexpr int kDefaultWidth = 1400;
constexpr int kDefaultHeight = 900;
constexpr int kMinWidth = 960;
constexpr int kMinHeight = 640;

// Entries kept for the log viewer
constexpr size_t kLogRingSize = 1000;

constexpr float kBaseFontSize = 16.0f;

/**
 * Candidate UI fonts with CJK coverage, most preferred first
 */
std::vector<std::string> font_candidates() {
#ifdef _WIN32
    std::string fonts_dir = "C:\\Windows\\Fonts\\";
    char* buf = nullptr;
    size_t size = 0;
    if (_dupenv_s(&buf, &size, "WINDIR") == 0 && buf != nullptr) {
        fonts_dir = std::string(buf) + "\\Fonts\\";
        free(buf);
    }
    return {
        fonts_dir + "NotoSansCJK-Regular.ttc",
        fonts_dir + "msyh.ttc",
        fonts_dir + "msjh.ttc",
        fonts_dir + "segoeui.ttf",
    };
#elif __APPLE__
    return {
        "/opt/homebrew/share/fonts/NotoSansCJK-Regular.ttc",
        "/usr/local/share/fonts/NotoSansCJK-Regular.ttc",
        "/System/Library/Fonts/PingFang.ttc",
        "/System/Library/Fonts/SFNS.ttf",
    };
#else
    return {
        "/usr/share/fonts/opentype/noto/NotoSansCJK-Regular.ttc",
        "/usr/share/fonts/noto-cjk/NotoSansCJK-Regular.ttc",
        "/usr/share/fonts/google-noto-cjk/NotoSansCJK-Regular.ttc",
        "/usr/share/fonts/truetype/wqy/wqy-microhei.ttc",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    };
#endif
}

void load_fonts(ImGuiIO& io, float dpi_scale, float fb_scale) {
    float font_size = kBaseFontSize * dpi_scale * fb_scale;

    io.Fonts->Clear();

    ImFontConfig font_config;
    font_config.OversampleH = 2;
    font_config.OversampleV = 1;
    font_config.PixelSnapH = true;

    // Latin plus both Chinese scripts for the translated UI
    static const ImWchar glyph_ranges[] = {
        0x0020, 0x00FF,
        0x2000, 0x206F,
        0x3000, 0x30FF,
        0xFF00, 0xFFEF,
        0x4E00, 0x9FAF,
        0x3400, 0x4DBF,
        0,
    };

    ImFont* loaded_font = nullptr;
    std::error_code ec;
    for (const auto& path : font_candidates()) {
        if (!fs::exists(path, ec)) continue;

        // Vector fonts read small next to the pixel default
        const float size = font_size + 2.0f * dpi_scale * fb_scale;
        font_config.SizePixels = size;
        loaded_font = io.Fonts->AddFontFromFileTTF(path.c_str(), size, &font_config, glyph_ranges);
        if (loaded_font) {
            spdlog::info("[GUI] Loaded font: {}", path);
            break;
        }
        spdlog::warn("[GUI] Failed to load font: {}", path);
    }

    if (!loaded_font) {
        spdlog::warn("[GUI] No CJK font found, using the default font");
        font_config.SizePixels = font_size;
        io.Fonts->AddFontDefault(&font_config);
    }
    io.Fonts->Build();

    // Atlas is rasterized at framebuffer resolution; layout stays in points
    if (fb_scale > 1.0f) {
        io.FontGlobalScale = 1.0f / fb_scale;
    }
}

/**
 * Clamp the window between the minimum size and the display's usable area
 */
void fit_window_to_display(SDL_Window* window) {
    int effective_min_w = kMinWidth;
    int effective_min_h = kMinHeight;

    SDL_DisplayID display = SDL_GetDisplayForWindow(window);
    SDL_Rect bounds;
    if (display != 0 && SDL_GetDisplayUsableBounds(display, &bounds)) {
        const int screen_max_w = static_cast<int>(bounds.w * 0.95f);
        const int screen_max_h = static_cast<int>(bounds.h * 0.95f);
        effective_min_w = std::min(kMinWidth, screen_max_w);
        effective_min_h = std::min(kMinHeight, screen_max_h);

        int current_w = 0;
        int current_h = 0;
        SDL_GetWindowSize(window, &current_w, &current_h);

        // Minimum first; SDL enforces it on SetWindowSize
        SDL_SetWindowMinimumSize(window, effective_min_w, effective_min_h);
        SDL_SetWindowSize(window,
                          std::clamp(current_w, effective_min_w, screen_max_w),
                          std::clamp(current_h, effective_min_h, screen_max_h));
        SDL_SetWindowPosition(window, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED);
    } else {
        SDL_SetWindowMinimumSize(window, effective_min_w, effective_min_h);
    }

    spdlog::debug("[GUI] Window minimum size: {}x{}", effective_min_w, effective_min_h);
}

/**
 * Open the first positional argument naming a directory or a supported image
 */
void open_startup_path(AppController& controller, int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.empty() || arg[0] == '-') continue;

        const fs::path path = path_from_utf8(arg);
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            controller.open_directory(path);
            return;
        }
        if (ImageSource::is_supported_image(path) && fs::exists(path, ec)) {
            controller.open_image(path);
            return;
        }
        spdlog::warn("[GUI] Ignoring argument '{}': not a directory or supported image", arg);
    }
}

/**
 * One ImGui frame. Shared by the main loop and the live-resize watch.
 */
void render_frame(IRenderBackend& backend, MainWindow& main_window) {
    backend.begin_frame();
    backend.imgui_new_frame();
    ImGui::NewFrame();
    main_window.render();
    ImGui::Render();
    backend.imgui_render();
    backend.end_frame();
    backend.present();
}

}  // anonymous namespace

int run(int argc, char** argv) {
    logging::Options log_options;
#if defined(DEBUG) || defined(_DEBUG)
    log_options.console_level = spdlog::level::debug;
#endif
    log_options.ring_buffer_size = kLogRingSize;
    logging::init(log_options);

    spdlog::info("[GUI] Starting bbox-annotator v{}", APP_VERSION);

    const fs::path settings_path = default_settings_path();
    const Settings settings = load_settings(settings_path);

    // Initialize i18n; the controller switches to the saved language
    const auto lang_dir = i18n::find_lang_dir();
    if (i18n::init(lang_dir)) {
        spdlog::info("[GUI] i18n initialized from: {}", lang_dir);
    } else {
        spdlog::warn("[GUI] i18n initialization failed, using fallback strings");
    }

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        spdlog::error("[GUI] Failed to initialize SDL: {}", SDL_GetError());
        return 1;
    }

    auto backend = create_backend(BackendType::Auto);
    if (!backend) {
        spdlog::error("[GUI] Failed to create render backend");
        SDL_Quit();
        return 1;
    }

    SDL_WindowFlags window_flags = SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    if (backend->type() == BackendType::OpenGL) {
        window_flags |= SDL_WINDOW_OPENGL;
    }

    SDL_Window* window = SDL_CreateWindow("bbox-annotator", kDefaultWidth, kDefaultHeight, window_flags);
    if (!window) {
        spdlog::error("[GUI] Failed to create window: {}", SDL_GetError());
        SDL_Quit();
        return 1;
    }
    fit_window_to_display(window);

    if (!backend->init(window)) {
        spdlog::error("[GUI] Failed to initialize backend: {}", to_string(backend->last_error()));
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    spdlog::info("[GUI] Using render backend: {}", backend->name());

    // Setup ImGui context
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImPlot::CreateContext();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    // dpi_scale: system UI scaling. fb_scale: framebuffer pixel ratio (Retina).
    float dpi_scale = 1.0f;
    SDL_DisplayID display = SDL_GetDisplayForWindow(window);
    if (display != 0) {
        const float content_scale = SDL_GetDisplayContentScale(display);
        if (content_scale > 0.0f) {
            dpi_scale = content_scale;
        }
    }

    float fb_scale = 1.0f;
    {
        int win_w = 0, win_h = 0, pixel_w = 0, pixel_h = 0;
        SDL_GetWindowSize(window, &win_w, &win_h);
        SDL_GetWindowSizeInPixels(window, &pixel_w, &pixel_h);
        if (win_w > 0) {
            fb_scale = static_cast<float>(pixel_w) / static_cast<float>(win_w);
        }
    }
    spdlog::info("[GUI] DPI scale {:.2f}, framebuffer scale {:.2f}", dpi_scale, fb_scale);

    load_fonts(io, dpi_scale, fb_scale);

    ImGui::GetStyle().ScaleAllSizes(dpi_scale);
    apply_style(settings.appearance.theme);

    if (!backend->imgui_init()) {
        spdlog::error("[GUI] Failed to initialize ImGui backend: {}",
                      to_string(backend->last_error()));
        ImPlot::DestroyContext();
        ImGui::DestroyContext();
        backend->shutdown();
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    {
        AppController controller(*backend, settings_path);
        controller.state().dpi_scale = dpi_scale;
        MainWindow main_window(controller);

        struct RenderContext {
            IRenderBackend* backend;
            MainWindow* main_window;
        };
        RenderContext render_ctx{backend.get(), &main_window};

        // Keeps drawing while the OS runs a modal resize loop
        auto event_watch = [](void* userdata, SDL_Event* event) -> bool {
            auto* ctx = static_cast<RenderContext*>(userdata);
            if (event->type == SDL_EVENT_WINDOW_RESIZED ||
                event->type == SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED ||
                event->type == SDL_EVENT_WINDOW_EXPOSED) {
                if (event->type != SDL_EVENT_WINDOW_EXPOSED) {
                    ctx->backend->on_resize(event->window.data1, event->window.data2);
                }
                render_frame(*ctx->backend, *ctx->main_window);
            }
            return true;
        };
        SDL_AddEventWatch(event_watch, &render_ctx);

        open_startup_path(controller, argc, argv);

        std::string title;
        while (!main_window.should_quit()) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                ImGui_ImplSDL3_ProcessEvent(&event);

                switch (event.type) {
                    case SDL_EVENT_QUIT:
                        main_window.request_quit();
                        break;

                    case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                        if (event.window.windowID == SDL_GetWindowID(window)) {
                            main_window.request_quit();
                        }
                        break;

                    case SDL_EVENT_WINDOW_RESIZED:
                    case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
                        backend->on_resize(event.window.data1, event.window.data2);
                        break;

                    default:
                        main_window.handle_event(event);
                        break;
                }
            }

            const std::string new_title = controller.window_title();
            if (new_title != title) {
                title = new_title;
                SDL_SetWindowTitle(window, title.c_str());
            }

            render_frame(*backend, main_window);
        }

        SDL_RemoveEventWatch(event_watch, &render_ctx);
    }

    spdlog::info("[GUI] Shutting down...");

    backend->imgui_shutdown();
    ImPlot::DestroyContext();
    ImGui::DestroyContext();

    backend->shutdown();
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}

}  // namespace bba::gui
