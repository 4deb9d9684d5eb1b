/**
 * @file    opengl_backend.cpp
 * @brief   OpenGL 3 render backend implementation
 * @license MIT
 */

#include "gui/backend/opengl_backend.hpp"

#include <SDL3/SDL_opengl.h>
#include <imgui.h>
#include <imgui_impl_opengl3.h>
#include <imgui_impl_sdl3.h>
#include <spdlog/spdlog.h>

#include <cstdint>

namespace bba::gui {

namespace {

constexpr float kClearColor[4] = {0.10f, 0.10f, 0.12f, 1.00f};

[[nodiscard]] std::size_t rgba_bytes(int width, int height) noexcept {
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u;
}

}  // anonymous namespace

std::unique_ptr<IRenderBackend> create_backend(BackendType type) {
    switch (type) {
        case BackendType::Auto:
        case BackendType::OpenGL:
            return std::make_unique<OpenGLBackend>();
    }
    return nullptr;
}

OpenGLBackend::~OpenGLBackend() {
    shutdown();
}

// =============================================================================
// Lifecycle
// =============================================================================

bool OpenGLBackend::init(SDL_Window* window) {
    m_window = window;

#if defined(__APPLE__)
    m_glsl_version = "#version 150";
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, SDL_GL_CONTEXT_FORWARD_COMPATIBLE_FLAG);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 2);
#else
    m_glsl_version = "#version 130";
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
#endif
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);
    SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 8);

    m_context = SDL_GL_CreateContext(window);
    if (!m_context) {
        spdlog::error("[OpenGL] Context creation failed: {}", SDL_GetError());
        m_last_error = BackendError::ContextCreationFailed;
        return false;
    }

    SDL_GL_MakeCurrent(window, m_context);
    SDL_GL_SetSwapInterval(1);

    spdlog::info("[OpenGL] {} ({})",
                 reinterpret_cast<const char*>(glGetString(GL_VERSION)),
                 reinterpret_cast<const char*>(glGetString(GL_RENDERER)));
    m_last_error = BackendError::None;
    return true;
}

void OpenGLBackend::shutdown() {
    if (m_context) {
        SDL_GL_DestroyContext(m_context);
        m_context = nullptr;
    }
    m_window = nullptr;
}

// =============================================================================
// ImGui binding
// =============================================================================

bool OpenGLBackend::imgui_init() {
    if (!m_context) {
        m_last_error = BackendError::NotInitialized;
        return false;
    }
    if (!ImGui_ImplSDL3_InitForOpenGL(m_window, m_context) ||
        !ImGui_ImplOpenGL3_Init(m_glsl_version)) {
        m_last_error = BackendError::ImGuiInitFailed;
        return false;
    }
    m_imgui_ready = true;
    return true;
}

void OpenGLBackend::imgui_shutdown() {
    if (!m_imgui_ready) return;
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    m_imgui_ready = false;
}

void OpenGLBackend::imgui_new_frame() {
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL3_NewFrame();
}

void OpenGLBackend::imgui_render() {
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

// =============================================================================
// Frame
// =============================================================================

void OpenGLBackend::begin_frame() {
    int w = 0;
    int h = 0;
    SDL_GetWindowSizeInPixels(m_window, &w, &h);
    glViewport(0, 0, w, h);
    glClearColor(kClearColor[0], kClearColor[1], kClearColor[2], kClearColor[3]);
    glClear(GL_COLOR_BUFFER_BIT);
}

void OpenGLBackend::end_frame() {
}

void OpenGLBackend::present() {
    SDL_GL_SwapWindow(m_window);
}

void OpenGLBackend::on_resize(int width, int height) {
    // The viewport is set per frame from the drawable size
    spdlog::debug("[OpenGL] Resize {}x{}", width, height);
}

// =============================================================================
// Textures
// =============================================================================

TextureHandle OpenGLBackend::create_texture(const TextureDesc& desc,
                                            std::span<const std::uint8_t> data) {
    if (!m_context) {
        m_last_error = BackendError::NotInitialized;
        return {};
    }
    if (desc.width <= 0 || desc.height <= 0 || data.size() < rgba_bytes(desc.width, desc.height)) {
        m_last_error = BackendError::TextureSizeMismatch;
        return {};
    }

    GLuint id = 0;
    glGenTextures(1, &id);
    glBindTexture(GL_TEXTURE_2D, id);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, desc.width, desc.height, 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, data.data());
    glBindTexture(GL_TEXTURE_2D, 0);

    m_last_error = BackendError::None;
    return TextureHandle{static_cast<std::uint32_t>(id), desc.width, desc.height};
}

bool OpenGLBackend::update_texture(TextureHandle& handle, std::span<const std::uint8_t> data) {
    if (!handle.valid()) {
        m_last_error = BackendError::InvalidTexture;
        return false;
    }
    if (data.size() < rgba_bytes(handle.width, handle.height)) {
        m_last_error = BackendError::TextureSizeMismatch;
        return false;
    }

    glBindTexture(GL_TEXTURE_2D, static_cast<GLuint>(handle.id));
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, handle.width, handle.height,
                    GL_RGBA, GL_UNSIGNED_BYTE, data.data());
    glBindTexture(GL_TEXTURE_2D, 0);
    return true;
}

void OpenGLBackend::destroy_texture(TextureHandle& handle) {
    if (!handle.valid()) return;
    auto id = static_cast<GLuint>(handle.id);
    glDeleteTextures(1, &id);
    handle = TextureHandle{};
}

void* OpenGLBackend::get_imgui_texture_id(const TextureHandle& handle) const {
    if (!handle.valid()) return nullptr;
    return reinterpret_cast<void*>(static_cast<std::uintptr_t>(handle.id));
}

}  // namespace bba::gui
