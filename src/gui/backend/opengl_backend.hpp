/**
 * @file    opengl_backend.hpp
 * @brief   OpenGL 3 render backend (SDL3 GL context + imgui_impl_opengl3)
 * @license MIT
 */

#pragma once

#include "gui/backend/render_backend.hpp"

#include <SDL3/SDL.h>

namespace bba::gui {

class OpenGLBackend final : public IRenderBackend {
public:
    OpenGLBackend() = default;
    ~OpenGLBackend() override;

    // Non-copyable (owns the GL context)
    OpenGLBackend(const OpenGLBackend&) = delete;
    OpenGLBackend& operator=(const OpenGLBackend&) = delete;

    [[nodiscard]] BackendType type() const noexcept override { return BackendType::OpenGL; }
    [[nodiscard]] const char* name() const noexcept override { return "OpenGL 3"; }
    [[nodiscard]] BackendError last_error() const noexcept override { return m_last_error; }

    bool init(SDL_Window* window) override;
    void shutdown() override;

    bool imgui_init() override;
    void imgui_shutdown() override;
    void imgui_new_frame() override;
    void imgui_render() override;

    void begin_frame() override;
    void end_frame() override;
    void present() override;
    void on_resize(int width, int height) override;

    [[nodiscard]] TextureHandle create_texture(const TextureDesc& desc,
                                               std::span<const std::uint8_t> data) override;
    bool update_texture(TextureHandle& handle, std::span<const std::uint8_t> data) override;
    void destroy_texture(TextureHandle& handle) override;
    [[nodiscard]] void* get_imgui_texture_id(const TextureHandle& handle) const override;

private:
    SDL_Window* m_window{nullptr};
    SDL_GLContext m_context{nullptr};
    const char* m_glsl_version{"#version 130"};
    bool m_imgui_ready{false};
    BackendError m_last_error{BackendError::None};
};

}  // namespace bba::gui
