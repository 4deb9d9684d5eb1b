/**
 * @file    render_backend.hpp
 * @brief   Render backend abstraction for the ImGui front end
 * @license MIT
 *
 * @details
 * The GUI talks to the GPU only through IRenderBackend: frame pacing,
 * the ImGui renderer binding, and RGBA texture upload for the annotation
 * canvas. OpenGL 3 is the only implementation.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

struct SDL_Window;

namespace bba::gui {

// =============================================================================
// Types
// =============================================================================

enum class BackendType {
    Auto,
    OpenGL
};

[[nodiscard]] constexpr std::string_view to_string(BackendType type) noexcept {
    switch (type) {
        case BackendType::Auto:   return "Auto";
        case BackendType::OpenGL: return "OpenGL";
        default:                  return "Unknown";
    }
}

enum class BackendError {
    None,
    NotInitialized,
    ContextCreationFailed,
    ImGuiInitFailed,
    InvalidTexture,
    TextureSizeMismatch
};

[[nodiscard]] constexpr std::string_view to_string(BackendError error) noexcept {
    switch (error) {
        case BackendError::None:                  return "None";
        case BackendError::NotInitialized:        return "NotInitialized";
        case BackendError::ContextCreationFailed: return "ContextCreationFailed";
        case BackendError::ImGuiInitFailed:       return "ImGuiInitFailed";
        case BackendError::InvalidTexture:        return "InvalidTexture";
        case BackendError::TextureSizeMismatch:   return "TextureSizeMismatch";
        default:                                  return "Unknown";
    }
}

enum class TextureFormat {
    RGBA8
};

struct TextureDesc {
    int width = 0;
    int height = 0;
    TextureFormat format = TextureFormat::RGBA8;
};

/**
 * Opaque texture handle; id 0 is the null handle
 */
struct TextureHandle {
    std::uint32_t id = 0;
    int width = 0;
    int height = 0;

    [[nodiscard]] bool valid() const noexcept { return id != 0; }
};

// =============================================================================
// Interface
// =============================================================================

class IRenderBackend {
public:
    virtual ~IRenderBackend() = default;

    [[nodiscard]] virtual BackendType type() const noexcept = 0;
    [[nodiscard]] virtual const char* name() const noexcept = 0;
    [[nodiscard]] virtual BackendError last_error() const noexcept = 0;

    // Lifecycle
    virtual bool init(SDL_Window* window) = 0;
    virtual void shutdown() = 0;

    // ImGui binding
    virtual bool imgui_init() = 0;
    virtual void imgui_shutdown() = 0;
    virtual void imgui_new_frame() = 0;
    virtual void imgui_render() = 0;

    // Frame
    virtual void begin_frame() = 0;
    virtual void end_frame() = 0;
    virtual void present() = 0;
    virtual void on_resize(int width, int height) = 0;

    // Textures
    [[nodiscard]] virtual TextureHandle create_texture(const TextureDesc& desc,
                                                       std::span<const std::uint8_t> data) = 0;
    virtual bool update_texture(TextureHandle& handle, std::span<const std::uint8_t> data) = 0;
    virtual void destroy_texture(TextureHandle& handle) = 0;
    [[nodiscard]] virtual void* get_imgui_texture_id(const TextureHandle& handle) const = 0;
};

/**
 * Create a backend of the requested type (Auto picks OpenGL)
 * @return nullptr if the type is not available in this build
 */
[[nodiscard]] std::unique_ptr<IRenderBackend> create_backend(BackendType type);

}  // namespace bba::gui
