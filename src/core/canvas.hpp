/**
 * @file    canvas.hpp
 * @brief   Raster host that drives a Viewport from pointer input
 * @license MIT
 *
 * @details
 * The Canvas is toolkit independent: the GUI layer translates its native
 * events into the small event structs below and uploads displayed() as a
 * texture whenever the content-changed observers fire.
 *
 *   Ctrl + wheel        zoom about the cursor (x1.1 / x0.9)
 *   Ctrl + left drag    pan, keeping the grabbed image point under the cursor
 */

#pragma once

#include "core/viewport.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace bba {

// =============================================================================
// Input events (display coordinates)
// =============================================================================

struct Modifiers {
    bool ctrl = false;
    bool shift = false;
    bool alt = false;
};

enum class MouseButton {
    None,
    Left,
    Right,
    Middle
};

struct WheelEvent {
    cv::Point2f pos;
    float delta = 0.0f;         // > 0 scrolls up / zooms in
    Modifiers mods;
};

struct PointerEvent {
    cv::Point2f pos;
    MouseButton button = MouseButton::None;
    Modifiers mods;
};

// =============================================================================
// Canvas
// =============================================================================

class Canvas {
public:
    using Observer = std::function<void()>;
    using ObserverId = std::size_t;

    static constexpr float kZoomInStep = 1.1f;
    static constexpr float kZoomOutStep = 0.9f;

    /**
     * @param size  Initial display size; the Viewport is created lazily
     *              with the size current at first use
     */
    explicit Canvas(cv::Size size = cv::Size(500, 500));
    virtual ~Canvas();

    // Non-copyable
    Canvas(const Canvas&) = delete;
    Canvas& operator=(const Canvas&) = delete;

    [[nodiscard]] Viewport& viewport();

    /**
     * Current raster, or a 500x500 black placeholder without one
     */
    [[nodiscard]] const cv::Mat& image() const noexcept;
    [[nodiscard]] bool has_image() const noexcept { return !m_image.empty(); }

    /**
     * Host a new raster (empty Mat clears). Re-fits the viewport, which
     * renders through the change notification.
     */
    void set_image(cv::Mat image);

    /**
     * Last rendered frame, RGBA8 of viewport size. Empty without an image.
     */
    [[nodiscard]] const cv::Mat& displayed() const noexcept { return m_displayed; }

    ObserverId subscribe_content_changed(Observer observer);
    void unsubscribe_content_changed(ObserverId id);

    /**
     * Crop/resize the raster through the viewport, decorate it and publish.
     * Errors propagate to the caller.
     */
    void render();

    // ==========================================================================
    // Input (return true when the event was consumed)
    // ==========================================================================

    virtual bool on_wheel(const WheelEvent& event);
    virtual bool on_pointer_press(const PointerEvent& event);
    virtual bool on_pointer_move(const PointerEvent& event);
    virtual bool on_pointer_release(const PointerEvent& event);

    void on_resize(cv::Size size);

    [[nodiscard]] bool is_panning() const noexcept { return m_pan_anchor.has_value(); }

protected:
    /**
     * Draw on top of the viewport-sized BGR frame before publishing
     */
    virtual void decorate(cv::Mat& frame);

private:
    cv::Size m_size;
    std::unique_ptr<Viewport> m_viewport;
    cv::Mat m_image;
    cv::Mat m_displayed;
    std::optional<cv::Point2f> m_pan_anchor;     // Image point grabbed for panning

    std::vector<std::pair<ObserverId, Observer>> m_observers;
    ObserverId m_next_observer_id{1};

    void notify_content_changed();
};

}  // namespace bba
