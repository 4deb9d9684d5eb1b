/**
 * @file    viewport.hpp
 * @brief   Pan/zoom transform between a display surface and image space
 * @license MIT
 *
 * @details
 * The Viewport owns geometry only: the display size, the size of the
 * attached image (canvas), the cumulative zoom scale and the image-space
 * point shown at the display center. It never owns pixel data.
 *
 * Every state change notifies subscribers synchronously, before the
 * mutating call returns.
 */

#pragma once

#include "core/box.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace bba {

class Viewport {
public:
    using Observer = std::function<void()>;
    using ObserverId = std::size_t;

    /**
     * @param size      Display surface size in pixels (both > 0)
     * @param bg_color  BGR fill for letterbox padding
     */
    explicit Viewport(cv::Size size, cv::Scalar bg_color = cv::Scalar(0, 0, 0));

    // Non-copyable (observers capture owners)
    Viewport(const Viewport&) = delete;
    Viewport& operator=(const Viewport&) = delete;

    // ==========================================================================
    // Change notification
    // ==========================================================================

    ObserverId subscribe(Observer observer);
    void unsubscribe(ObserverId id);

    // ==========================================================================
    // Properties
    // ==========================================================================

    [[nodiscard]] cv::Size size() const noexcept { return m_size; }

    /**
     * Resize the display surface. Notifies only when the size changes.
     * @throws PreconditionError for a non-positive dimension
     */
    void set_size(cv::Size size);

    [[nodiscard]] cv::Scalar bg_color() const noexcept { return m_bg_color; }

    /**
     * @throws PreconditionError if a component is outside [0, 255]
     */
    void set_bg_color(cv::Scalar color);

    [[nodiscard]] bool has_image() const noexcept { return m_canvas_size.has_value(); }

    // The following throw PreconditionError before setup_canvas_for_image
    [[nodiscard]] cv::Size canvas_size() const;
    [[nodiscard]] double zoom_scale() const;
    [[nodiscard]] double base_zoom_scale() const;
    [[nodiscard]] cv::Point offset() const;

    // ==========================================================================
    // Setup
    // ==========================================================================

    /**
     * Attach image dimensions (or detach with std::nullopt).
     * Fits the whole image into the display and centers it.
     */
    void setup_canvas_for_image(std::optional<cv::Size> image_size);

    /**
     * Convenience overload: an empty Mat detaches
     */
    void setup_canvas_for_image(const cv::Mat& image);

    /**
     * Re-run the fit computation for the current canvas
     */
    void fit_to_window();

    // ==========================================================================
    // Transform
    // ==========================================================================

    /**
     * Visible image-space region, clamped to the canvas
     */
    [[nodiscard]] Box roi() const;

    /**
     * Image point to display pixel.
     * @param clamp  false lets the result fall outside the display, used for
     *               culling and drawing of partially visible geometry
     */
    [[nodiscard]] cv::Point2f image_to_viewport_coords(cv::Point2f p, bool clamp = true) const;

    /**
     * Display pixel to image point. Positions outside the drawn image snap
     * to its edge.
     */
    [[nodiscard]] cv::Point2f viewport_to_image_coords(cv::Point2f p) const;

    /**
     * Crop @p image to the ROI, fit it into the display preserving aspect
     * ratio and pad with the background color.
     * @return BGR raster of exactly size()
     * @throws GeometryError if the ROI crop is empty
     */
    [[nodiscard]] cv::Mat crop_and_resize(const cv::Mat& image) const;

    // ==========================================================================
    // Navigation
    // ==========================================================================

    /**
     * Zoom about a display point (default: display center).
     * magnification == 1 is a no-op.
     * @throws PreconditionError for magnification <= 0 or no image
     */
    void zoom(double magnification, std::optional<cv::Point2f> center = std::nullopt);

    /**
     * Move the view by a display-space delta. Content follows the pointer,
     * so the delta is subtracted from the offset.
     */
    void pan(double dx, double dy);

    /**
     * Set the image-space center directly. Notifies only if the clamped
     * integer offset changed.
     */
    void set_offset(cv::Point2f value);

private:
    struct Mapping {
        cv::Point2d roi_origin;
        cv::Size2d eff;      // actually sampled region after canvas clamping
        cv::Point2d factor;  // target / eff per axis
        cv::Point2d pad;
    };

    cv::Size m_size;
    cv::Scalar m_bg_color;

    std::optional<cv::Size> m_canvas_size;
    std::optional<double> m_zoom_scale;
    std::optional<double> m_base_zoom_scale;
    std::optional<cv::Point> m_offset;

    std::vector<std::pair<ObserverId, Observer>> m_observers;
    ObserverId m_next_observer_id{1};

    void require_image(const char* operation) const;
    [[nodiscard]] Mapping mapping() const;
    void clamp_offset();
    [[nodiscard]] double max_zoom_scale() const;
    void notify();
};

}  // namespace bba
