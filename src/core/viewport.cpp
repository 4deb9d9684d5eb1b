/**
 * @file    viewport.cpp
 * @brief   Viewport transform, clamping and crop-resize-pad rendering
 * @license MIT
 */

#include "core/viewport.hpp"
#include "core/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace bba {

namespace {

// Lower bound on zoom-out for images that already fit the display
constexpr double kMinZoomScale = 0.01;

// Values this close to an integer are treated as that integer before
// truncation, so 999.9999999 from 800 / 0.8 becomes 1000
constexpr double kSnapEpsilon = 1e-6;

[[nodiscard]] int snap_trunc(double v) noexcept {
    const double r = std::round(v);
    if (std::abs(v - r) < kSnapEpsilon) {
        return static_cast<int>(r);
    }
    return static_cast<int>(v);
}

[[nodiscard]] int floor_half(int v) noexcept {
    return static_cast<int>(std::floor(static_cast<double>(v) / 2.0));
}

/**
 * Largest aspect-preserving size of @p src that fits in @p dst,
 * truncated to whole pixels (never below 1x1)
 */
[[nodiscard]] cv::Size fit_target(double src_w, double src_h, cv::Size dst) noexcept {
    const double scale = std::min(dst.width / src_w, dst.height / src_h);
    return {
        std::max(1, snap_trunc(src_w * scale)),
        std::max(1, snap_trunc(src_h * scale))
    };
}

void require_finite(cv::Point2f p, const char* what) {
    if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
        throw PreconditionError(fmt::format("{} must have finite coordinates, got ({}, {})",
                                            what, p.x, p.y));
    }
}

void require_positive(cv::Size size) {
    if (size.width <= 0 || size.height <= 0) {
        throw PreconditionError(fmt::format("Viewport size must be positive, got {}x{}",
                                            size.width, size.height));
    }
}

void require_color(cv::Scalar color) {
    for (int i = 0; i < 3; ++i) {
        if (!(color[i] >= 0.0 && color[i] <= 255.0)) {
            throw PreconditionError(fmt::format(
                "Background color components must be in [0, 255], got ({}, {}, {})",
                color[0], color[1], color[2]));
        }
    }
}

}  // anonymous namespace

// =============================================================================
// Construction / Notification
// =============================================================================

Viewport::Viewport(cv::Size size, cv::Scalar bg_color)
    : m_size(size)
    , m_bg_color(bg_color)
{
    require_positive(size);
    require_color(bg_color);
}

Viewport::ObserverId Viewport::subscribe(Observer observer) {
    const ObserverId id = m_next_observer_id++;
    m_observers.emplace_back(id, std::move(observer));
    return id;
}

void Viewport::unsubscribe(ObserverId id) {
    m_observers.erase(
        std::remove_if(m_observers.begin(), m_observers.end(),
                       [id](const auto& entry) { return entry.first == id; }),
        m_observers.end());
}

void Viewport::notify() {
    // Copy: an observer may unsubscribe while being called
    auto observers = m_observers;
    for (auto& [id, observer] : observers) {
        observer();
    }
}

// =============================================================================
// Properties
// =============================================================================

void Viewport::set_size(cv::Size size) {
    require_positive(size);
    if (size == m_size) return;

    m_size = size;
    if (has_image()) {
        m_zoom_scale = std::min(*m_zoom_scale, max_zoom_scale());
        clamp_offset();
    }
    notify();
}

void Viewport::set_bg_color(cv::Scalar color) {
    require_color(color);
    if (color == m_bg_color) return;

    m_bg_color = color;
    notify();
}

void Viewport::require_image(const char* operation) const {
    if (!m_canvas_size || !m_zoom_scale || !m_offset) {
        throw PreconditionError(fmt::format(
            "Cannot {} before setting up the canvas for an image", operation));
    }
}

cv::Size Viewport::canvas_size() const {
    require_image("access canvas size");
    return *m_canvas_size;
}

double Viewport::zoom_scale() const {
    require_image("access zoom scale");
    return *m_zoom_scale;
}

double Viewport::base_zoom_scale() const {
    require_image("access base zoom scale");
    return *m_base_zoom_scale;
}

cv::Point Viewport::offset() const {
    require_image("access offset");
    return *m_offset;
}

// =============================================================================
// Setup
// =============================================================================

void Viewport::setup_canvas_for_image(std::optional<cv::Size> image_size) {
    if (!image_size) {
        m_canvas_size.reset();
        m_zoom_scale.reset();
        m_base_zoom_scale.reset();
        m_offset.reset();
        spdlog::debug("[Viewport] Detached image");
        notify();
        return;
    }

    if (image_size->width <= 0 || image_size->height <= 0) {
        throw GeometryError(fmt::format("Cannot attach an image of size {}x{}",
                                        image_size->width, image_size->height));
    }

    const double vw = m_size.width;
    const double vh = m_size.height;
    const double iw = image_size->width;
    const double ih = image_size->height;

    m_canvas_size = *image_size;
    m_zoom_scale = std::min(vw / iw, vh / ih);
    m_base_zoom_scale = m_zoom_scale;
    m_offset = cv::Point(image_size->width / 2, image_size->height / 2);

    spdlog::debug("[Viewport] Canvas {}x{} in {}x{}, fit zoom {:.4f}",
                  image_size->width, image_size->height,
                  m_size.width, m_size.height, *m_zoom_scale);
    notify();
}

void Viewport::setup_canvas_for_image(const cv::Mat& image) {
    if (image.empty()) {
        setup_canvas_for_image(std::optional<cv::Size>{});
    } else {
        setup_canvas_for_image(std::optional<cv::Size>{image.size()});
    }
}

void Viewport::fit_to_window() {
    require_image("fit to window");
    setup_canvas_for_image(std::optional<cv::Size>{*m_canvas_size});
}

// =============================================================================
// Transform
// =============================================================================

Box Viewport::roi() const {
    require_image("compute the region of interest");

    const cv::Size canvas = *m_canvas_size;
    const double zs = *m_zoom_scale;
    const cv::Point offset = *m_offset;

    int roi_x = snap_trunc(offset.x - m_size.width / (2.0 * zs));
    int roi_y = snap_trunc(offset.y - m_size.height / (2.0 * zs));
    const int roi_w = std::min(snap_trunc(m_size.width / zs), canvas.width);
    const int roi_h = std::min(snap_trunc(m_size.height / zs), canvas.height);

    roi_x = std::max(0, std::min(roi_x, canvas.width - roi_w));
    roi_y = std::max(0, std::min(roi_y, canvas.height - roi_h));

    return Box(
        static_cast<float>(roi_x), static_cast<float>(roi_y),
        static_cast<float>(roi_x + roi_w), static_cast<float>(roi_y + roi_h)
    );
}

Viewport::Mapping Viewport::mapping() const {
    const Box region = roi();
    const cv::Size canvas = *m_canvas_size;

    Mapping m;
    m.roi_origin = cv::Point2d(region.p0.x, region.p0.y);
    m.eff = cv::Size2d(
        std::max(1.0, std::min<double>(region.width(), canvas.width - m.roi_origin.x)),
        std::max(1.0, std::min<double>(region.height(), canvas.height - m.roi_origin.y))
    );

    const cv::Size target = fit_target(m.eff.width, m.eff.height, m_size);
    m.factor = cv::Point2d(target.width / m.eff.width, target.height / m.eff.height);
    m.pad = cv::Point2d(floor_half(m_size.width - target.width),
                        floor_half(m_size.height - target.height));
    return m;
}

cv::Point2f Viewport::image_to_viewport_coords(cv::Point2f p, bool clamp) const {
    require_image("map image coordinates");
    require_finite(p, "Point");

    const Mapping m = mapping();
    double dx = p.x - m.roi_origin.x;
    double dy = p.y - m.roi_origin.y;
    if (clamp) {
        dx = std::clamp(dx, 0.0, m.eff.width);
        dy = std::clamp(dy, 0.0, m.eff.height);
    }

    return {
        static_cast<float>(dx * m.factor.x + m.pad.x),
        static_cast<float>(dy * m.factor.y + m.pad.y)
    };
}

cv::Point2f Viewport::viewport_to_image_coords(cv::Point2f p) const {
    require_image("map viewport coordinates");
    require_finite(p, "Point");

    const Mapping m = mapping();
    const double dx = std::clamp((p.x - m.pad.x) / m.factor.x, 0.0, m.eff.width);
    const double dy = std::clamp((p.y - m.pad.y) / m.factor.y, 0.0, m.eff.height);

    return {
        static_cast<float>(dx + m.roi_origin.x),
        static_cast<float>(dy + m.roi_origin.y)
    };
}

cv::Mat Viewport::crop_and_resize(const cv::Mat& image) const {
    require_image("crop and resize");
    if (image.empty()) {
        throw PreconditionError("Cannot crop and resize an empty image");
    }

    cv::Mat bgr;
    if (image.channels() == 1) {
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    } else {
        bgr = image;
    }

    cv::Mat result(m_size, CV_8UC3, m_bg_color);

    cv::Mat cropped = roi().crop(bgr);
    const cv::Size target = fit_target(cropped.cols, cropped.rows, m_size);

    cv::Mat resized;
    cv::resize(cropped, resized, target, 0, 0, cv::INTER_LINEAR);

    int pad_x = floor_half(m_size.width - resized.cols);
    int pad_y = floor_half(m_size.height - resized.rows);
    if (pad_x < 0 || pad_y < 0) {
        // Trim rounding excess instead of padding negative space
        const int x0 = std::max(0, -pad_x);
        const int y0 = std::max(0, -pad_y);
        const int w = std::min(m_size.width, resized.cols - x0);
        const int h = std::min(m_size.height, resized.rows - y0);
        resized = resized(cv::Rect(x0, y0, w, h));
        pad_x = std::max(0, pad_x);
        pad_y = std::max(0, pad_y);
    }

    resized.copyTo(result(cv::Rect(pad_x, pad_y, resized.cols, resized.rows)));
    return result;
}

// =============================================================================
// Navigation
// =============================================================================

void Viewport::zoom(double magnification, std::optional<cv::Point2f> center) {
    if (!(magnification > 0.0) || !std::isfinite(magnification)) {
        throw PreconditionError(fmt::format(
            "Magnification must be greater than 0, got {}", magnification));
    }
    if (magnification == 1.0) return;
    require_image("zoom");

    const cv::Point2f c = center.value_or(
        cv::Point2f(m_size.width / 2.0f, m_size.height / 2.0f));
    require_finite(c, "Zoom center");

    // Image point under the zoom center with the current transform
    const cv::Point2f anchor = viewport_to_image_coords(c);

    const double base = *m_base_zoom_scale;
    double zs = *m_zoom_scale * magnification;
    if (base < 1.0) {
        zs = std::max(zs, base);
    }
    zs = std::max(zs, std::min(base, kMinZoomScale));
    zs = std::min(zs, max_zoom_scale());

    m_zoom_scale = zs;
    m_offset = cv::Point(
        snap_trunc(anchor.x - (c.x - m_size.width / 2.0) / zs),
        snap_trunc(anchor.y - (c.y - m_size.height / 2.0) / zs)
    );
    clamp_offset();

    spdlog::debug("[Viewport] Zoom x{:.2f} -> {:.4f}, offset ({}, {})",
                  magnification, zs, m_offset->x, m_offset->y);
    notify();
}

double Viewport::max_zoom_scale() const {
    // At least one image pixel must stay visible on each axis
    return std::max(*m_base_zoom_scale,
                    static_cast<double>(std::min(m_size.width, m_size.height)));
}

void Viewport::clamp_offset() {
    if (!m_canvas_size || !m_zoom_scale || !m_offset) return;

    const cv::Size canvas = *m_canvas_size;
    const double zs = *m_zoom_scale;

    const int half_x = snap_trunc(m_size.width / (2.0 * zs));
    const int half_y = snap_trunc(m_size.height / (2.0 * zs));
    const int max_x = std::max(half_x, canvas.width - half_x);
    const int max_y = std::max(half_y, canvas.height - half_y);

    m_offset->x = std::clamp(m_offset->x, half_x, max_x);
    m_offset->y = std::clamp(m_offset->y, half_y, max_y);
}

void Viewport::set_offset(cv::Point2f value) {
    require_image("set offset");
    require_finite(value, "Offset");

    const cv::Size canvas = *m_canvas_size;
    const double zs = *m_zoom_scale;

    const double half_x = m_size.width / (2.0 * zs);
    const double half_y = m_size.height / (2.0 * zs);
    const double max_x = std::max(half_x, canvas.width - half_x);
    const double max_y = std::max(half_y, canvas.height - half_y);

    const cv::Point clamped(
        snap_trunc(std::clamp<double>(value.x, half_x, max_x)),
        snap_trunc(std::clamp<double>(value.y, half_y, max_y))
    );

    if (clamped != *m_offset) {
        m_offset = clamped;
        notify();
    }
}

void Viewport::pan(double dx, double dy) {
    require_image("pan");
    if (!std::isfinite(dx) || !std::isfinite(dy)) {
        throw PreconditionError(fmt::format("Pan delta must be finite, got ({}, {})", dx, dy));
    }

    const double zs = *m_zoom_scale;
    m_offset = cv::Point(
        snap_trunc(m_offset->x - dx / zs),
        snap_trunc(m_offset->y - dy / zs)
    );
    clamp_offset();
    notify();
}

}  // namespace bba
