/**
 * @file    canvas.cpp
 * @brief   Canvas rendering and pan/zoom input handling
 * @license MIT
 */

#include "core/canvas.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace bba {

Canvas::Canvas(cv::Size size)
    : m_size(size)
{
}

Canvas::~Canvas() = default;

Viewport& Canvas::viewport() {
    if (!m_viewport) {
        m_viewport = std::make_unique<Viewport>(m_size, cv::Scalar(0, 0, 0));
        m_viewport->subscribe([this]() { render(); });
        spdlog::debug("[Canvas] Viewport created at {}x{}", m_size.width, m_size.height);
    }
    return *m_viewport;
}

const cv::Mat& Canvas::image() const noexcept {
    static const cv::Mat placeholder = cv::Mat::zeros(500, 500, CV_8UC3);
    return m_image.empty() ? placeholder : m_image;
}

void Canvas::set_image(cv::Mat image) {
    m_image = std::move(image);
    m_pan_anchor.reset();
    viewport().setup_canvas_for_image(m_image);
}

Canvas::ObserverId Canvas::subscribe_content_changed(Observer observer) {
    const ObserverId id = m_next_observer_id++;
    m_observers.emplace_back(id, std::move(observer));
    return id;
}

void Canvas::unsubscribe_content_changed(ObserverId id) {
    m_observers.erase(
        std::remove_if(m_observers.begin(), m_observers.end(),
                       [id](const auto& entry) { return entry.first == id; }),
        m_observers.end());
}

void Canvas::notify_content_changed() {
    auto observers = m_observers;
    for (auto& [id, observer] : observers) {
        observer();
    }
}

void Canvas::decorate(cv::Mat& /*frame*/) {
}

void Canvas::render() {
    if (m_image.empty()) {
        m_displayed.release();
        notify_content_changed();
        return;
    }

    cv::Mat frame = viewport().crop_and_resize(m_image);
    decorate(frame);
    cv::cvtColor(frame, m_displayed, cv::COLOR_BGR2RGBA);
    notify_content_changed();
}

// =============================================================================
// Input
// =============================================================================

bool Canvas::on_wheel(const WheelEvent& event) {
    if (!has_image() || !event.mods.ctrl || event.delta == 0.0f) {
        return false;
    }

    const float step = event.delta > 0.0f ? kZoomInStep : kZoomOutStep;
    viewport().zoom(step, event.pos);
    return true;
}

bool Canvas::on_pointer_press(const PointerEvent& event) {
    if (!has_image() || event.button != MouseButton::Left || !event.mods.ctrl) {
        return false;
    }

    m_pan_anchor = viewport().viewport_to_image_coords(event.pos);
    return true;
}

bool Canvas::on_pointer_move(const PointerEvent& event) {
    if (!m_pan_anchor || !has_image()) {
        return false;
    }

    Viewport& vp = viewport();
    const auto zs = static_cast<float>(vp.zoom_scale());
    const cv::Point2f half(vp.size().width / 2.0f, vp.size().height / 2.0f);
    vp.set_offset(*m_pan_anchor - (event.pos - half) * (1.0f / zs));
    return true;
}

bool Canvas::on_pointer_release(const PointerEvent& event) {
    if (event.button != MouseButton::Left || !m_pan_anchor) {
        return false;
    }
    m_pan_anchor.reset();
    return true;
}

void Canvas::on_resize(cv::Size size) {
    if (size.width <= 0 || size.height <= 0) {
        return;
    }
    m_size = size;
    if (m_viewport) {
        m_viewport->set_size(size);
    }
}

}  // namespace bba
