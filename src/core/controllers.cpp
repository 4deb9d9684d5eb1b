/**
 * @file    controllers.cpp
 * @brief   Drawing and editing controllers
 * @license MIT
 */

#include "core/controllers.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cmath>
#include <cstdlib>

namespace bba {

namespace {

int floor_div2(int v) noexcept {
    return static_cast<int>(std::floor(v / 2.0));
}

}  // anonymous namespace

// =============================================================================
// DrawingController
// =============================================================================

void DrawingController::start(cv::Point point) {
    m_drawing = true;
    m_start = point;
    m_end = point;
}

bool DrawingController::update(cv::Point point) {
    if (!m_drawing) return false;
    m_end = point;
    return true;
}

std::optional<Annotation> DrawingController::finish(cv::Point point, const std::string& label) {
    if (!m_drawing || label.empty()) {
        m_drawing = false;
        return std::nullopt;
    }

    m_drawing = false;
    m_end = point;

    const Box box = Box(cv::Point2f(m_start), cv::Point2f(m_end)).normalized();
    spdlog::info("[DrawingController] Created bbox [{}, {}, {}, {}] with label '{}'",
                 box.p0.x, box.p0.y, box.p1.x, box.p1.y, label);
    return Annotation(label, box);
}

void DrawingController::cancel() noexcept {
    m_drawing = false;
}

std::optional<Box> DrawingController::current_box() const {
    if (!m_drawing) return std::nullopt;
    return Box(cv::Point2f(m_start), cv::Point2f(m_end));
}

// =============================================================================
// EditingController
// =============================================================================

const char* to_string(Handle handle) noexcept {
    switch (handle) {
        case Handle::TopLeft:     return "top-left";
        case Handle::TopRight:    return "top-right";
        case Handle::BottomRight: return "bottom-right";
        case Handle::BottomLeft:  return "bottom-left";
        case Handle::Center:      return "center";
    }
    return "unknown";
}

EditingController::EditingController(int tolerance)
    : m_tolerance(tolerance)
{
}

std::optional<HandleSelection> EditingController::find_control_point(
    cv::Point click, const Annotations& annotations) const
{
    for (size_t i = 0; i < annotations.size(); ++i) {
        const Box box = annotations[i].box();
        const int x1 = static_cast<int>(box.p0.x);
        const int y1 = static_cast<int>(box.p0.y);
        const int x2 = static_cast<int>(box.p1.x);
        const int y2 = static_cast<int>(box.p1.y);

        const std::array<cv::Point, 5> points = {
            cv::Point(x1, y1),
            cv::Point(x2, y1),
            cv::Point(x2, y2),
            cv::Point(x1, y2),
            cv::Point(floor_div2(x1 + x2), floor_div2(y1 + y2))
        };

        for (size_t h = 0; h < points.size(); ++h) {
            if (std::abs(points[h].x - click.x) <= m_tolerance &&
                std::abs(points[h].y - click.y) <= m_tolerance) {
                return HandleSelection{i, static_cast<Handle>(h)};
            }
        }
    }
    return std::nullopt;
}

bool EditingController::start(cv::Point point, std::optional<HandleSelection> selection) {
    if (!selection) return false;

    m_dragging = true;
    m_drag_start = point;
    m_selection = selection;
    return true;
}

std::optional<BoxEdit> EditingController::update(cv::Point point, const Annotations& annotations) {
    if (!m_dragging || !m_selection) return std::nullopt;
    if (m_selection->index >= annotations.size()) return std::nullopt;

    const Box box = annotations[m_selection->index].box();
    float x1 = box.p0.x;
    float y1 = box.p0.y;
    float x2 = box.p1.x;
    float y2 = box.p1.y;

    const auto px = static_cast<float>(point.x);
    const auto py = static_cast<float>(point.y);

    switch (m_selection->handle) {
        case Handle::Center: {
            const auto dx = static_cast<float>(point.x - m_drag_start.x);
            const auto dy = static_cast<float>(point.y - m_drag_start.y);
            x1 += dx; x2 += dx;
            y1 += dy; y2 += dy;
            break;
        }
        case Handle::TopLeft:     x1 = px; y1 = py; break;
        case Handle::TopRight:    x2 = px; y1 = py; break;
        case Handle::BottomRight: x2 = px; y2 = py; break;
        case Handle::BottomLeft:  x1 = px; y2 = py; break;
    }

    // Dragging a corner past its opposite flips the box; normalize back
    const BoxEdit edit{m_selection->index, Box(x1, y1, x2, y2).normalized()};
    m_drag_start = point;
    return edit;
}

void EditingController::finish() {
    if (m_dragging && m_selection) {
        if (m_selection->handle == Handle::Center) {
            spdlog::info("[EditingController] Moved bbox {} by dragging center point",
                         m_selection->index);
        } else {
            spdlog::info("[EditingController] Resized bbox {} by dragging {} point",
                         m_selection->index, to_string(m_selection->handle));
        }
    }
    cancel();
}

void EditingController::cancel() noexcept {
    m_dragging = false;
    m_drag_start = cv::Point(0, 0);
    m_selection.reset();
}

}  // namespace bba
