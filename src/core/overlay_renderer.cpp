/**
 * @file    overlay_renderer.cpp
 * @brief   Annotation overlay drawing with visibility culling
 * @license MIT
 */

#include "core/overlay_renderer.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace bba {

namespace {

struct OverlayItem {
    int index;              // -1 for the drawing preview
    std::string label;
    Box box;                // Integer image coordinates, normalized for the preview
};

int floor_div2(int v) noexcept {
    return static_cast<int>(std::floor(v / 2.0));
}

Box truncated(const Box& box) {
    return Box(std::trunc(box.p0.x), std::trunc(box.p0.y),
               std::trunc(box.p1.x), std::trunc(box.p1.y));
}

}  // anonymous namespace

OverlayRenderer::OverlayRenderer(const Appearance& appearance)
    : m_appearance(appearance)
{
}

size_t OverlayRenderer::render(cv::Mat& frame, const Viewport& viewport,
                               const OverlayScene& scene) const {
    std::vector<OverlayItem> items;

    if (scene.annotations) {
        const auto& annotations = *scene.annotations;
        items.reserve(annotations.size() + 1);
        for (size_t i = 0; i < annotations.size(); ++i) {
            Box box = annotations[i].box();
            if (scene.drag_preview_index == i && scene.drag_preview_box) {
                box = *scene.drag_preview_box;
            }
            items.push_back({static_cast<int>(i), annotations[i].label, truncated(box)});
        }
    }

    if (scene.drawing_preview) {
        items.push_back({-1, scene.selected_label, truncated(scene.drawing_preview->normalized())});
    }

    const cv::Scalar box_color = hex_to_bgr(m_appearance.bbox_color);
    const cv::Scalar selected_color = hex_to_bgr(m_appearance.bbox_selected_color);
    const cv::Scalar label_color = hex_to_bgr(m_appearance.label_color);
    const cv::Scalar handle_color = hex_to_bgr(m_appearance.points_color);
    const int line_width = m_appearance.bbox_line_width;
    const double label_scale = m_appearance.label_font_size / 24.0;
    const int label_thickness = std::max(1, line_width / 2);

    const float w = static_cast<float>(frame.cols);
    const float h = static_cast<float>(frame.rows);

    size_t drawn = 0;
    for (const auto& item : items) {
        const cv::Point2f a = viewport.image_to_viewport_coords(item.box.p0, false);
        const cv::Point2f b = viewport.image_to_viewport_coords(item.box.p1, false);

        float vx1 = a.x, vy1 = a.y, vx2 = b.x, vy2 = b.y;
        if (vx1 > vx2) std::swap(vx1, vx2);
        if (vy1 > vy2) std::swap(vy1, vy2);

        // No intersection with the frame
        if (vx2 < 0.0f || vy2 < 0.0f || vx1 > w || vy1 > h) {
            continue;
        }

        const cv::Point tl(static_cast<int>(vx1), static_cast<int>(vy1));
        const cv::Point br(static_cast<int>(vx2), static_cast<int>(vy2));

        // The in-progress drawing (index -1) is never highlighted
        const bool highlighted = item.index >= 0 && (scene.group_mode
            ? item.label == scene.selected_label
            : scene.selected_index == static_cast<size_t>(item.index));

        cv::rectangle(frame, tl, br, highlighted ? selected_color : box_color, line_width);

        if (!item.label.empty()) {
            cv::putText(frame, item.label, cv::Point(tl.x, tl.y - 5),
                        cv::FONT_HERSHEY_SIMPLEX, label_scale, label_color,
                        label_thickness, cv::LINE_AA);
        }

        if (scene.edit_mode && item.index >= 0) {
            draw_handles(frame, tl, br, handle_color);
        }
        ++drawn;
    }
    return drawn;
}

void OverlayRenderer::draw_handles(cv::Mat& frame, cv::Point tl, cv::Point br,
                                   const cv::Scalar& color) const {
    const int size = m_appearance.points_size;
    const int half = size / 2;

    const cv::Point corners[] = {
        tl, cv::Point(br.x, tl.y), br, cv::Point(tl.x, br.y)
    };
    for (const auto& c : corners) {
        cv::rectangle(frame, cv::Point(c.x - half, c.y - half), cv::Point(c.x + half, c.y + half),
                      color, cv::FILLED);
    }

    const cv::Point center(floor_div2(tl.x + br.x), floor_div2(tl.y + br.y));
    cv::circle(frame, center, std::max(1, half), color, cv::FILLED);
}

}  // namespace bba
