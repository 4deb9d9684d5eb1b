/**
 * @file    overlay_renderer.hpp
 * @brief   Draws annotation boxes, labels and handles onto a viewport frame
 * @license MIT
 */

#pragma once

#include "core/annotation.hpp"
#include "core/settings.hpp"
#include "core/viewport.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace bba {

/**
 * Presentation state for one overlay pass
 */
struct OverlayScene {
    const Annotations* annotations = nullptr;

    std::optional<size_t> selected_index;
    std::string selected_label;
    bool group_mode = false;        // Highlight by label instead of index
    bool edit_mode = false;         // Draw handles

    // Box shown in place of one annotation while it is dragged
    std::optional<size_t> drag_preview_index;
    std::optional<Box> drag_preview_box;

    // Box being drawn (start, end), drawn with selected_label
    std::optional<Box> drawing_preview;
};

class OverlayRenderer {
public:
    explicit OverlayRenderer(const Appearance& appearance);

    /**
     * Draw @p scene onto @p frame (BGR, viewport sized).
     * Boxes entirely outside the frame are skipped; partially visible ones
     * are drawn at full extent and cut off by the frame bounds.
     * @return number of boxes drawn
     */
    size_t render(cv::Mat& frame, const Viewport& viewport, const OverlayScene& scene) const;

private:
    const Appearance& m_appearance;

    void draw_handles(cv::Mat& frame, cv::Point tl, cv::Point br, const cv::Scalar& color) const;
};

}  // namespace bba
