/**
 * @file    box.cpp
 * @brief   Box geometry and raster cropping
 * @license MIT
 */

#include "core/box.hpp"
#include "core/errors.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace bba {

Box Box::normalized() const noexcept {
    return Box(
        std::min(p0.x, p1.x), std::min(p0.y, p1.y),
        std::max(p0.x, p1.x), std::max(p0.y, p1.y)
    );
}

cv::Mat Box::crop(const cv::Mat& image) const {
    const int x0 = static_cast<int>(p0.x);
    const int y0 = static_cast<int>(p0.y);
    const int x1 = static_cast<int>(p1.x);
    const int y1 = static_cast<int>(p1.y);

    // Clip to raster bounds the way array slicing does
    const int xmin = std::clamp(std::min(x0, x1), 0, image.cols);
    const int xmax = std::clamp(std::max(x0, x1), 0, image.cols);
    const int ymin = std::clamp(std::min(y0, y1), 0, image.rows);
    const int ymax = std::clamp(std::max(y0, y1), 0, image.rows);

    if (xmax <= xmin || ymax <= ymin) {
        throw GeometryError(fmt::format(
            "Attempted to crop region ({}, {})-({}, {}) from an image of shape {}x{}x{}, "
            "resulting in an empty crop of shape {}x{}",
            p0.x, p0.y, p1.x, p1.y,
            image.rows, image.cols, image.channels(),
            std::max(0, ymax - ymin), std::max(0, xmax - xmin)));
    }

    return image(cv::Rect(xmin, ymin, xmax - xmin, ymax - ymin));
}

}  // namespace bba
