/**
 * @file    box.hpp
 * @brief   Axis-aligned rectangle defined by two corner points
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>

namespace bba {

/**
 * Rectangle spanned by two opposite corners.
 *
 * Corners are not required to be ordered; width() and height() may be
 * negative until normalized() is applied.
 */
struct Box {
    cv::Point2f p0{0.0f, 0.0f};
    cv::Point2f p1{0.0f, 0.0f};

    Box() = default;
    Box(cv::Point2f a, cv::Point2f b) : p0(a), p1(b) {}
    Box(float x0, float y0, float x1, float y1) : p0(x0, y0), p1(x1, y1) {}

    [[nodiscard]] float x() const noexcept { return p0.x; }
    [[nodiscard]] float y() const noexcept { return p0.y; }
    [[nodiscard]] float cx() const noexcept { return (p0.x + p1.x) / 2.0f; }
    [[nodiscard]] float cy() const noexcept { return (p0.y + p1.y) / 2.0f; }
    [[nodiscard]] cv::Point2f center() const noexcept { return {cx(), cy()}; }
    [[nodiscard]] float width() const noexcept { return p1.x - p0.x; }
    [[nodiscard]] float height() const noexcept { return p1.y - p0.y; }

    /**
     * Same rectangle with p0 <= p1 componentwise
     */
    [[nodiscard]] Box normalized() const noexcept;

    /**
     * Sub-raster bounded by the integer-truncated, min/max-normalized
     * corners, clipped to the raster bounds. The result shares pixel
     * data with @p image.
     *
     * @throws GeometryError if the clipped region has zero area
     */
    [[nodiscard]] cv::Mat crop(const cv::Mat& image) const;

    bool operator==(const Box& other) const noexcept {
        return p0 == other.p0 && p1 == other.p1;
    }
    bool operator!=(const Box& other) const noexcept { return !(*this == other); }
};

}  // namespace bba
