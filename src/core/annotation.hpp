/**
 * @file    annotation.hpp
 * @brief   Labeled annotation shapes and their JSON codec
 * @license MIT
 *
 * @details
 * Shapes are a closed sum type. The on-disk discriminant is the "shape"
 * field, e.g.
 *
 *   [ { "label": "dog", "shape": "BBox", "p0": [10, 10], "p1": [50, 70] } ]
 *
 * Two legacy layouts are accepted on read and upgraded in memory:
 *   { "annotations": [ { "label": "cat", "bbox": [x1, y1, x2, y2] } ] }
 *   [ [[x1, y1], [x2, y2]], ... ]                  (pairs, empty labels)
 */

#pragma once

#include "core/box.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace bba {

/**
 * Axis-aligned box annotation geometry
 */
struct BBoxShape {
    cv::Point2f p0{0.0f, 0.0f};
    cv::Point2f p1{0.0f, 0.0f};

    [[nodiscard]] Box box() const noexcept { return Box(p0, p1); }

    bool operator==(const BBoxShape& other) const noexcept {
        return p0 == other.p0 && p1 == other.p1;
    }
};

using Shape = std::variant<BBoxShape>;

struct Annotation {
    std::string label;
    Shape shape;

    Annotation() = default;
    Annotation(std::string label_, const Box& box)
        : label(std::move(label_)), shape(BBoxShape{box.p0, box.p1}) {}

    /**
     * Wire discriminant of the held shape ("BBox")
     */
    [[nodiscard]] std::string_view shape_name() const noexcept;

    /**
     * Bounding box of the shape
     */
    [[nodiscard]] Box box() const noexcept;

    /**
     * Replace the geometry, keeping the label
     */
    void set_box(const Box& box) noexcept;

    bool operator==(const Annotation& other) const noexcept {
        return label == other.label && shape == other.shape;
    }
};

using Annotations = std::vector<Annotation>;

// =============================================================================
// JSON codec
// =============================================================================

void to_json(nlohmann::json& j, const Annotation& ann);

/**
 * Decode one item in any supported layout.
 * @throws AnnotationFormatError for anything unrecognized
 */
void from_json(const nlohmann::json& j, Annotation& ann);

/**
 * Decode a document: a list of items or {"annotations": [...]}
 * @throws AnnotationFormatError
 */
[[nodiscard]] Annotations annotations_from_json(const nlohmann::json& doc);

[[nodiscard]] nlohmann::json annotations_to_json(const Annotations& annotations);

/**
 * True when a document uses a layout that upgrade would rewrite
 */
[[nodiscard]] bool is_legacy_document(const nlohmann::json& doc);

/**
 * @throws AnnotationFormatError if the file is missing or malformed
 */
[[nodiscard]] Annotations read_annotations(const std::filesystem::path& path);

/**
 * Write the canonical layout: indent 2, UTF-8, non-ASCII unescaped.
 * @throws std::runtime_error if the file cannot be written
 */
void write_annotations(const std::filesystem::path& path, const Annotations& annotations);

}  // namespace bba
