/**
 * @file    annotation.cpp
 * @brief   Annotation JSON codec, including legacy layouts
 * @license MIT
 */

#include "core/annotation.hpp"
#include "core/errors.hpp"
#include "utils/path_formatter.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace bba {

namespace {

constexpr std::string_view kBBoxShapeName = "BBox";

// Truncated dump of an offending item for error messages
std::string excerpt(const nlohmann::json& j) {
    constexpr size_t kMaxLength = 80;
    std::string text = j.dump();
    if (text.size() > kMaxLength) {
        text.resize(kMaxLength);
        text += "...";
    }
    return text;
}

float number_at(const nlohmann::json& arr, size_t i) {
    const auto& v = arr.at(i);
    if (!v.is_number()) {
        throw AnnotationFormatError(fmt::format("Expected a number, got {}", excerpt(v)));
    }
    return v.get<float>();
}

bool is_point(const nlohmann::json& j) {
    return j.is_array() && j.size() >= 2 && j[0].is_number() && j[1].is_number();
}

cv::Point2f point_from_json(const nlohmann::json& j) {
    if (!j.is_array() || j.size() < 2) {
        throw AnnotationFormatError(fmt::format("Expected an [x, y] point, got {}", excerpt(j)));
    }
    return {number_at(j, 0), number_at(j, 1)};
}

std::string label_from_json(const nlohmann::json& item) {
    auto it = item.find("label");
    if (it == item.end() || it->is_null()) return {};
    if (!it->is_string()) {
        throw AnnotationFormatError(fmt::format("Label must be a string in {}", excerpt(item)));
    }
    return it->get<std::string>();
}

/**
 * Decode one item. Returns nullopt for a legacy item whose bbox has fewer
 * than four values; such items are dropped.
 */
std::optional<Annotation> decode_item(const nlohmann::json& item) {
    if (item.is_object()) {
        if (auto shape = item.find("shape"); shape != item.end()) {
            if (!shape->is_string()) {
                throw AnnotationFormatError(
                    fmt::format("Annotation shape must be a string in {}", excerpt(item)));
            }
            const auto name = shape->get<std::string>();
            if (name != kBBoxShapeName) {
                throw AnnotationFormatError(fmt::format("Unknown annotation shape: {}", name));
            }

            BBoxShape bbox;
            if (auto p0 = item.find("p0"); p0 != item.end()) bbox.p0 = point_from_json(*p0);
            if (auto p1 = item.find("p1"); p1 != item.end()) bbox.p1 = point_from_json(*p1);

            Annotation ann;
            ann.label = label_from_json(item);
            ann.shape = bbox;
            return ann;
        }

        if (item.contains("bbox") && item.contains("label")) {
            const auto& bbox = item["bbox"];
            if (!bbox.is_array()) {
                throw AnnotationFormatError(fmt::format("bbox must be an array in {}", excerpt(item)));
            }
            if (bbox.size() < 4) {
                return std::nullopt;
            }
            return Annotation(label_from_json(item),
                              Box(number_at(bbox, 0), number_at(bbox, 1),
                                  number_at(bbox, 2), number_at(bbox, 3)));
        }

        throw AnnotationFormatError(
            fmt::format("Invalid annotation format: missing required keys in {}", excerpt(item)));
    }

    // Oldest layout: a bare [[x1, y1], [x2, y2]] pair
    if (item.is_array() && item.size() == 2 && is_point(item[0]) && is_point(item[1])) {
        return Annotation(std::string{}, Box(point_from_json(item[0]), point_from_json(item[1])));
    }

    throw AnnotationFormatError(
        fmt::format("Invalid annotation format: expected an object, got {}", excerpt(item)));
}

const nlohmann::json& item_list(const nlohmann::json& doc) {
    if (doc.is_array()) {
        return doc;
    }
    if (doc.is_object()) {
        auto it = doc.find("annotations");
        if (it != doc.end() && it->is_array()) {
            return *it;
        }
    }
    throw AnnotationFormatError("Invalid annotation document: expected a list or {\"annotations\": [...]}");
}

}  // anonymous namespace

// =============================================================================
// Annotation
// =============================================================================

std::string_view Annotation::shape_name() const noexcept {
    return std::visit([](const auto& s) -> std::string_view {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, BBoxShape>) {
            return kBBoxShapeName;
        }
    }, shape);
}

Box Annotation::box() const noexcept {
    return std::visit([](const auto& s) { return s.box(); }, shape);
}

void Annotation::set_box(const Box& box) noexcept {
    shape = BBoxShape{box.p0, box.p1};
}

// =============================================================================
// JSON
// =============================================================================

void to_json(nlohmann::json& j, const Annotation& ann) {
    j = nlohmann::json::object();
    j["label"] = ann.label;
    std::visit([&j](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, BBoxShape>) {
            j["p0"] = {s.p0.x, s.p0.y};
            j["p1"] = {s.p1.x, s.p1.y};
        }
    }, ann.shape);
    j["shape"] = std::string(ann.shape_name());
}

void from_json(const nlohmann::json& j, Annotation& ann) {
    auto decoded = decode_item(j);
    if (!decoded) {
        throw AnnotationFormatError(
            fmt::format("Legacy bbox needs four values in {}", excerpt(j)));
    }
    ann = std::move(*decoded);
}

Annotations annotations_from_json(const nlohmann::json& doc) {
    Annotations result;
    for (const auto& item : item_list(doc)) {
        if (auto ann = decode_item(item)) {
            result.push_back(std::move(*ann));
        } else {
            spdlog::warn("[Annotation] Skipping legacy item with short bbox: {}", excerpt(item));
        }
    }
    return result;
}

nlohmann::json annotations_to_json(const Annotations& annotations) {
    nlohmann::json doc = nlohmann::json::array();
    for (const auto& ann : annotations) {
        doc.push_back(nlohmann::json(ann));
    }
    return doc;
}

bool is_legacy_document(const nlohmann::json& doc) {
    if (!doc.is_array()) {
        return true;
    }
    for (const auto& item : doc) {
        if (!item.is_object() || !item.contains("shape")) {
            return true;
        }
    }
    return false;
}

// =============================================================================
// Files
// =============================================================================

Annotations read_annotations(const std::filesystem::path& path) {
    if (!std::filesystem::is_regular_file(path)) {
        throw AnnotationFormatError(fmt::format("Annotation file not found: {}", path));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw AnnotationFormatError(fmt::format("Failed to open annotation file: {}", path));
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw AnnotationFormatError(fmt::format("JSON parse error in {}: {}", path, e.what()));
    }

    try {
        return annotations_from_json(doc);
    } catch (const AnnotationFormatError& e) {
        throw AnnotationFormatError(fmt::format("{}: {}", path, e.what()));
    }
}

void write_annotations(const std::filesystem::path& path, const Annotations& annotations) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Failed to open {} for writing", to_utf8(path)));
    }

    file << annotations_to_json(annotations).dump(2) << '\n';
    if (!file.good()) {
        throw std::runtime_error(fmt::format("Failed to write {}", to_utf8(path)));
    }
}

}  // namespace bba
