/**
 * @file    settings.hpp
 * @brief   Persistent application settings and overlay appearance
 * @license MIT
 *
 * @details
 * Settings live in ~/.bbox_ann_tool/settings.json. Missing keys take their
 * defaults, out-of-range numbers are clamped on load, and a missing or
 * corrupt file yields the defaults with a warning.
 */

#pragma once

#include <opencv2/core.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace bba {

enum class Theme {
    Light,
    Dark
};

[[nodiscard]] const char* to_string(Theme theme) noexcept;

// =============================================================================
// Appearance
// =============================================================================

struct Appearance {
    static constexpr int kLineWidthMin = 1;
    static constexpr int kLineWidthMax = 10;
    static constexpr int kPointsSizeMin = 3;
    static constexpr int kPointsSizeMax = 20;
    static constexpr int kFontSizeMin = 8;
    static constexpr int kFontSizeMax = 72;

    std::string bbox_color{"#FF0000"};
    std::string bbox_selected_color{"#00FF00"};
    std::string label_color{"#000000"};
    std::string points_color{"#0000FF"};

    int bbox_line_width = 2;
    int points_size = 6;        // Handle size, also the grab tolerance
    int label_font_size = 12;

    Theme theme = Theme::Light;

    /**
     * Pull numeric fields back into their valid ranges
     */
    void clamp() noexcept;

    bool operator==(const Appearance&) const = default;
};

// =============================================================================
// Settings
// =============================================================================

struct Settings {
    Appearance appearance;
    std::filesystem::path output_dir;
    std::filesystem::path last_dir;         // Last opened image directory
    std::filesystem::path last_image_dir;   // Directory of the last single image
    std::string language{"en"};

    /**
     * Defaults: output_dir = cwd/output, last dirs = home directory
     */
    [[nodiscard]] static Settings defaults();
};

/**
 * User home directory ($HOME, or %USERPROFILE% on Windows)
 */
[[nodiscard]] std::filesystem::path home_directory();

/**
 * ~/.bbox_ann_tool, shared by settings and log files
 */
[[nodiscard]] std::filesystem::path app_data_directory();

[[nodiscard]] std::filesystem::path default_settings_path();

/**
 * Load settings. Never throws for a missing or malformed file.
 */
[[nodiscard]] Settings load_settings(const std::filesystem::path& path);

/**
 * Write settings as indented JSON, creating the parent directory.
 * @throws std::runtime_error if the file cannot be written
 */
void save_settings(const std::filesystem::path& path, const Settings& settings);

// =============================================================================
// Color helpers
// =============================================================================

/**
 * "#RRGGBB" (leading '#' optional) to an OpenCV BGR scalar.
 * Malformed input yields black.
 */
[[nodiscard]] cv::Scalar hex_to_bgr(std::string_view hex);

/**
 * BGR scalar to "#RRGGBB", components clamped to [0, 255]
 */
[[nodiscard]] std::string bgr_to_hex(const cv::Scalar& bgr);

}  // namespace bba
