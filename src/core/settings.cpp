/**
 * @file    settings.cpp
 * @brief   Settings JSON persistence and color conversion
 * @license MIT
 */

#include "core/settings.hpp"
#include "utils/path_formatter.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace bba {

namespace fs = std::filesystem;

const char* to_string(Theme theme) noexcept {
    switch (theme) {
        case Theme::Light: return "light";
        case Theme::Dark:  return "dark";
    }
    return "light";
}

void Appearance::clamp() noexcept {
    bbox_line_width = std::clamp(bbox_line_width, kLineWidthMin, kLineWidthMax);
    points_size = std::clamp(points_size, kPointsSizeMin, kPointsSizeMax);
    label_font_size = std::clamp(label_font_size, kFontSizeMin, kFontSizeMax);
}

// =============================================================================
// Paths
// =============================================================================

fs::path home_directory() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (home && *home) {
        return path_from_utf8(home);
    }
    std::error_code ec;
    return fs::current_path(ec);
}

fs::path app_data_directory() {
    return home_directory() / ".bbox_ann_tool";
}

fs::path default_settings_path() {
    return app_data_directory() / "settings.json";
}

Settings Settings::defaults() {
    Settings s;
    std::error_code ec;
    s.output_dir = fs::current_path(ec) / "output";
    s.last_dir = home_directory();
    s.last_image_dir = home_directory();
    return s;
}

// =============================================================================
// JSON mapping
// =============================================================================

namespace {

nlohmann::json appearance_to_json(const Appearance& a) {
    return nlohmann::json{
        {"bbox_color", a.bbox_color},
        {"bbox_selected_color", a.bbox_selected_color},
        {"label_color", a.label_color},
        {"points_color", a.points_color},
        {"bbox_line_width", a.bbox_line_width},
        {"points_size", a.points_size},
        {"label_font_size", a.label_font_size},
        {"theme", to_string(a.theme)}
    };
}

Appearance appearance_from_json(const nlohmann::json& j) {
    Appearance a;
    if (!j.is_object()) return a;

    a.bbox_color = j.value("bbox_color", a.bbox_color);
    a.bbox_selected_color = j.value("bbox_selected_color", a.bbox_selected_color);
    a.label_color = j.value("label_color", a.label_color);
    a.points_color = j.value("points_color", a.points_color);
    a.bbox_line_width = j.value("bbox_line_width", a.bbox_line_width);
    a.points_size = j.value("points_size", a.points_size);
    a.label_font_size = j.value("label_font_size", a.label_font_size);
    a.theme = j.value("theme", std::string("light")) == "dark" ? Theme::Dark : Theme::Light;
    a.clamp();
    return a;
}

fs::path path_value(const nlohmann::json& j, const char* key, const fs::path& fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    const auto text = it->get<std::string>();
    return text.empty() ? fallback : path_from_utf8(text);
}

}  // anonymous namespace

Settings load_settings(const fs::path& path) {
    Settings s = Settings::defaults();

    if (!fs::exists(path)) {
        spdlog::debug("[Settings] No settings file at {}, using defaults", path);
        return s;
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("[Settings] Failed to open {}, using defaults", path);
            return s;
        }

        const nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            spdlog::warn("[Settings] {} is not a JSON object, using defaults", path);
            return s;
        }

        if (auto it = j.find("appearance"); it != j.end()) {
            s.appearance = appearance_from_json(*it);
        }
        s.output_dir = path_value(j, "output_dir", s.output_dir);
        s.last_dir = path_value(j, "last_dir", s.last_dir);
        s.last_image_dir = path_value(j, "last_image_dir", s.last_image_dir);
        s.language = j.value("language", s.language);

        spdlog::debug("[Settings] Loaded {}", path);

    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("[Settings] Corrupt settings file {}: {}", path, e.what());
        return Settings::defaults();
    }
    return s;
}

void save_settings(const fs::path& path, const Settings& settings) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    nlohmann::json j;
    j["appearance"] = appearance_to_json(settings.appearance);
    j["output_dir"] = to_utf8(settings.output_dir);
    j["last_dir"] = to_utf8(settings.last_dir);
    j["last_image_dir"] = to_utf8(settings.last_image_dir);
    j["language"] = settings.language;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Failed to write settings: {}", to_utf8(path)));
    }
    file << j.dump(2) << '\n';
    spdlog::debug("[Settings] Saved {}", path);
}

// =============================================================================
// Colors
// =============================================================================

cv::Scalar hex_to_bgr(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#') {
        hex.remove_prefix(1);
    }
    if (hex.size() != 6 ||
        !std::all_of(hex.begin(), hex.end(),
                     [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; })) {
        return cv::Scalar(0, 0, 0);
    }

    const auto component = [hex](size_t pos) {
        return static_cast<double>(std::stoi(std::string(hex.substr(pos, 2)), nullptr, 16));
    };
    return cv::Scalar(component(4), component(2), component(0));
}

std::string bgr_to_hex(const cv::Scalar& bgr) {
    const auto c = [&bgr](int i) {
        return static_cast<int>(std::clamp(bgr[i], 0.0, 255.0));
    };
    return fmt::format("#{:02X}{:02X}{:02X}", c(2), c(1), c(0));
}

}  // namespace bba
