/**
 * @file    image_source.cpp
 * @brief   Image listing, UTF-8 safe decode/encode and navigation
 * @license MIT
 */

#include "core/image_source.hpp"
#include "core/errors.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace bba {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 5> kImageExtensions = {
    ".png", ".jpg", ".jpeg", ".bmp", ".gif"
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // anonymous namespace

// =============================================================================
// Stateless helpers
// =============================================================================

bool ImageSource::is_supported_image(const fs::path& path) {
    const std::string ext = lower(to_utf8(path.extension()));
    return std::find(kImageExtensions.begin(), kImageExtensions.end(), ext) != kImageExtensions.end();
}

std::vector<fs::path> ImageSource::list_images(const fs::path& dir) {
    if (!fs::is_directory(dir)) {
        throw PreconditionError(fmt::format("Invalid image directory: {}", dir));
    }

    std::vector<fs::path> result;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && is_supported_image(entry.path())) {
            result.push_back(entry.path());
        }
    }
    std::sort(result.begin(), result.end(),
              [](const fs::path& a, const fs::path& b) { return to_utf8(a) < to_utf8(b); });
    return result;
}

cv::Mat ImageSource::decode(const fs::path& path) {
    spdlog::debug("[ImageSource] Reading: {}", path);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ImageDecodeError(fmt::format("Failed to open image: {}", path));
    }

    std::vector<uchar> buffer{std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>()};
    if (buffer.empty()) {
        throw ImageDecodeError(fmt::format("Image file is empty: {}", path));
    }

    cv::Mat image = cv::imdecode(buffer, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw ImageDecodeError(fmt::format("Failed to load image: {}", path));
    }

    spdlog::debug("[ImageSource] Decoded {}x{}", image.cols, image.rows);
    return image;
}

void ImageSource::encode(const fs::path& path, const cv::Mat& image) {
    const std::string ext = lower(to_utf8(path.extension()));
    std::vector<uchar> buffer;

    try {
        if (ext.empty() || !cv::imencode(ext, image, buffer)) {
            throw ImageDecodeError(fmt::format("Failed to encode image: {}", path));
        }
    } catch (const cv::Exception& e) {
        throw ImageDecodeError(fmt::format("Failed to encode image {}: {}", path, e.what()));
    }

    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ImageDecodeError(fmt::format("Failed to create file: {}", path));
    }
    file.write(reinterpret_cast<const char*>(buffer.data()),
               static_cast<std::streamsize>(buffer.size()));
    if (!file.good()) {
        throw ImageDecodeError(fmt::format("Write failed for: {}", path));
    }
    spdlog::debug("[ImageSource] Wrote {} bytes to {}", buffer.size(), path);
}

// =============================================================================
// Navigation
// =============================================================================

ImageSource::ObserverId ImageSource::subscribe(Observer observer) {
    const ObserverId id = m_next_observer_id++;
    m_observers.emplace_back(id, std::move(observer));
    return id;
}

void ImageSource::unsubscribe(ObserverId id) {
    m_observers.erase(
        std::remove_if(m_observers.begin(), m_observers.end(),
                       [id](const auto& entry) { return entry.first == id; }),
        m_observers.end());
}

void ImageSource::notify() {
    auto observers = m_observers;
    for (auto& [id, observer] : observers) {
        observer();
    }
}

void ImageSource::open_directory(const fs::path& dir) {
    auto paths = list_images(dir);

    m_directory = dir;
    m_paths = std::move(paths);
    m_index.reset();
    m_current_path.clear();
    m_current_image.release();

    if (m_paths.empty()) {
        spdlog::warn("[ImageSource] No images found in {}", dir);
    } else {
        spdlog::info("[ImageSource] {} images in {}", m_paths.size(), dir);
    }
    notify();
}

void ImageSource::open_file(const fs::path& path) {
    cv::Mat image = decode(path);

    m_directory = path.parent_path();
    m_paths = {path};
    m_index = 0;
    m_current_path = path;
    m_current_image = std::move(image);

    spdlog::info("[ImageSource] Opened {} ({}x{})", path, m_current_image.cols, m_current_image.rows);
    notify();
}

void ImageSource::reset() {
    m_directory.clear();
    m_paths.clear();
    m_index.reset();
    m_current_path.clear();
    m_current_image.release();
    notify();
}

void ImageSource::set_index(std::optional<size_t> index) {
    if (!index) {
        m_index.reset();
        m_current_path.clear();
        m_current_image.release();
        notify();
        return;
    }

    if (*index >= m_paths.size()) {
        spdlog::error("[ImageSource] Invalid image index: {} (size {})", *index, m_paths.size());
        throw std::out_of_range(fmt::format("Invalid image index: {}", *index));
    }

    cv::Mat image = decode(m_paths[*index]);

    m_index = index;
    m_current_path = m_paths[*index];
    m_current_image = std::move(image);
    spdlog::debug("[ImageSource] Current image {} of {}: {}",
                  *index + 1, m_paths.size(), m_current_path);
    notify();
}

void ImageSource::first() {
    if (m_paths.empty()) {
        spdlog::warn("[ImageSource] Can't go to first image when none are available");
        return;
    }
    set_index(0);
}

void ImageSource::last() {
    if (m_paths.empty()) {
        spdlog::warn("[ImageSource] Can't go to last image when none are available");
        return;
    }
    set_index(m_paths.size() - 1);
}

void ImageSource::next() {
    if (m_paths.empty()) {
        spdlog::warn("[ImageSource] Can't go to next image when none are available");
        return;
    }
    if (!m_index) {
        set_index(0);
    } else if (*m_index + 1 < m_paths.size()) {
        set_index(*m_index + 1);
    } else {
        spdlog::debug("[ImageSource] Already at the last image");
    }
}

void ImageSource::previous() {
    if (m_paths.empty()) {
        spdlog::warn("[ImageSource] Can't go to previous image when none are available");
        return;
    }
    if (!m_index) {
        set_index(m_paths.size() - 1);
    } else if (*m_index > 0) {
        set_index(*m_index - 1);
    } else {
        spdlog::debug("[ImageSource] Already at the first image");
    }
}

}  // namespace bba
