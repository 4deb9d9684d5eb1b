/**
 * @file    image_source.hpp
 * @brief   Image directory enumeration, decoding and navigation
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace bba {

class ImageSource {
public:
    using Observer = std::function<void()>;
    using ObserverId = std::size_t;

    ImageSource() = default;

    // Non-copyable
    ImageSource(const ImageSource&) = delete;
    ImageSource& operator=(const ImageSource&) = delete;

    // ==========================================================================
    // Stateless helpers
    // ==========================================================================

    /**
     * png/jpg/jpeg/bmp/gif, extension compared case-insensitively
     */
    [[nodiscard]] static bool is_supported_image(const std::filesystem::path& path);

    /**
     * Supported images directly inside @p dir, sorted by path.
     * @throws PreconditionError if @p dir is not a directory
     */
    [[nodiscard]] static std::vector<std::filesystem::path> list_images(
        const std::filesystem::path& dir);

    /**
     * Decode to 8-bit BGR. Reads the bytes through the filesystem so
     * non-ASCII paths work on every platform.
     * @throws ImageDecodeError
     */
    [[nodiscard]] static cv::Mat decode(const std::filesystem::path& path);

    /**
     * Encode by file extension and write.
     * @throws ImageDecodeError if encoding or writing fails
     */
    static void encode(const std::filesystem::path& path, const cv::Mat& image);

    // ==========================================================================
    // Navigation
    // ==========================================================================

    ObserverId subscribe(Observer observer);
    void unsubscribe(ObserverId id);

    /**
     * Enumerate a directory. Nothing is selected afterwards.
     * @throws PreconditionError if @p dir is not a directory
     */
    void open_directory(const std::filesystem::path& dir);

    /**
     * Single-image list holding @p path, selected and decoded
     */
    void open_file(const std::filesystem::path& path);

    void reset();

    /**
     * Select and decode an entry, or clear with std::nullopt.
     * State is unchanged when decoding throws.
     * @throws std::out_of_range, ImageDecodeError
     */
    void set_index(std::optional<size_t> index);

    void first();
    void last();

    /**
     * Advance; starts at the first entry when nothing is selected and
     * stays put at the end
     */
    void next();

    /**
     * Step back; starts at the last entry when nothing is selected and
     * stays put at the beginning
     */
    void previous();

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return m_directory; }
    [[nodiscard]] const std::vector<std::filesystem::path>& paths() const noexcept { return m_paths; }
    [[nodiscard]] std::optional<size_t> index() const noexcept { return m_index; }

    /**
     * Empty when nothing is selected
     */
    [[nodiscard]] const std::filesystem::path& current_path() const noexcept { return m_current_path; }
    [[nodiscard]] const cv::Mat& current_image() const noexcept { return m_current_image; }

private:
    std::filesystem::path m_directory;
    std::vector<std::filesystem::path> m_paths;
    std::optional<size_t> m_index;
    std::filesystem::path m_current_path;
    cv::Mat m_current_image;

    std::vector<std::pair<ObserverId, Observer>> m_observers;
    ObserverId m_next_observer_id{1};

    void notify();
};

}  // namespace bba
