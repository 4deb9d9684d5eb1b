/**
 * @file    label_registry.hpp
 * @brief   Current label, known labels and label list presentation
 * @license MIT
 */

#pragma once

#include "core/annotation.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bba {

/**
 * One row of the label list
 */
struct LabelEntry {
    std::string text;                   // "dog (3)", "dog" or "dog #2"
    std::string label;
    std::optional<size_t> index;        // Annotation index (individual mode)
    size_t count = 1;                   // Occurrences (grouped mode)
};

class LabelRegistry {
public:
    using Observer = std::function<void(const std::string&)>;
    using ObserverId = std::size_t;

    explicit LabelRegistry(std::filesystem::path output_dir = {});

    // Non-copyable
    LabelRegistry(const LabelRegistry&) = delete;
    LabelRegistry& operator=(const LabelRegistry&) = delete;

    ObserverId subscribe(Observer observer);
    void unsubscribe(ObserverId id);

    /**
     * Label assigned to newly drawn boxes. Empty disables drawing.
     */
    [[nodiscard]] const std::string& current_label() const noexcept { return m_current_label; }

    /**
     * Notifies only on change
     */
    void set_current_label(const std::string& label);

    [[nodiscard]] const std::filesystem::path& output_dir() const noexcept { return m_output_dir; }
    void set_output_dir(std::filesystem::path dir) { m_output_dir = std::move(dir); }

    /**
     * Every non-empty label in the output directory JSON files (both
     * layouts), sorted. Unreadable files are skipped.
     */
    [[nodiscard]] std::vector<std::string> all_unique_labels() const;

    /**
     * Rows for the annotation label list.
     *
     * Grouped: one row per label in first-seen order, "label (n)" when n > 1.
     * Individual: "label #i" per annotation, 1-based, carrying its index.
     * Unlabeled annotations are skipped in both modes.
     */
    [[nodiscard]] static std::vector<LabelEntry> build_label_list(
        const Annotations& annotations, bool group_similar);

    /**
     * (label, count) in first-seen order, unlabeled annotations skipped
     */
    [[nodiscard]] static std::vector<std::pair<std::string, size_t>> label_counts(
        const Annotations& annotations);

private:
    std::filesystem::path m_output_dir;
    std::string m_current_label;

    std::vector<std::pair<ObserverId, Observer>> m_observers;
    ObserverId m_next_observer_id{1};
};

}  // namespace bba
