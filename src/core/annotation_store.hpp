/**
 * @file    annotation_store.hpp
 * @brief   Per-image annotation session: load, edit, select, save
 * @license MIT
 *
 * @details
 * One store instance follows the image currently shown. Opening a new
 * annotation path reloads; every mutation marks the session dirty until
 * the next save or load. Observers receive a StoreEvent synchronously.
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

enum class StoreEvent {
    Reset,              // Path and annotations cleared
    Loaded,             // New annotation list (file or empty)
    Saved,
    Changed,            // Annotation list contents modified
    SelectionChanged,
    DirtyChanged
};

[[nodiscard]] const char* to_string(StoreEvent event) noexcept;

class AnnotationStore {
public:
    using Observer = std::function<void(StoreEvent)>;
    using ObserverId = std::size_t;

    AnnotationStore() = default;

    // Non-copyable
    AnnotationStore(const AnnotationStore&) = delete;
    AnnotationStore& operator=(const AnnotationStore&) = delete;

    ObserverId subscribe(Observer observer);
    void unsubscribe(ObserverId id);

    /**
     * Annotation file that belongs to an image: output_dir/<stem>.json
     */
    [[nodiscard]] static std::filesystem::path annotation_path_for(
        const std::filesystem::path& output_dir,
        const std::filesystem::path& image_path);

    // ==========================================================================
    // Session
    // ==========================================================================

    /**
     * Switch to another annotation file and load it. Re-opening the current
     * path is a no-op; an empty path resets the session. If the file cannot
     * be read the previous session is kept unchanged.
     */
    void open(const std::filesystem::path& path);

    void reset();

    /**
     * (Re)load the current path. A missing file starts an empty list.
     * Clears the selection and the dirty flag.
     * @throws PreconditionError without a path, AnnotationFormatError on bad JSON
     */
    void load();

    /**
     * Write the annotations if there are unsaved changes.
     * @return true if the file was written
     * @throws PreconditionError without a loaded session, std::exception on I/O failure
     */
    bool save();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }
    [[nodiscard]] bool is_loaded() const noexcept { return m_annotations.has_value(); }
    [[nodiscard]] bool has_unsaved_changes() const noexcept { return m_dirty; }

    /**
     * @throws PreconditionError before load
     */
    [[nodiscard]] const Annotations& annotations() const;

    // ==========================================================================
    // Selection
    // ==========================================================================

    [[nodiscard]] std::optional<size_t> selected_index() const noexcept { return m_selected; }

    /**
     * nullptr when nothing is selected
     */
    [[nodiscard]] const Annotation* selected_annotation() const noexcept;

    /**
     * @throws std::out_of_range for an index past the end
     */
    void select(std::optional<size_t> index);

    // ==========================================================================
    // Mutation (each marks the session dirty)
    // ==========================================================================

    void add(Annotation annotation);

    /**
     * @throws std::out_of_range for a bad index
     */
    void set_box(size_t index, const Box& box);

    void set_selected_box(const Box& box);
    void rename_selected(const std::string& label);
    void delete_selected();

    /**
     * Remove every annotation with @p label.
     * @return number of annotations removed
     */
    size_t delete_by_label(const std::string& label);

    /**
     * @return number of annotations renamed
     */
    size_t rename_by_label(const std::string& old_label, const std::string& new_label);

private:
    std::filesystem::path m_path;
    std::optional<Annotations> m_annotations;
    std::optional<size_t> m_selected;
    bool m_dirty{false};

    std::vector<std::pair<ObserverId, Observer>> m_observers;
    ObserverId m_next_observer_id{1};

    Annotations& require_loaded(const char* operation);
    void load_from(const std::filesystem::path& path);
    void set_dirty(bool dirty);
    void mark_changed();
    void notify(StoreEvent event);
};

}  // namespace bba
