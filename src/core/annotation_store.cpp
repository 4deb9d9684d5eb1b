/**
 * @file    annotation_store.cpp
 * @brief   Annotation session state machine
 * @license MIT
 */

#include "core/annotation_store.hpp"
#include "core/errors.hpp"
#include "utils/path_formatter.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace bba {

namespace fs = std::filesystem;

const char* to_string(StoreEvent event) noexcept {
    switch (event) {
        case StoreEvent::Reset:            return "Reset";
        case StoreEvent::Loaded:           return "Loaded";
        case StoreEvent::Saved:            return "Saved";
        case StoreEvent::Changed:          return "Changed";
        case StoreEvent::SelectionChanged: return "SelectionChanged";
        case StoreEvent::DirtyChanged:     return "DirtyChanged";
    }
    return "Unknown";
}

fs::path AnnotationStore::annotation_path_for(const fs::path& output_dir,
                                              const fs::path& image_path) {
    fs::path name = image_path.stem();
    name += ".json";
    return output_dir / name;
}

// =============================================================================
// Observers
// =============================================================================

AnnotationStore::ObserverId AnnotationStore::subscribe(Observer observer) {
    const ObserverId id = m_next_observer_id++;
    m_observers.emplace_back(id, std::move(observer));
    return id;
}

void AnnotationStore::unsubscribe(ObserverId id) {
    m_observers.erase(
        std::remove_if(m_observers.begin(), m_observers.end(),
                       [id](const auto& entry) { return entry.first == id; }),
        m_observers.end());
}

void AnnotationStore::notify(StoreEvent event) {
    auto observers = m_observers;
    for (auto& [id, observer] : observers) {
        observer(event);
    }
}

// =============================================================================
// Session
// =============================================================================

void AnnotationStore::open(const fs::path& path) {
    if (path.empty()) {
        reset();
        return;
    }
    if (path == m_path && is_loaded()) {
        return;
    }

    spdlog::debug("[AnnotationStore] Annotation path: {}", path);
    load_from(path);
}

void AnnotationStore::reset() {
    m_path.clear();
    m_annotations.reset();
    m_selected.reset();
    m_dirty = false;
    spdlog::debug("[AnnotationStore] State reset");
    notify(StoreEvent::Reset);
}

void AnnotationStore::load() {
    if (m_path.empty()) {
        throw PreconditionError("Annotation path must be set before loading annotations");
    }
    load_from(m_path);
}

void AnnotationStore::load_from(const fs::path& path) {
    // Session state is only replaced once the file has been read
    Annotations annotations;
    if (!fs::exists(path)) {
        spdlog::info("[AnnotationStore] Empty annotations initialized for: {}", path);
    } else {
        try {
            annotations = read_annotations(path);
        } catch (const std::exception& e) {
            spdlog::error("[AnnotationStore] Failed to load annotations: {}", e.what());
            throw;
        }
        spdlog::info("[AnnotationStore] Loaded {} annotations from: {}",
                     annotations.size(), path);
    }

    m_path = path;
    m_annotations = std::move(annotations);
    m_selected.reset();
    set_dirty(false);
    notify(StoreEvent::Loaded);
}

bool AnnotationStore::save() {
    if (m_path.empty()) {
        throw PreconditionError("Annotation path must be set before saving annotations");
    }
    const Annotations& annotations = require_loaded("save");

    if (!m_dirty) {
        spdlog::debug("[AnnotationStore] No unsaved changes, skipping save");
        return false;
    }

    if (m_path.has_parent_path()) {
        fs::create_directories(m_path.parent_path());
    }
    write_annotations(m_path, annotations);

    set_dirty(false);
    spdlog::info("[AnnotationStore] Annotations saved to: {}", m_path);
    notify(StoreEvent::Saved);
    return true;
}

const Annotations& AnnotationStore::annotations() const {
    if (!m_annotations) {
        throw PreconditionError("Annotations are not loaded");
    }
    return *m_annotations;
}

Annotations& AnnotationStore::require_loaded(const char* operation) {
    if (!m_annotations) {
        throw PreconditionError(fmt::format("Cannot {} before loading annotations", operation));
    }
    return *m_annotations;
}

void AnnotationStore::set_dirty(bool dirty) {
    if (dirty == m_dirty) return;

    m_dirty = dirty;
    spdlog::debug("[AnnotationStore] Unsaved changes {}", dirty ? "created" : "resolved");
    notify(StoreEvent::DirtyChanged);
}

void AnnotationStore::mark_changed() {
    set_dirty(true);
    notify(StoreEvent::Changed);
}

// =============================================================================
// Selection
// =============================================================================

const Annotation* AnnotationStore::selected_annotation() const noexcept {
    if (!m_annotations || !m_selected || *m_selected >= m_annotations->size()) {
        return nullptr;
    }
    return &(*m_annotations)[*m_selected];
}

void AnnotationStore::select(std::optional<size_t> index) {
    if (index) {
        const Annotations& annotations = require_loaded("select an annotation");
        if (*index >= annotations.size()) {
            spdlog::error("[AnnotationStore] Invalid annotation index: {} (size {})",
                          *index, annotations.size());
            throw std::out_of_range(fmt::format(
                "Invalid annotation index: {}. Must be below {}", *index, annotations.size()));
        }
    }

    if (index == m_selected) return;

    m_selected = index;
    if (index) {
        spdlog::debug("[AnnotationStore] Selected index: {}", *index);
    } else {
        spdlog::debug("[AnnotationStore] Selection cleared");
    }
    notify(StoreEvent::SelectionChanged);
}

// =============================================================================
// Mutation
// =============================================================================

void AnnotationStore::add(Annotation annotation) {
    Annotations& annotations = require_loaded("add an annotation");
    spdlog::info("[AnnotationStore] Added '{}' at index {}", annotation.label, annotations.size());
    annotations.push_back(std::move(annotation));
    mark_changed();
}

void AnnotationStore::set_box(size_t index, const Box& box) {
    Annotations& annotations = require_loaded("edit an annotation");
    if (index >= annotations.size()) {
        throw std::out_of_range(fmt::format(
            "Invalid annotation index: {}. Must be below {}", index, annotations.size()));
    }
    annotations[index].set_box(box);
    mark_changed();
}

void AnnotationStore::set_selected_box(const Box& box) {
    if (!m_selected) {
        spdlog::warn("[AnnotationStore] No annotation selected to edit");
        return;
    }
    set_box(*m_selected, box);
}

void AnnotationStore::rename_selected(const std::string& label) {
    Annotations& annotations = require_loaded("rename an annotation");
    if (!m_selected) {
        spdlog::warn("[AnnotationStore] No annotation selected to rename");
        return;
    }

    Annotation& ann = annotations[*m_selected];
    if (ann.label == label) {
        spdlog::warn("[AnnotationStore] No change in label, skipping rename");
        return;
    }

    spdlog::info("[AnnotationStore] Annotation renamed at index {}: {} -> {}",
                 *m_selected, ann.label, label);
    ann.label = label;
    mark_changed();
}

void AnnotationStore::delete_selected() {
    Annotations& annotations = require_loaded("delete an annotation");
    if (!m_selected) {
        spdlog::warn("[AnnotationStore] No annotation selected to delete");
        return;
    }

    const size_t index = *m_selected;
    const std::string label = annotations[index].label;
    annotations.erase(annotations.begin() + static_cast<std::ptrdiff_t>(index));
    spdlog::info("[AnnotationStore] Annotation deleted at index {}: {}", index, label);

    m_selected.reset();
    notify(StoreEvent::SelectionChanged);
    mark_changed();
}

size_t AnnotationStore::delete_by_label(const std::string& label) {
    Annotations& annotations = require_loaded("delete annotations");

    size_t removed = 0;
    bool selection_changed = false;
    for (size_t i = annotations.size(); i-- > 0;) {
        if (annotations[i].label != label) continue;

        annotations.erase(annotations.begin() + static_cast<std::ptrdiff_t>(i));
        ++removed;

        if (m_selected) {
            if (*m_selected == i) {
                m_selected.reset();
                selection_changed = true;
            } else if (*m_selected > i) {
                --*m_selected;
                selection_changed = true;
            }
        }
    }

    if (removed > 0) {
        spdlog::info("[AnnotationStore] Deleted {} annotations labeled '{}'", removed, label);
        if (selection_changed) {
            notify(StoreEvent::SelectionChanged);
        }
        mark_changed();
    }
    return removed;
}

size_t AnnotationStore::rename_by_label(const std::string& old_label, const std::string& new_label) {
    Annotations& annotations = require_loaded("rename annotations");
    if (old_label == new_label) {
        spdlog::warn("[AnnotationStore] No change in label, skipping rename");
        return 0;
    }

    size_t renamed = 0;
    for (auto& ann : annotations) {
        if (ann.label == old_label) {
            ann.label = new_label;
            ++renamed;
        }
    }

    if (renamed > 0) {
        spdlog::info("[AnnotationStore] Renamed {} annotations: {} -> {}",
                     renamed, old_label, new_label);
        mark_changed();
    }
    return renamed;
}

}  // namespace bba
