/**
 * @file    controllers.hpp
 * @brief   Drawing and editing interaction state machines
 * @license MIT
 *
 * @details
 * Both controllers work in integer image coordinates. They hold only
 * interaction state; results are returned to the caller, which applies
 * them to the AnnotationStore.
 *
 *   Drawing: idle -> drawing -> idle
 *   Editing: idle -> dragging -> idle
 */

#pragma once

#include "core/annotation.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace bba {

// =============================================================================
// Drawing
// =============================================================================

class DrawingController {
public:
    DrawingController() = default;

    // Non-copyable
    DrawingController(const DrawingController&) = delete;
    DrawingController& operator=(const DrawingController&) = delete;

    /**
     * Begin a box; start and end both become @p point
     */
    void start(cv::Point point);

    /**
     * Move the free corner.
     * @return false when not drawing
     */
    bool update(cv::Point point);

    /**
     * Complete the box at @p point. Returns to idle in every case.
     * @return the normalized annotation, or nullopt when not drawing or
     *         @p label is empty
     */
    [[nodiscard]] std::optional<Annotation> finish(cv::Point point, const std::string& label);

    /**
     * Abort without producing a box
     */
    void cancel() noexcept;

    [[nodiscard]] bool is_drawing() const noexcept { return m_drawing; }

    /**
     * (start, end) as drawn, not normalized; nullopt when idle
     */
    [[nodiscard]] std::optional<Box> current_box() const;

private:
    bool m_drawing{false};
    cv::Point m_start{0, 0};
    cv::Point m_end{0, 0};
};

// =============================================================================
// Editing
// =============================================================================

enum class Handle {
    TopLeft = 0,
    TopRight = 1,
    BottomRight = 2,
    BottomLeft = 3,
    Center = 4
};

[[nodiscard]] const char* to_string(Handle handle) noexcept;

struct HandleSelection {
    size_t index = 0;
    Handle handle = Handle::TopLeft;

    bool operator==(const HandleSelection&) const = default;
};

struct BoxEdit {
    size_t index = 0;
    Box box;                // Normalized
};

class EditingController {
public:
    static constexpr int kDefaultTolerance = 6;

    explicit EditingController(int tolerance = kDefaultTolerance);

    // Non-copyable
    EditingController(const EditingController&) = delete;
    EditingController& operator=(const EditingController&) = delete;

    [[nodiscard]] int tolerance() const noexcept { return m_tolerance; }
    void set_tolerance(int tolerance) noexcept { m_tolerance = tolerance; }

    /**
     * First handle within tolerance of @p click, scanning annotations in
     * list order and handles in TL, TR, BR, BL, Center order
     */
    [[nodiscard]] std::optional<HandleSelection> find_control_point(
        cv::Point click, const Annotations& annotations) const;

    /**
     * @return false (and stays idle) for an empty selection
     */
    bool start(cv::Point point, std::optional<HandleSelection> selection);

    /**
     * Apply the move from the previous pointer position. The center handle
     * translates the box; a corner handle moves to @p point.
     * @return the edited box, or nullopt when idle or the index is stale
     */
    [[nodiscard]] std::optional<BoxEdit> update(cv::Point point, const Annotations& annotations);

    /**
     * End the drag and log what happened
     */
    void finish();

    void cancel() noexcept;

    [[nodiscard]] bool is_dragging() const noexcept { return m_dragging; }
    [[nodiscard]] std::optional<HandleSelection> selection() const noexcept { return m_selection; }

private:
    int m_tolerance;
    bool m_dragging{false};
    cv::Point m_drag_start{0, 0};
    std::optional<HandleSelection> m_selection;
};

}  // namespace bba
