/**
 * @file    controllers_test.cpp
 * @brief   Unit tests for the drawing and editing controllers
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/controllers.hpp"

namespace bba {

// =============================================================================
// DrawingController
// =============================================================================

TEST(DrawingControllerTest, DrawsNormalizedBox) {
    DrawingController drawing;

    drawing.start({10, 10});
    EXPECT_TRUE(drawing.is_drawing());
    EXPECT_TRUE(drawing.update({30, 40}));
    auto created = drawing.finish({50, 70}, "dog");

    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->label, "dog");
    EXPECT_EQ(created->box(), Box(10, 10, 50, 70));
    EXPECT_FALSE(drawing.is_drawing());
}

TEST(DrawingControllerTest, ReverseDragIsNormalized) {
    DrawingController drawing;

    drawing.start({50, 70});
    auto created = drawing.finish({10, 10}, "dog");

    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->box(), Box(10, 10, 50, 70));
}

TEST(DrawingControllerTest, CurrentBoxFollowsPointer) {
    DrawingController drawing;
    EXPECT_FALSE(drawing.current_box().has_value());

    drawing.start({5, 5});
    EXPECT_EQ(drawing.current_box(), Box(5, 5, 5, 5));

    drawing.update({20, 1});
    EXPECT_EQ(drawing.current_box(), Box(5, 5, 20, 1));
}

TEST(DrawingControllerTest, EmptyLabelCreatesNothing) {
    DrawingController drawing;

    drawing.start({10, 10});
    EXPECT_FALSE(drawing.finish({50, 70}, "").has_value());
    EXPECT_FALSE(drawing.is_drawing());
}

TEST(DrawingControllerTest, UpdateWithoutStartIsIgnored) {
    DrawingController drawing;

    EXPECT_FALSE(drawing.update({1, 1}));
    EXPECT_FALSE(drawing.finish({1, 1}, "dog").has_value());
}

TEST(DrawingControllerTest, CancelDiscardsDrawing) {
    DrawingController drawing;

    drawing.start({10, 10});
    drawing.cancel();

    EXPECT_FALSE(drawing.is_drawing());
    EXPECT_FALSE(drawing.current_box().has_value());
    EXPECT_FALSE(drawing.finish({50, 70}, "dog").has_value());
}

// =============================================================================
// EditingController
// =============================================================================

class EditingControllerTest : public ::testing::Test {
protected:
    Annotations annotations_{
        Annotation("a", Box(10, 10, 100, 100)),
        Annotation("b", Box(200, 200, 300, 260)),
    };
    EditingController editing_;
};

TEST_F(EditingControllerTest, FindsCorners) {
    EXPECT_EQ(editing_.find_control_point({12, 8}, annotations_),
              (HandleSelection{0, Handle::TopLeft}));
    EXPECT_EQ(editing_.find_control_point({100, 10}, annotations_),
              (HandleSelection{0, Handle::TopRight}));
    EXPECT_EQ(editing_.find_control_point({104, 96}, annotations_),
              (HandleSelection{0, Handle::BottomRight}));
    EXPECT_EQ(editing_.find_control_point({10, 100}, annotations_),
              (HandleSelection{0, Handle::BottomLeft}));
}

TEST_F(EditingControllerTest, FindsCenter) {
    EXPECT_EQ(editing_.find_control_point({55, 55}, annotations_),
              (HandleSelection{0, Handle::Center}));
    EXPECT_EQ(editing_.find_control_point({250, 230}, annotations_),
              (HandleSelection{1, Handle::Center}));
}

TEST_F(EditingControllerTest, ToleranceIsInclusiveChebyshev) {
    EXPECT_TRUE(editing_.find_control_point({16, 16}, annotations_).has_value());
    EXPECT_FALSE(editing_.find_control_point({17, 10}, annotations_).has_value());
    EXPECT_FALSE(editing_.find_control_point({150, 150}, annotations_).has_value());

    editing_.set_tolerance(20);
    EXPECT_TRUE(editing_.find_control_point({28, 28}, annotations_).has_value());
}

TEST_F(EditingControllerTest, FirstMatchWins) {
    const Annotations overlapping{
        Annotation("first", Box(0, 0, 10, 10)),
        Annotation("second", Box(2, 2, 12, 12)),
    };

    // Within tolerance of both boxes' top-left and of the first's center
    EXPECT_EQ(editing_.find_control_point({2, 2}, overlapping),
              (HandleSelection{0, Handle::TopLeft}));
}

TEST_F(EditingControllerTest, DragTopLeftCorner) {
    ASSERT_TRUE(editing_.start({10, 10}, HandleSelection{0, Handle::TopLeft}));
    EXPECT_TRUE(editing_.is_dragging());

    auto edit = editing_.update({20, 20}, annotations_);

    ASSERT_TRUE(edit.has_value());
    EXPECT_EQ(edit->index, 0u);
    EXPECT_EQ(edit->box, Box(20, 20, 100, 100));
}

TEST_F(EditingControllerTest, DragBottomRightCorner) {
    editing_.start({300, 260}, HandleSelection{1, Handle::BottomRight});

    auto edit = editing_.update({320, 250}, annotations_);

    ASSERT_TRUE(edit.has_value());
    EXPECT_EQ(edit->box, Box(200, 200, 320, 250));
}

TEST_F(EditingControllerTest, DragCenterMovesBox) {
    editing_.start({55, 55}, HandleSelection{0, Handle::Center});

    auto edit = editing_.update({65, 50}, annotations_);
    ASSERT_TRUE(edit.has_value());
    EXPECT_EQ(edit->box, Box(20, 5, 110, 95));

    // The anchor advances, so deltas are incremental against the stored box
    annotations_[0].set_box(edit->box);
    edit = editing_.update({70, 50}, annotations_);
    ASSERT_TRUE(edit.has_value());
    EXPECT_EQ(edit->box, Box(25, 5, 115, 95));
}

TEST_F(EditingControllerTest, CornerDraggedPastOppositeFlips) {
    editing_.start({10, 10}, HandleSelection{0, Handle::TopLeft});

    auto edit = editing_.update({150, 120}, annotations_);

    ASSERT_TRUE(edit.has_value());
    EXPECT_EQ(edit->box, Box(100, 100, 150, 120));
}

TEST_F(EditingControllerTest, StartWithoutSelectionFails) {
    EXPECT_FALSE(editing_.start({0, 0}, std::nullopt));
    EXPECT_FALSE(editing_.is_dragging());
    EXPECT_FALSE(editing_.update({5, 5}, annotations_).has_value());
}

TEST_F(EditingControllerTest, StaleIndexIsIgnored) {
    editing_.start({0, 0}, HandleSelection{5, Handle::Center});
    EXPECT_FALSE(editing_.update({5, 5}, annotations_).has_value());
}

TEST_F(EditingControllerTest, FinishEndsDrag) {
    editing_.start({10, 10}, HandleSelection{0, Handle::TopLeft});
    editing_.finish();

    EXPECT_FALSE(editing_.is_dragging());
    EXPECT_FALSE(editing_.selection().has_value());
    EXPECT_FALSE(editing_.update({20, 20}, annotations_).has_value());
}

TEST(HandleTest, Names) {
    EXPECT_STREQ(to_string(Handle::TopLeft), "top-left");
    EXPECT_STREQ(to_string(Handle::Center), "center");
}

}  // namespace bba
