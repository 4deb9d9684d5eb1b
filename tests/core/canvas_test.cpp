/**
 * @file    canvas_test.cpp
 * @brief   Unit tests for canvas rendering, zoom and pan input
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/canvas.hpp"

namespace bba {

class CanvasTest : public ::testing::Test {
protected:
    void SetUp() override {
        canvas_.subscribe_content_changed([this]() { ++renders_; });
        canvas_.set_image(cv::Mat(1000, 1000, CV_8UC3, cv::Scalar(10, 20, 30)));
    }

    static PointerEvent ctrl_left(cv::Point2f pos) {
        PointerEvent e;
        e.pos = pos;
        e.button = MouseButton::Left;
        e.mods.ctrl = true;
        return e;
    }

    Canvas canvas_;
    int renders_ = 0;
};

// =============================================================================
// Image & Rendering
// =============================================================================

TEST(CanvasEmptyTest, PlaceholderWithoutImage) {
    Canvas canvas;

    EXPECT_FALSE(canvas.has_image());
    EXPECT_EQ(canvas.image().size(), cv::Size(500, 500));
    EXPECT_TRUE(canvas.displayed().empty());
}

TEST(CanvasEmptyTest, InputIgnoredWithoutImage) {
    Canvas canvas;
    WheelEvent wheel;
    wheel.delta = 1.0f;
    wheel.mods.ctrl = true;

    EXPECT_FALSE(canvas.on_wheel(wheel));
}

TEST_F(CanvasTest, SetImageFitsAndRenders) {
    EXPECT_TRUE(canvas_.has_image());
    EXPECT_DOUBLE_EQ(canvas_.viewport().zoom_scale(), 0.5);
    EXPECT_GE(renders_, 1);

    const cv::Mat& shown = canvas_.displayed();
    EXPECT_EQ(shown.size(), cv::Size(500, 500));
    EXPECT_EQ(shown.type(), CV_8UC4);
    // BGR (10, 20, 30) converted to RGBA
    EXPECT_EQ(shown.at<cv::Vec4b>(250, 250), cv::Vec4b(30, 20, 10, 255));
}

TEST_F(CanvasTest, ClearingImageClearsDisplay) {
    canvas_.set_image(cv::Mat());

    EXPECT_FALSE(canvas_.has_image());
    EXPECT_FALSE(canvas_.viewport().has_image());
    EXPECT_TRUE(canvas_.displayed().empty());
}

TEST_F(CanvasTest, ResizeRerendersAtNewSize) {
    canvas_.on_resize(cv::Size(640, 320));

    EXPECT_EQ(canvas_.viewport().size(), cv::Size(640, 320));
    EXPECT_EQ(canvas_.displayed().size(), cv::Size(640, 320));
}

TEST_F(CanvasTest, ResizeIgnoresEmptySize) {
    canvas_.on_resize(cv::Size(0, 300));
    EXPECT_EQ(canvas_.viewport().size(), cv::Size(500, 500));
}

TEST_F(CanvasTest, UnsubscribeStopsNotifications) {
    int extra = 0;
    const auto id = canvas_.subscribe_content_changed([&extra]() { ++extra; });
    canvas_.unsubscribe_content_changed(id);

    canvas_.render();

    EXPECT_EQ(extra, 0);
}

// =============================================================================
// Wheel Zoom
// =============================================================================

TEST_F(CanvasTest, CtrlWheelZoomsIn) {
    WheelEvent wheel;
    wheel.pos = {250, 250};
    wheel.delta = 1.0f;
    wheel.mods.ctrl = true;
    const int before = renders_;

    EXPECT_TRUE(canvas_.on_wheel(wheel));

    EXPECT_NEAR(canvas_.viewport().zoom_scale(), 0.5 * Canvas::kZoomInStep, 1e-6);
    EXPECT_GT(renders_, before);
}

TEST_F(CanvasTest, CtrlWheelZoomOutStopsAtFit) {
    WheelEvent wheel;
    wheel.delta = -1.0f;
    wheel.mods.ctrl = true;

    EXPECT_TRUE(canvas_.on_wheel(wheel));

    EXPECT_DOUBLE_EQ(canvas_.viewport().zoom_scale(), 0.5);
}

TEST_F(CanvasTest, PlainWheelIsNotConsumed) {
    WheelEvent wheel;
    wheel.delta = 1.0f;

    EXPECT_FALSE(canvas_.on_wheel(wheel));
    EXPECT_DOUBLE_EQ(canvas_.viewport().zoom_scale(), 0.5);
}

// =============================================================================
// Panning
// =============================================================================

TEST_F(CanvasTest, CtrlDragPansWithCursor) {
    canvas_.viewport().zoom(2.0);
    ASSERT_EQ(canvas_.viewport().offset(), cv::Point(500, 500));

    EXPECT_TRUE(canvas_.on_pointer_press(ctrl_left({250, 250})));
    EXPECT_TRUE(canvas_.is_panning());

    // Dragging right moves the visible window left
    EXPECT_TRUE(canvas_.on_pointer_move(ctrl_left({300, 250})));
    EXPECT_EQ(canvas_.viewport().offset(), cv::Point(450, 500));

    // The grabbed image point stays under the cursor
    const cv::Point2f under = canvas_.viewport().viewport_to_image_coords({300, 250});
    EXPECT_NEAR(under.x, 500.0f, 1.0f);
    EXPECT_NEAR(under.y, 500.0f, 1.0f);

    EXPECT_TRUE(canvas_.on_pointer_release(ctrl_left({300, 250})));
    EXPECT_FALSE(canvas_.is_panning());
}

TEST_F(CanvasTest, PanRequiresCtrlLeft) {
    PointerEvent plain;
    plain.pos = {100, 100};
    plain.button = MouseButton::Left;
    EXPECT_FALSE(canvas_.on_pointer_press(plain));

    PointerEvent right = ctrl_left({100, 100});
    right.button = MouseButton::Right;
    EXPECT_FALSE(canvas_.on_pointer_press(right));

    EXPECT_FALSE(canvas_.is_panning());
    EXPECT_FALSE(canvas_.on_pointer_move(plain));
}

TEST_F(CanvasTest, NewImageEndsPan) {
    canvas_.viewport().zoom(2.0);
    canvas_.on_pointer_press(ctrl_left({250, 250}));

    canvas_.set_image(cv::Mat(100, 100, CV_8UC3, cv::Scalar(0, 0, 0)));

    EXPECT_FALSE(canvas_.is_panning());
}

}  // namespace bba
