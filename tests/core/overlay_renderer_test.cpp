/**
 * @file    overlay_renderer_test.cpp
 * @brief   Unit tests for annotation overlay drawing
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/overlay_renderer.hpp"

namespace bba {

class OverlayRendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 200x200 image in a 200x200 viewport maps image pixels 1:1
        viewport_.setup_canvas_for_image(std::optional<cv::Size>{cv::Size(200, 200)});
        scene_.annotations = &annotations_;
    }

    [[nodiscard]] cv::Vec3b pixel(int x, int y) const {
        return frame_.at<cv::Vec3b>(y, x);
    }

    static inline const cv::Vec3b kBlack = cv::Vec3b(0, 0, 0);
    static inline const cv::Vec3b kRed = cv::Vec3b(0, 0, 255);       // bbox_color
    static inline const cv::Vec3b kGreen = cv::Vec3b(0, 255, 0);     // bbox_selected_color
    static inline const cv::Vec3b kBlue = cv::Vec3b(255, 0, 0);      // points_color

    Appearance appearance_;
    OverlayRenderer renderer_{appearance_};
    Viewport viewport_{cv::Size(200, 200)};
    Annotations annotations_{Annotation("", Box(20, 50, 100, 150))};
    OverlayScene scene_;
    cv::Mat frame_ = cv::Mat(200, 200, CV_8UC3, cv::Scalar(0, 0, 0));
};

// =============================================================================
// Boxes
// =============================================================================

TEST_F(OverlayRendererTest, DrawsBoxOutline) {
    EXPECT_EQ(renderer_.render(frame_, viewport_, scene_), 1u);

    EXPECT_EQ(pixel(60, 50), kRed);
    EXPECT_EQ(pixel(20, 100), kRed);
    EXPECT_EQ(pixel(100, 100), kRed);
    EXPECT_EQ(pixel(60, 100), kBlack);
}

TEST_F(OverlayRendererTest, SelectedIndexIsHighlighted) {
    annotations_.emplace_back("", Box(150, 10, 190, 40));
    scene_.selected_index = 0;

    EXPECT_EQ(renderer_.render(frame_, viewport_, scene_), 2u);

    EXPECT_EQ(pixel(60, 50), kGreen);
    EXPECT_EQ(pixel(170, 10), kRed);
}

TEST_F(OverlayRendererTest, GroupModeHighlightsByLabel) {
    annotations_ = {
        Annotation("cat", Box(20, 50, 100, 150)),
        Annotation("dog", Box(150, 10, 190, 40)),
        Annotation("cat", Box(120, 160, 180, 190)),
    };
    scene_.group_mode = true;
    scene_.selected_label = "cat";
    scene_.selected_index = 1;

    renderer_.render(frame_, viewport_, scene_);

    EXPECT_EQ(pixel(60, 150), kGreen);
    EXPECT_EQ(pixel(170, 40), kRed);
    EXPECT_EQ(pixel(150, 190), kGreen);
}

TEST_F(OverlayRendererTest, EditModeDrawsHandles) {
    scene_.edit_mode = true;

    renderer_.render(frame_, viewport_, scene_);

    EXPECT_EQ(pixel(22, 52), kBlue);
    EXPECT_EQ(pixel(98, 148), kBlue);
    EXPECT_EQ(pixel(60, 100), kBlue);
}

TEST_F(OverlayRendererTest, NoHandlesOutsideEditMode) {
    renderer_.render(frame_, viewport_, scene_);

    EXPECT_EQ(pixel(22, 52), kBlack);
}

// =============================================================================
// Previews
// =============================================================================

TEST_F(OverlayRendererTest, DragPreviewReplacesBox) {
    scene_.drag_preview_index = 0;
    scene_.drag_preview_box = Box(10, 10, 30, 30);

    EXPECT_EQ(renderer_.render(frame_, viewport_, scene_), 1u);

    EXPECT_EQ(pixel(20, 10), kRed);
    EXPECT_EQ(pixel(60, 50), kBlack);
}

TEST_F(OverlayRendererTest, DrawingPreviewIsNormalizedAndCounted) {
    scene_.drawing_preview = Box(190, 190, 160, 170);

    EXPECT_EQ(renderer_.render(frame_, viewport_, scene_), 2u);

    EXPECT_EQ(pixel(175, 170), kRed);
    EXPECT_EQ(pixel(160, 180), kRed);
}

TEST_F(OverlayRendererTest, DrawingPreviewIsNotHighlightedInGroupMode) {
    annotations_ = {Annotation("cat", Box(20, 50, 100, 150))};
    scene_.group_mode = true;
    scene_.selected_label = "cat";
    scene_.drawing_preview = Box(160, 170, 190, 190);

    renderer_.render(frame_, viewport_, scene_);

    EXPECT_EQ(pixel(60, 150), kGreen);
    EXPECT_EQ(pixel(175, 190), kRed);
    EXPECT_EQ(pixel(190, 180), kRed);
}

TEST_F(OverlayRendererTest, WorksWithoutAnnotations) {
    scene_.annotations = nullptr;
    EXPECT_EQ(renderer_.render(frame_, viewport_, scene_), 0u);
}

// =============================================================================
// Culling
// =============================================================================

TEST_F(OverlayRendererTest, OffscreenBoxesAreCulled) {
    annotations_.emplace_back("", Box(-500, -500, -400, -400));
    annotations_.emplace_back("", Box(300, 20, 400, 60));

    EXPECT_EQ(renderer_.render(frame_, viewport_, scene_), 1u);
}

TEST_F(OverlayRendererTest, PartiallyVisibleBoxIsDrawn) {
    annotations_.emplace_back("", Box(150, 150, 400, 400));

    EXPECT_EQ(renderer_.render(frame_, viewport_, scene_), 2u);
    EXPECT_EQ(pixel(180, 150), kRed);
}

TEST_F(OverlayRendererTest, ZoomedViewDrawsProjectedBox) {
    viewport_.zoom(2.0);    // ROI [50, 50, 150, 150]

    EXPECT_EQ(renderer_.render(frame_, viewport_, scene_), 1u);

    // Image (20, 50)-(100, 150) projects to (-60, 0)-(100, 200)
    EXPECT_EQ(pixel(100, 100), kRed);
    EXPECT_EQ(pixel(50, 100), kBlack);
}

TEST_F(OverlayRendererTest, ZoomedViewCullsBoxOutsideRoi) {
    annotations_ = {Annotation("", Box(0, 0, 20, 20))};
    viewport_.zoom(2.0);

    EXPECT_EQ(renderer_.render(frame_, viewport_, scene_), 0u);
}

}  // namespace bba
