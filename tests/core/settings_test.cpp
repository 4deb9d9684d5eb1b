/**
 * @file    settings_test.cpp
 * @brief   Unit tests for persisted settings and color helpers
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/settings.hpp"

#include <filesystem>
#include <fstream>

namespace bba {

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("bba_settings_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
        path_ = dir_ / "settings.json";
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
    std::filesystem::path path_;
};

// =============================================================================
// Defaults
// =============================================================================

TEST(AppearanceTest, Defaults) {
    const Appearance a;

    EXPECT_EQ(a.bbox_color, "#FF0000");
    EXPECT_EQ(a.bbox_selected_color, "#00FF00");
    EXPECT_EQ(a.label_color, "#000000");
    EXPECT_EQ(a.points_color, "#0000FF");
    EXPECT_EQ(a.bbox_line_width, 2);
    EXPECT_EQ(a.points_size, 6);
    EXPECT_EQ(a.label_font_size, 12);
    EXPECT_EQ(a.theme, Theme::Light);
}

TEST(AppearanceTest, ClampKeepsValuesInRange) {
    Appearance a;
    a.bbox_line_width = 0;
    a.points_size = 100;
    a.label_font_size = 4;

    a.clamp();

    EXPECT_EQ(a.bbox_line_width, Appearance::kLineWidthMin);
    EXPECT_EQ(a.points_size, Appearance::kPointsSizeMax);
    EXPECT_EQ(a.label_font_size, Appearance::kFontSizeMin);
}

TEST_F(SettingsTest, MissingFileGivesDefaults) {
    const Settings s = load_settings(path_);

    EXPECT_EQ(s.appearance, Appearance{});
    EXPECT_EQ(s.language, "en");
    EXPECT_EQ(s.output_dir.filename(), "output");
}

TEST(SettingsPathTest, SettingsLiveInAppDataDirectory) {
    EXPECT_EQ(default_settings_path().filename(), "settings.json");
    EXPECT_EQ(default_settings_path().parent_path(), app_data_directory());
}

// =============================================================================
// Persistence
// =============================================================================

TEST_F(SettingsTest, SaveThenLoad) {
    Settings s = Settings::defaults();
    s.appearance.bbox_color = "#123456";
    s.appearance.bbox_line_width = 5;
    s.appearance.theme = Theme::Dark;
    s.output_dir = dir_ / "labels";
    s.last_dir = dir_ / "images";
    s.language = "zh-CN";

    save_settings(path_, s);
    const Settings loaded = load_settings(path_);

    EXPECT_EQ(loaded.appearance, s.appearance);
    EXPECT_EQ(loaded.output_dir, s.output_dir);
    EXPECT_EQ(loaded.last_dir, s.last_dir);
    EXPECT_EQ(loaded.language, "zh-CN");
}

TEST_F(SettingsTest, SaveCreatesParentDirectories) {
    const auto nested = dir_ / "a" / "b" / "settings.json";

    save_settings(nested, Settings::defaults());

    EXPECT_TRUE(std::filesystem::exists(nested));
}

TEST_F(SettingsTest, PartialFileKeepsOtherDefaults) {
    std::ofstream(path_) << R"({"appearance": {"points_size": 9}, "language": "zh-TW"})";

    const Settings s = load_settings(path_);

    EXPECT_EQ(s.appearance.points_size, 9);
    EXPECT_EQ(s.appearance.bbox_color, "#FF0000");
    EXPECT_EQ(s.language, "zh-TW");
}

TEST_F(SettingsTest, OutOfRangeValuesAreClamped) {
    std::ofstream(path_) << R"({"appearance": {"bbox_line_width": 99, "label_font_size": 1}})";

    const Settings s = load_settings(path_);

    EXPECT_EQ(s.appearance.bbox_line_width, Appearance::kLineWidthMax);
    EXPECT_EQ(s.appearance.label_font_size, Appearance::kFontSizeMin);
}

TEST_F(SettingsTest, CorruptFileGivesDefaults) {
    std::ofstream(path_) << "{\"appearance\": ";

    const Settings s = load_settings(path_);

    EXPECT_EQ(s.appearance, Appearance{});
    EXPECT_EQ(s.language, "en");
}

TEST_F(SettingsTest, WrongValueTypeGivesDefaults) {
    std::ofstream(path_) << R"({"appearance": {"points_size": "big"}})";

    const Settings s = load_settings(path_);

    EXPECT_EQ(s.appearance.points_size, 6);
}

// =============================================================================
// Colors
// =============================================================================

TEST(ColorTest, HexToBgr) {
    EXPECT_EQ(hex_to_bgr("#FF0000"), cv::Scalar(0, 0, 255));
    EXPECT_EQ(hex_to_bgr("00ff00"), cv::Scalar(0, 255, 0));
    EXPECT_EQ(hex_to_bgr("#123456"), cv::Scalar(0x56, 0x34, 0x12));
}

TEST(ColorTest, MalformedHexIsBlack) {
    EXPECT_EQ(hex_to_bgr("#FFF"), cv::Scalar(0, 0, 0));
    EXPECT_EQ(hex_to_bgr("#GGGGGG"), cv::Scalar(0, 0, 0));
    EXPECT_EQ(hex_to_bgr(""), cv::Scalar(0, 0, 0));
}

TEST(ColorTest, BgrToHex) {
    EXPECT_EQ(bgr_to_hex(cv::Scalar(0, 0, 255)), "#FF0000");
    EXPECT_EQ(bgr_to_hex(cv::Scalar(0x56, 0x34, 0x12)), "#123456");
    EXPECT_EQ(bgr_to_hex(cv::Scalar(-5, 300, 10.9)), "#0AFF00");
}

TEST(ThemeTest, Names) {
    EXPECT_STREQ(to_string(Theme::Light), "light");
    EXPECT_STREQ(to_string(Theme::Dark), "dark");
}

}  // namespace bba
