/**
 * @file    image_source_test.cpp
 * @brief   Unit tests for image discovery, decoding and navigation
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/image_source.hpp"
#include "core/errors.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace bba {

class ImageSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("bba_images_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        source_.subscribe([this]() { ++notifications_; });
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path make_image(const std::string& name, int width = 16, int height = 8) {
        const auto path = dir_ / name;
        ImageSource::encode(path, cv::Mat(height, width, CV_8UC3, cv::Scalar(10, 20, 30)));
        return path;
    }

    // b.png, a.JPG and c.bmp plus two non-images
    void make_sample_dir() {
        make_image("b.png");
        make_image("a.JPG", 32, 24);
        make_image("c.bmp");
        std::ofstream(dir_ / "notes.txt") << "not an image";
        std::filesystem::create_directories(dir_ / "sub.png");
    }

    std::filesystem::path dir_;
    ImageSource source_;
    int notifications_ = 0;
};

// =============================================================================
// Stateless Helpers
// =============================================================================

TEST(ImageSourceHelpersTest, SupportedExtensions) {
    EXPECT_TRUE(ImageSource::is_supported_image("a.png"));
    EXPECT_TRUE(ImageSource::is_supported_image("a.jpg"));
    EXPECT_TRUE(ImageSource::is_supported_image("a.JPEG"));
    EXPECT_TRUE(ImageSource::is_supported_image("dir/a.Bmp"));
    EXPECT_TRUE(ImageSource::is_supported_image("a.gif"));
    EXPECT_FALSE(ImageSource::is_supported_image("a.webp"));
    EXPECT_FALSE(ImageSource::is_supported_image("a.json"));
    EXPECT_FALSE(ImageSource::is_supported_image("png"));
}

TEST_F(ImageSourceTest, ListImagesSortedAndFiltered) {
    make_sample_dir();

    const auto paths = ImageSource::list_images(dir_);

    ASSERT_EQ(paths.size(), 3u);
    EXPECT_EQ(paths[0].filename(), "a.JPG");
    EXPECT_EQ(paths[1].filename(), "b.png");
    EXPECT_EQ(paths[2].filename(), "c.bmp");
}

TEST_F(ImageSourceTest, ListImagesRejectsMissingDirectory) {
    EXPECT_THROW((void)ImageSource::list_images(dir_ / "missing"), PreconditionError);
}

TEST_F(ImageSourceTest, DecodeReadsColorImage) {
    const auto path = make_image("x.png", 16, 8);

    const cv::Mat image = ImageSource::decode(path);

    EXPECT_EQ(image.cols, 16);
    EXPECT_EQ(image.rows, 8);
    EXPECT_EQ(image.type(), CV_8UC3);
    EXPECT_EQ(image.at<cv::Vec3b>(0, 0), cv::Vec3b(10, 20, 30));
}

TEST_F(ImageSourceTest, DecodeErrors) {
    EXPECT_THROW((void)ImageSource::decode(dir_ / "missing.png"), ImageDecodeError);

    std::ofstream(dir_ / "empty.png").close();
    EXPECT_THROW((void)ImageSource::decode(dir_ / "empty.png"), ImageDecodeError);

    std::ofstream(dir_ / "garbage.png") << "definitely not a png";
    EXPECT_THROW((void)ImageSource::decode(dir_ / "garbage.png"), ImageDecodeError);
}

TEST_F(ImageSourceTest, EncodeRequiresKnownExtension) {
    const cv::Mat image(4, 4, CV_8UC3, cv::Scalar(0, 0, 0));
    EXPECT_THROW(ImageSource::encode(dir_ / "noext", image), ImageDecodeError);
}

// =============================================================================
// Navigation
// =============================================================================

TEST_F(ImageSourceTest, OpenDirectoryHasNoCurrentImage) {
    make_sample_dir();

    source_.open_directory(dir_);

    EXPECT_EQ(source_.directory(), dir_);
    EXPECT_EQ(source_.paths().size(), 3u);
    EXPECT_FALSE(source_.index().has_value());
    EXPECT_TRUE(source_.current_image().empty());
    EXPECT_EQ(notifications_, 1);
}

TEST_F(ImageSourceTest, NextAndPrevious) {
    make_sample_dir();
    source_.open_directory(dir_);

    source_.next();
    EXPECT_EQ(source_.index(), 0u);
    EXPECT_EQ(source_.current_path().filename(), "a.JPG");
    EXPECT_EQ(source_.current_image().cols, 32);

    source_.next();
    source_.next();
    EXPECT_EQ(source_.index(), 2u);

    // Stays on the last image
    source_.next();
    EXPECT_EQ(source_.index(), 2u);

    source_.previous();
    EXPECT_EQ(source_.index(), 1u);
}

TEST_F(ImageSourceTest, PreviousFromNothingGoesToLast) {
    make_sample_dir();
    source_.open_directory(dir_);

    source_.previous();

    EXPECT_EQ(source_.index(), 2u);
}

TEST_F(ImageSourceTest, FirstAndLast) {
    make_sample_dir();
    source_.open_directory(dir_);

    source_.last();
    EXPECT_EQ(source_.current_path().filename(), "c.bmp");
    source_.first();
    EXPECT_EQ(source_.current_path().filename(), "a.JPG");
}

TEST_F(ImageSourceTest, SetIndexOutOfRangeThrows) {
    make_sample_dir();
    source_.open_directory(dir_);

    EXPECT_THROW(source_.set_index(3), std::out_of_range);
    EXPECT_FALSE(source_.index().has_value());
}

TEST_F(ImageSourceTest, ClearIndex) {
    make_sample_dir();
    source_.open_directory(dir_);
    source_.first();

    source_.set_index(std::nullopt);

    EXPECT_FALSE(source_.index().has_value());
    EXPECT_TRUE(source_.current_path().empty());
    EXPECT_TRUE(source_.current_image().empty());
}

TEST_F(ImageSourceTest, NavigationOnEmptyDirectoryIsNoop) {
    source_.open_directory(dir_);
    const int before = notifications_;

    source_.next();
    source_.previous();
    source_.first();
    source_.last();

    EXPECT_EQ(notifications_, before);
    EXPECT_FALSE(source_.index().has_value());
}

TEST_F(ImageSourceTest, OpenFileSelectsIt) {
    const auto path = make_image("single.png");

    source_.open_file(path);

    EXPECT_EQ(source_.paths().size(), 1u);
    EXPECT_EQ(source_.index(), 0u);
    EXPECT_EQ(source_.current_path(), path);
    EXPECT_FALSE(source_.current_image().empty());
}

TEST_F(ImageSourceTest, ResetClearsEverything) {
    make_sample_dir();
    source_.open_directory(dir_);
    source_.first();

    source_.reset();

    EXPECT_TRUE(source_.paths().empty());
    EXPECT_TRUE(source_.directory().empty());
    EXPECT_FALSE(source_.index().has_value());
}

}  // namespace bba
