/**
 * @file    cli_test.cpp
 * @brief   End-to-end tests for the command-line subcommands
 * @license MIT
 */

#include <gtest/gtest.h>
#include "cli/cli_app.hpp"
#include "core/annotation.hpp"
#include "core/image_source.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace bba::cli {

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("bba_cli_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    int run_cli(std::vector<std::string> args) {
        args.insert(args.begin(), "bbox-annotator");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return run(static_cast<int>(args.size()), argv.data());
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        const auto path = dir_ / name;
        std::ofstream(path) << content;
        return path;
    }

    [[nodiscard]] static nlohmann::json read_json(const std::filesystem::path& path) {
        std::ifstream file(path);
        return nlohmann::json::parse(file);
    }

    std::filesystem::path dir_;
};

// =============================================================================
// upgrade
// =============================================================================

TEST_F(CliTest, UpgradeRewritesLegacyFile) {
    const auto path = write_file("a.json", R"({"annotations": [{"label": "cat", "bbox": [1, 2, 3, 4]}]})");

    EXPECT_EQ(run_cli({"upgrade", path.string()}), 0);

    const auto doc = read_json(path);
    EXPECT_FALSE(is_legacy_document(doc));
    EXPECT_EQ(annotations_from_json(doc), (Annotations{Annotation("cat", Box(1, 2, 3, 4))}));
}

TEST_F(CliTest, UpgradeDryRunLeavesFileAlone) {
    const std::string legacy = R"([[[10, 20], [30, 40]]])";
    const auto path = write_file("b.json", legacy);

    EXPECT_EQ(run_cli({"upgrade", "--dry-run", path.string()}), 0);

    EXPECT_TRUE(is_legacy_document(read_json(path)));
}

TEST_F(CliTest, UpgradeSkipsCanonicalFile) {
    const auto path = dir_ / "c.json";
    write_annotations(path, {Annotation("dog", Box(0, 0, 5, 5))});

    EXPECT_EQ(run_cli({"upgrade", path.string()}), 0);
}

TEST_F(CliTest, UpgradeReportsFailures) {
    const auto good = write_file("good.json", R"([{"label": "a", "bbox": [0, 0, 1, 1]}])");
    const auto bad = write_file("bad.json", "{broken");

    EXPECT_EQ(run_cli({"upgrade", good.string(), bad.string(), (dir_ / "none.json").string()}), 1);

    EXPECT_FALSE(is_legacy_document(read_json(good)));
}

// =============================================================================
// list / labels
// =============================================================================

TEST_F(CliTest, ListCountsAnnotations) {
    const auto images = dir_ / "images";
    const auto output = dir_ / "output";
    std::filesystem::create_directories(images);
    std::filesystem::create_directories(output);
    ImageSource::encode(images / "one.png", cv::Mat(4, 4, CV_8UC3, cv::Scalar(0, 0, 0)));
    write_annotations(output / "one.json", {Annotation("a", Box(0, 0, 1, 1))});

    EXPECT_EQ(run_cli({"list", images.string(), "--output-dir", output.string()}), 0);
}

TEST_F(CliTest, ListFailsOnMissingDirectory) {
    EXPECT_EQ(run_cli({"list", (dir_ / "missing").string(), "--output-dir", dir_.string()}), 1);
}

TEST_F(CliTest, LabelsSucceeds) {
    write_annotations(dir_ / "x.json", {Annotation("fox", Box(0, 0, 1, 1))});

    EXPECT_EQ(run_cli({"labels", "--output-dir", dir_.string()}), 0);
}

// =============================================================================
// render
// =============================================================================

TEST_F(CliTest, RenderWritesViewportSizedImage) {
    const auto image = dir_ / "in.png";
    ImageSource::encode(image, cv::Mat(300, 400, CV_8UC3, cv::Scalar(40, 40, 40)));
    const auto annotations = dir_ / "in.json";
    write_annotations(annotations, {Annotation("cat", Box(50, 50, 150, 150))});
    const auto output = dir_ / "out" / "render.png";

    EXPECT_EQ(run_cli({"render", image.string(), "-o", output.string(),
                       "--annotations", annotations.string(),
                       "--size", "320x240", "--zoom", "2", "--edit-mode"}), 0);

    ASSERT_TRUE(std::filesystem::exists(output));
    const cv::Mat rendered = ImageSource::decode(output);
    EXPECT_EQ(rendered.size(), cv::Size(320, 240));
}

TEST_F(CliTest, RenderRejectsBadSize) {
    const auto image = dir_ / "in.png";
    ImageSource::encode(image, cv::Mat(10, 10, CV_8UC3, cv::Scalar(0, 0, 0)));

    EXPECT_EQ(run_cli({"render", image.string(), "-o", (dir_ / "o.png").string(),
                       "--size", "big"}), 1);
}

TEST_F(CliTest, RenderFailsForMissingImage) {
    EXPECT_EQ(run_cli({"render", (dir_ / "none.png").string(), "-o",
                       (dir_ / "o.png").string()}), 1);
}

TEST_F(CliTest, MissingSubcommandFails) {
    EXPECT_NE(run_cli({}), 0);
}

}  // namespace bba::cli
