/**
 * @file    label_registry_test.cpp
 * @brief   Unit tests for label tracking and label list building
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/label_registry.hpp"

#include <filesystem>
#include <fstream>

namespace bba {

class LabelRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("bba_labels_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream(dir_ / name) << content;
    }

    std::filesystem::path dir_;
};

// =============================================================================
// Current Label
// =============================================================================

TEST_F(LabelRegistryTest, CurrentLabelNotifiesOnChange) {
    LabelRegistry labels;
    std::vector<std::string> seen;
    labels.subscribe([&seen](const std::string& label) { seen.push_back(label); });

    labels.set_current_label("dog");
    labels.set_current_label("dog");
    labels.set_current_label("");

    EXPECT_EQ(labels.current_label(), "");
    EXPECT_EQ(seen, (std::vector<std::string>{"dog", ""}));
}

// =============================================================================
// Output Directory Scan
// =============================================================================

TEST_F(LabelRegistryTest, UniqueLabelsAcrossFilesAndLayouts) {
    write("a.json", R"([{"label": "dog", "shape": "BBox", "p0": [0, 0], "p1": [1, 1]},
                        {"label": "cat", "shape": "BBox", "p0": [0, 0], "p1": [1, 1]}])");
    write("b.json", R"({"annotations": [{"label": "bird", "bbox": [0, 0, 1, 1]},
                                        {"label": "dog", "bbox": [0, 0, 1, 1]}]})");
    write("c.json", R"([{"label": "", "bbox": [0, 0, 1, 1]}])");
    write("broken.json", "{oops");
    write("notes.txt", R"([{"label": "ignored"}])");

    LabelRegistry labels(dir_);

    EXPECT_EQ(labels.all_unique_labels(), (std::vector<std::string>{"bird", "cat", "dog"}));
}

TEST_F(LabelRegistryTest, MissingOutputDirHasNoLabels) {
    LabelRegistry labels(dir_ / "missing");
    EXPECT_TRUE(labels.all_unique_labels().empty());

    LabelRegistry unset;
    EXPECT_TRUE(unset.all_unique_labels().empty());
}

TEST_F(LabelRegistryTest, SetOutputDir) {
    write("a.json", R"([{"label": "fox", "bbox": [0, 0, 1, 1]}])");
    LabelRegistry labels;

    labels.set_output_dir(dir_);

    EXPECT_EQ(labels.output_dir(), dir_);
    EXPECT_EQ(labels.all_unique_labels(), std::vector<std::string>{"fox"});
}

// =============================================================================
// Label Lists
// =============================================================================

class LabelListTest : public ::testing::Test {
protected:
    Annotations annotations_{
        Annotation("cat", Box(0, 0, 1, 1)),
        Annotation("dog", Box(0, 0, 1, 1)),
        Annotation("", Box(0, 0, 1, 1)),
        Annotation("cat", Box(0, 0, 1, 1)),
    };
};

TEST_F(LabelListTest, IndividualRows) {
    const auto rows = LabelRegistry::build_label_list(annotations_, false);

    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].text, "cat #1");
    EXPECT_EQ(rows[0].index, 0u);
    EXPECT_EQ(rows[1].text, "dog #2");
    // Unlabeled annotations are not listed, numbering keeps list positions
    EXPECT_EQ(rows[2].text, "cat #4");
    EXPECT_EQ(rows[2].index, 3u);
}

TEST_F(LabelListTest, GroupedRows) {
    const auto rows = LabelRegistry::build_label_list(annotations_, true);

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].text, "cat (2)");
    EXPECT_EQ(rows[0].label, "cat");
    EXPECT_EQ(rows[0].count, 2u);
    EXPECT_FALSE(rows[0].index.has_value());
    EXPECT_EQ(rows[1].text, "dog");
    EXPECT_EQ(rows[1].count, 1u);
}

TEST_F(LabelListTest, CountsInFirstSeenOrder) {
    const auto counts = LabelRegistry::label_counts(annotations_);

    ASSERT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts[0], (std::pair<std::string, size_t>{"cat", 2}));
    EXPECT_EQ(counts[1], (std::pair<std::string, size_t>{"dog", 1}));
}

TEST_F(LabelListTest, EmptyList) {
    EXPECT_TRUE(LabelRegistry::build_label_list({}, true).empty());
    EXPECT_TRUE(LabelRegistry::label_counts({}).empty());
}

}  // namespace bba
