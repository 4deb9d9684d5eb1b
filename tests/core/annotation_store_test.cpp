/**
 * @file    annotation_store_test.cpp
 * @brief   Unit tests for the annotation session store
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/annotation_store.hpp"
#include "core/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace bba {

class AnnotationStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("bba_store_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        store_.subscribe([this](StoreEvent event) { events_.push_back(event); });
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    // Open a session holding "cat", "dog", "cat"
    void open_sample() {
        const auto path = dir_ / "sample.json";
        write_annotations(path, {
            Annotation("cat", Box(0, 0, 10, 10)),
            Annotation("dog", Box(20, 20, 30, 30)),
            Annotation("cat", Box(40, 40, 50, 50)),
        });
        store_.open(path);
        events_.clear();
    }

    [[nodiscard]] bool saw(StoreEvent event) const {
        return std::find(events_.begin(), events_.end(), event) != events_.end();
    }

    std::filesystem::path dir_;
    AnnotationStore store_;
    std::vector<StoreEvent> events_;
};

// =============================================================================
// Paths
// =============================================================================

TEST(AnnotationStorePathTest, AnnotationPathUsesImageStem) {
    EXPECT_EQ(AnnotationStore::annotation_path_for("/out", "/images/cat.01.png"),
              std::filesystem::path("/out/cat.01.json"));
}

// =============================================================================
// Session
// =============================================================================

TEST_F(AnnotationStoreTest, OpenMissingFileStartsEmpty) {
    store_.open(dir_ / "new.json");

    EXPECT_TRUE(store_.is_loaded());
    EXPECT_TRUE(store_.annotations().empty());
    EXPECT_FALSE(store_.has_unsaved_changes());
    EXPECT_TRUE(saw(StoreEvent::Loaded));
}

TEST_F(AnnotationStoreTest, OpenExistingFile) {
    open_sample();

    ASSERT_EQ(store_.annotations().size(), 3u);
    EXPECT_EQ(store_.annotations()[1].label, "dog");
    EXPECT_FALSE(store_.selected_index().has_value());
}

TEST_F(AnnotationStoreTest, OpenCorruptFileThrows) {
    const auto path = dir_ / "corrupt.json";
    std::ofstream(path) << "{not json";

    EXPECT_THROW(store_.open(path), AnnotationFormatError);
}

TEST_F(AnnotationStoreTest, FailedOpenKeepsPreviousSession) {
    open_sample();
    const auto sample = store_.path();
    store_.add(Annotation("bird", Box(1, 1, 2, 2)));
    const auto corrupt = dir_ / "corrupt.json";
    std::ofstream(corrupt) << "{not json";
    events_.clear();

    EXPECT_THROW(store_.open(corrupt), AnnotationFormatError);

    EXPECT_EQ(store_.path(), sample);
    EXPECT_EQ(store_.annotations().size(), 4u);
    EXPECT_TRUE(store_.has_unsaved_changes());
    EXPECT_FALSE(saw(StoreEvent::Loaded));

    // Saving still targets the original file
    EXPECT_TRUE(store_.save());
    EXPECT_EQ(read_annotations(sample).size(), 4u);
    std::ifstream file(corrupt);
    const std::string content((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "{not json");
}

TEST_F(AnnotationStoreTest, OpenEmptyPathResets) {
    open_sample();
    store_.open({});

    EXPECT_FALSE(store_.is_loaded());
    EXPECT_TRUE(store_.path().empty());
    EXPECT_TRUE(saw(StoreEvent::Reset));
}

TEST_F(AnnotationStoreTest, ReopeningSamePathKeepsEdits) {
    open_sample();
    store_.add(Annotation("bird", Box(1, 1, 2, 2)));

    store_.open(store_.path());

    EXPECT_EQ(store_.annotations().size(), 4u);
    EXPECT_TRUE(store_.has_unsaved_changes());
}

TEST_F(AnnotationStoreTest, AccessBeforeLoadThrows) {
    EXPECT_THROW((void)store_.annotations(), PreconditionError);
    EXPECT_THROW(store_.add(Annotation("x", Box())), PreconditionError);
    EXPECT_THROW(store_.load(), PreconditionError);
    EXPECT_THROW((void)store_.save(), PreconditionError);
}

// =============================================================================
// Save
// =============================================================================

TEST_F(AnnotationStoreTest, SaveWritesAndClearsDirty) {
    const auto path = dir_ / "nested" / "out.json";
    store_.open(path);
    store_.add(Annotation("cat", Box(1, 2, 3, 4)));
    ASSERT_TRUE(store_.has_unsaved_changes());

    EXPECT_TRUE(store_.save());

    EXPECT_FALSE(store_.has_unsaved_changes());
    EXPECT_TRUE(saw(StoreEvent::Saved));
    const Annotations saved = read_annotations(path);
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(saved[0], Annotation("cat", Box(1, 2, 3, 4)));
}

TEST_F(AnnotationStoreTest, SaveWithoutChangesIsSkipped) {
    store_.open(dir_ / "untouched.json");

    EXPECT_FALSE(store_.save());
    EXPECT_FALSE(std::filesystem::exists(dir_ / "untouched.json"));
}

TEST_F(AnnotationStoreTest, SaveUpgradesLegacyFile) {
    const auto path = dir_ / "legacy.json";
    std::ofstream(path) << R"({"annotations": [{"label": "cat", "bbox": [1, 2, 3, 4]}]})";
    store_.open(path);
    store_.rename_by_label("cat", "kitten");

    ASSERT_TRUE(store_.save());

    std::ifstream file(path);
    const auto doc = nlohmann::json::parse(file);
    EXPECT_FALSE(is_legacy_document(doc));
    EXPECT_EQ(doc[0]["label"], "kitten");
}

// =============================================================================
// Selection
// =============================================================================

TEST_F(AnnotationStoreTest, SelectNotifiesOnChange) {
    open_sample();

    store_.select(1);
    EXPECT_EQ(store_.selected_index(), 1u);
    ASSERT_NE(store_.selected_annotation(), nullptr);
    EXPECT_EQ(store_.selected_annotation()->label, "dog");
    EXPECT_EQ(events_, std::vector<StoreEvent>{StoreEvent::SelectionChanged});

    store_.select(1);
    EXPECT_EQ(events_.size(), 1u);
}

TEST_F(AnnotationStoreTest, SelectOutOfRangeThrows) {
    open_sample();

    EXPECT_THROW(store_.select(3), std::out_of_range);
    EXPECT_FALSE(store_.selected_index().has_value());
}

TEST_F(AnnotationStoreTest, SelectionIsClearedOnLoad) {
    open_sample();
    store_.select(0);

    store_.open(dir_ / "other.json");

    EXPECT_FALSE(store_.selected_index().has_value());
    EXPECT_EQ(store_.selected_annotation(), nullptr);
}

// =============================================================================
// Mutation
// =============================================================================

TEST_F(AnnotationStoreTest, AddMarksDirty) {
    open_sample();

    store_.add(Annotation("bird", Box(1, 1, 2, 2)));

    EXPECT_EQ(store_.annotations().size(), 4u);
    EXPECT_TRUE(store_.has_unsaved_changes());
    EXPECT_TRUE(saw(StoreEvent::DirtyChanged));
    EXPECT_TRUE(saw(StoreEvent::Changed));
}

TEST_F(AnnotationStoreTest, SetBoxReplacesGeometry) {
    open_sample();

    store_.set_box(2, Box(1, 1, 5, 5));

    EXPECT_EQ(store_.annotations()[2].box(), Box(1, 1, 5, 5));
    EXPECT_THROW(store_.set_box(9, Box()), std::out_of_range);
}

TEST_F(AnnotationStoreTest, SetSelectedBoxWithoutSelectionIsIgnored) {
    open_sample();

    store_.set_selected_box(Box(1, 1, 5, 5));

    EXPECT_FALSE(store_.has_unsaved_changes());
}

TEST_F(AnnotationStoreTest, RenameSelected) {
    open_sample();
    store_.select(1);

    store_.rename_selected("wolf");

    EXPECT_EQ(store_.annotations()[1].label, "wolf");
    EXPECT_TRUE(store_.has_unsaved_changes());
}

TEST_F(AnnotationStoreTest, RenameToSameLabelIsSkipped) {
    open_sample();
    store_.select(1);

    store_.rename_selected("dog");

    EXPECT_FALSE(store_.has_unsaved_changes());
}

TEST_F(AnnotationStoreTest, DeleteSelectedClearsSelection) {
    open_sample();
    store_.select(0);

    store_.delete_selected();

    ASSERT_EQ(store_.annotations().size(), 2u);
    EXPECT_EQ(store_.annotations()[0].label, "dog");
    EXPECT_FALSE(store_.selected_index().has_value());
    EXPECT_TRUE(saw(StoreEvent::SelectionChanged));
    EXPECT_TRUE(store_.has_unsaved_changes());
}

TEST_F(AnnotationStoreTest, DeleteByLabelRemovesGroup) {
    open_sample();

    EXPECT_EQ(store_.delete_by_label("cat"), 2u);

    ASSERT_EQ(store_.annotations().size(), 1u);
    EXPECT_EQ(store_.annotations()[0].label, "dog");
    EXPECT_TRUE(store_.has_unsaved_changes());
}

TEST_F(AnnotationStoreTest, DeleteByLabelShiftsSelection) {
    open_sample();
    store_.select(1);

    store_.delete_by_label("cat");

    EXPECT_EQ(store_.selected_index(), 0u);
    EXPECT_EQ(store_.selected_annotation()->label, "dog");
}

TEST_F(AnnotationStoreTest, DeleteByUnknownLabelChangesNothing) {
    open_sample();

    EXPECT_EQ(store_.delete_by_label("zebra"), 0u);
    EXPECT_FALSE(store_.has_unsaved_changes());
    EXPECT_TRUE(events_.empty());
}

TEST_F(AnnotationStoreTest, RenameByLabel) {
    open_sample();

    EXPECT_EQ(store_.rename_by_label("cat", "lion"), 2u);
    EXPECT_EQ(store_.annotations()[0].label, "lion");
    EXPECT_EQ(store_.annotations()[2].label, "lion");
    EXPECT_EQ(store_.rename_by_label("lion", "lion"), 0u);
}

TEST_F(AnnotationStoreTest, UnsubscribeStopsEvents) {
    std::vector<StoreEvent> extra;
    const auto id = store_.subscribe([&extra](StoreEvent e) { extra.push_back(e); });
    store_.unsubscribe(id);

    open_sample();

    EXPECT_TRUE(extra.empty());
}

}  // namespace bba
