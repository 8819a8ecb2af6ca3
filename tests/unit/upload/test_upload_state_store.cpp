/**
 * @file test_upload_state_store.cpp
 * @brief Unit tests for upload_state_store
 */

#include <gtest/gtest.h>

#include <kcenon/vector_transfer/upload/upload_state_store.h>

#include <chrono>
#include <filesystem>
#include <fstream>

namespace kcenon::vector_transfer::test {

class UploadStateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("vector_trans_test_states_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto make_state(const std::string& key = "shard-0.bin") -> upload_state {
        upload_state state;
        state.bucket = "vectors";
        state.key = key;
        state.part_size = 1024;
        state.upload_id = "upload-" + key;
        state.parts = {"\"etag-1\"", "\"etag-2\""};
        state.uploaded_bytes = 2048;
        return state;
    }

    std::filesystem::path test_dir_;
};

// ============================================================================
// Configuration
// ============================================================================

TEST_F(UploadStateStoreTest, DefaultConfigUsesTempDirectory) {
    upload_state_store_config config;
    EXPECT_EQ(config.state_directory.filename(), "vector_trans_states");
    EXPECT_GT(config.state_ttl.count(), 0);
}

TEST_F(UploadStateStoreTest, CreatesStateDirectory) {
    auto nested = test_dir_ / "a" / "b";
    upload_state_store states(upload_state_store_config{nested});

    EXPECT_TRUE(std::filesystem::is_directory(nested));
    EXPECT_EQ(states.config().state_directory, nested);
}

// ============================================================================
// Single uploads
// ============================================================================

TEST_F(UploadStateStoreTest, SaveAndLoad) {
    upload_state_store states(upload_state_store_config{test_dir_});
    auto state = make_state();

    ASSERT_TRUE(states.save_state("shard-0", state).has_value());
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "shard-0.json"));

    auto loaded = states.load_state("shard-0");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value(), state);
}

TEST_F(UploadStateStoreTest, LoadFromFreshInstanceReadsFile) {
    auto state = make_state();
    {
        upload_state_store writer(upload_state_store_config{test_dir_});
        ASSERT_TRUE(writer.save_state("shard-0", state).has_value());
    }

    upload_state_store reader(upload_state_store_config{test_dir_});
    auto loaded = reader.load_state("shard-0");

    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded.value(), state);
}

TEST_F(UploadStateStoreTest, SaveOverwritesPreviousState) {
    upload_state_store states(upload_state_store_config{test_dir_});
    auto state = make_state();
    ASSERT_TRUE(states.save_state("shard-0", state).has_value());

    state.parts.push_back("\"etag-3\"");
    state.uploaded_bytes += state.part_size;
    ASSERT_TRUE(states.save_state("shard-0", state).has_value());

    upload_state_store reader(upload_state_store_config{test_dir_});
    auto loaded = reader.load_state("shard-0");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value().parts.size(), 3u);
    EXPECT_EQ(loaded.value().uploaded_bytes, 3072u);
}

TEST_F(UploadStateStoreTest, MissingStateIsFileNotFound) {
    upload_state_store states(upload_state_store_config{test_dir_});

    auto loaded = states.load_state("nothing-here");

    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::file_not_found);
}

TEST_F(UploadStateStoreTest, CorruptedFileIsReported) {
    {
        std::ofstream file(test_dir_ / "broken.json");
        file << "{\"bucket\": \"vectors\", ";
    }
    upload_state_store states(upload_state_store_config{test_dir_});

    auto loaded = states.load_state("broken");

    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::state_corrupted);
}

TEST_F(UploadStateStoreTest, InvalidNamesAreRejected) {
    upload_state_store states(upload_state_store_config{test_dir_});
    auto state = make_state();

    for (const std::string name : {"", "../escape", "a/b", ".hidden", "with space"}) {
        auto saved = states.save_state(name, state);
        ASSERT_FALSE(saved.has_value()) << name;
        EXPECT_EQ(saved.error().code, error_code::invalid_argument) << name;
        EXPECT_FALSE(states.has_state(name)) << name;
    }
}

// ============================================================================
// Upload sets
// ============================================================================

TEST_F(UploadStateStoreTest, SaveAndLoadSetState) {
    multi_upload_state set;
    set.uploads = {make_state("a.bin"), make_state("b.bin")};
    {
        upload_state_store writer(upload_state_store_config{test_dir_});
        ASSERT_TRUE(writer.save_set_state("batch-42", set).has_value());
    }

    upload_state_store reader(upload_state_store_config{test_dir_});
    auto loaded = reader.load_set_state("batch-42");

    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded.value(), set);
}

TEST_F(UploadStateStoreTest, SetStateIsNotASingleState) {
    multi_upload_state set;
    set.uploads = {make_state()};
    upload_state_store states(upload_state_store_config{test_dir_});
    ASSERT_TRUE(states.save_set_state("batch", set).has_value());

    auto loaded = states.load_state("batch");

    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::state_corrupted);
}

// ============================================================================
// Management
// ============================================================================

TEST_F(UploadStateStoreTest, DeleteState) {
    upload_state_store states(upload_state_store_config{test_dir_});
    ASSERT_TRUE(states.save_state("shard-0", make_state()).has_value());
    EXPECT_TRUE(states.has_state("shard-0"));

    ASSERT_TRUE(states.delete_state("shard-0").has_value());

    EXPECT_FALSE(states.has_state("shard-0"));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "shard-0.json"));
    EXPECT_EQ(states.load_state("shard-0").error().code, error_code::file_not_found);

    // Deleting an absent record succeeds
    EXPECT_TRUE(states.delete_state("shard-0").has_value());
}

TEST_F(UploadStateStoreTest, ListStatesIsSorted) {
    upload_state_store states(upload_state_store_config{test_dir_});
    ASSERT_TRUE(states.save_state("shard-2", make_state()).has_value());
    ASSERT_TRUE(states.save_state("shard-0", make_state()).has_value());
    multi_upload_state set;
    ASSERT_TRUE(states.save_set_state("batch", set).has_value());
    {
        std::ofstream other(test_dir_ / "notes.txt");
        other << "ignored";
    }

    auto names = states.list_states();

    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "batch");
    EXPECT_EQ(names[1], "shard-0");
    EXPECT_EQ(names[2], "shard-2");
}

TEST_F(UploadStateStoreTest, CleanupRemovesOnlyExpiredStates) {
    upload_state_store_config config{test_dir_};
    config.state_ttl = std::chrono::seconds(3600);
    upload_state_store states(config);

    ASSERT_TRUE(states.save_state("old", make_state()).has_value());
    ASSERT_TRUE(states.save_state("fresh", make_state()).has_value());

    auto old_path = test_dir_ / "old.json";
    std::filesystem::last_write_time(
        old_path, std::filesystem::file_time_type::clock::now() - std::chrono::hours(2));

    auto removed = states.cleanup_expired_states();

    EXPECT_EQ(removed, 1u);
    EXPECT_FALSE(states.has_state("old"));
    EXPECT_TRUE(states.has_state("fresh"));
}

}  // namespace kcenon::vector_transfer::test
