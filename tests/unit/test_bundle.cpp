/**
 * @file test_bundle.cpp
 * @brief Unit tests for the .tar.zst bundle writer and reader.
 */

#include "archive/bundle_reader.hpp"
#include "archive/bundle_writer.hpp"
#include "archive/tar_format.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace diagnostics_engine;

namespace {

Timestamp at_seconds(int64_t secs) {
    return Timestamp{std::chrono::seconds{secs}};
}

}  // namespace

class BundleTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "de_test_bundle";
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }
};

TEST_F(BundleTest, WritesAndReadsEntries) {
    auto path = dir_ / "out.tar.zst";
    auto source = write_file("source.log", std::string(200'000, 'z') + "tail");
    {
        auto writer = BundleWriter::open(path);
        ASSERT_TRUE(writer.has_value()) << writer.error().message;
        ASSERT_TRUE((*writer)->add("manifest.md", "# Title\n", at_seconds(1'700'000'000)));
        ASSERT_TRUE((*writer)->add("empty.txt", "", at_seconds(1'700'000'001)));
        ASSERT_TRUE((*writer)->add_file("task/source.log", source, at_seconds(1'700'000'002)));
        EXPECT_EQ((*writer)->entry_count(), 3u);
        EXPECT_FALSE(std::filesystem::exists(path));
        ASSERT_TRUE((*writer)->finish());
    }
    ASSERT_TRUE(std::filesystem::exists(path));

    auto reader = BundleReader::open(path);
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    ASSERT_EQ(reader->size(), 3u);
    EXPECT_EQ(reader->names(), (std::vector<std::string>{"manifest.md", "empty.txt", "task/source.log"}));

    const auto* manifest = reader->find("manifest.md");
    ASSERT_NE(manifest, nullptr);
    EXPECT_EQ(manifest->data, "# Title\n");
    EXPECT_EQ(manifest->mtime, at_seconds(1'700'000'000));

    const auto* log = reader->find("task/source.log");
    ASSERT_NE(log, nullptr);
    EXPECT_EQ(log->data.size(), 200'004u);
    EXPECT_EQ(log->data.substr(199'998), "zztail");
    EXPECT_EQ(log->mtime, at_seconds(1'700'000'002));

    EXPECT_TRUE(reader->find("empty.txt")->data.empty());
}

TEST_F(BundleTest, LongNamesSurvive) {
    auto path = dir_ / "long.tar.zst";
    // No '/' split fits: the file name alone exceeds the 100-byte field.
    const std::string long_leaf = "dir/" + std::string(140, 'a') + ".txt";
    // Splits into prefix and name.
    const std::string deep = std::string(90, 'p') + "/" + std::string(60, 'q') + "/file.txt";

    {
        auto writer = BundleWriter::open(path);
        ASSERT_TRUE(writer.has_value());
        ASSERT_TRUE((*writer)->add(long_leaf, "leaf", at_seconds(10)));
        ASSERT_TRUE((*writer)->add(deep, "deep", at_seconds(20)));
        ASSERT_TRUE((*writer)->finish());
    }

    auto reader = BundleReader::open(path);
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    ASSERT_EQ(reader->size(), 2u);
    ASSERT_TRUE(reader->contains(long_leaf));
    EXPECT_EQ(reader->find(long_leaf)->data, "leaf");
    ASSERT_TRUE(reader->contains(deep));
    EXPECT_EQ(reader->find(deep)->data, "deep");
}

TEST_F(BundleTest, UnfinishedBundleLeavesNothing) {
    auto path = dir_ / "abandoned.tar.zst";
    {
        auto writer = BundleWriter::open(path);
        ASSERT_TRUE(writer.has_value());
        ASSERT_TRUE((*writer)->add("a.txt", "a", at_seconds(1)));
    }
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_TRUE(std::filesystem::is_empty(dir_));
}

TEST_F(BundleTest, FinishReplacesExistingFile) {
    auto path = write_file("existing.tar.zst", "not a bundle");
    auto writer = BundleWriter::open(path);
    ASSERT_TRUE(writer.has_value());
    ASSERT_TRUE((*writer)->add("fresh.txt", "new", at_seconds(1)));
    ASSERT_TRUE((*writer)->finish());

    auto reader = BundleReader::open(path);
    ASSERT_TRUE(reader.has_value());
    EXPECT_TRUE(reader->contains("fresh.txt"));
}

TEST_F(BundleTest, AddAfterFinishIsRejected) {
    auto writer = BundleWriter::open(dir_ / "closed.tar.zst");
    ASSERT_TRUE(writer.has_value());
    ASSERT_TRUE((*writer)->finish());
    auto r = (*writer)->add("late.txt", "late", at_seconds(1));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::IllegalState);
}

TEST_F(BundleTest, MissingSourceFileFailsWithoutCorruptingBundle) {
    auto path = dir_ / "partial.tar.zst";
    auto writer = BundleWriter::open(path);
    ASSERT_TRUE(writer.has_value());
    auto r = (*writer)->add_file("gone.txt", dir_ / "gone.txt", at_seconds(1));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Io);
    ASSERT_TRUE((*writer)->add("kept.txt", "kept", at_seconds(1)));
    ASSERT_TRUE((*writer)->finish());

    auto reader = BundleReader::open(path);
    ASSERT_TRUE(reader.has_value());
    EXPECT_EQ(reader->names(), std::vector<std::string>{"kept.txt"});
}

TEST_F(BundleTest, EmptyEntryNameRejected) {
    auto writer = BundleWriter::open(dir_ / "x.tar.zst");
    ASSERT_TRUE(writer.has_value());
    auto r = (*writer)->add("", "data", at_seconds(1));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST_F(BundleTest, ReaderRejectsGarbage) {
    auto missing = BundleReader::open(dir_ / "missing.tar.zst");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto garbage = BundleReader::open(write_file("garbage.tar.zst", "definitely not zstd"));
    ASSERT_FALSE(garbage.has_value());
    EXPECT_EQ(garbage.error().code, ErrorCode::Compression);
}

TEST(TarFormatTest, OctalFields) {
    tar::Block block{};
    tar::write_octal(block, tar::SIZE_OFFSET, tar::SIZE_SIZE, 01234);
    EXPECT_EQ(tar::read_field(block, tar::SIZE_OFFSET, tar::SIZE_SIZE), "00000001234");
    EXPECT_EQ(tar::read_octal(block, tar::SIZE_OFFSET, tar::SIZE_SIZE), 01234u);
}

TEST(TarFormatTest, SplitNames) {
    EXPECT_EQ(tar::split_ustar_name("short.txt"),
              (std::pair<std::string, std::string>{"", "short.txt"}));

    auto split = tar::split_ustar_name(std::string(120, 'd') + "/leaf.txt");
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(split->first, std::string(120, 'd'));
    EXPECT_EQ(split->second, "leaf.txt");

    EXPECT_FALSE(tar::split_ustar_name(std::string(101, 'x')).has_value());
}

TEST(TarFormatTest, Padding) {
    EXPECT_EQ(tar::padding_for(0), 0u);
    EXPECT_EQ(tar::padding_for(1), 511u);
    EXPECT_EQ(tar::padding_for(512), 0u);
    EXPECT_EQ(tar::padding_for(513), 511u);
}
