/**
 * @file test_session_record.cpp
 * @brief Unit tests for the SessionRecord TOML codec.
 */

#include "persistence/session_record.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace diagnostics_engine;
using namespace std::chrono_literals;

namespace {

Timestamp ms_now() {
    return std::chrono::time_point_cast<Millis>(std::chrono::system_clock::now());
}

SessionRecord finished_record() {
    auto t0 = ms_now();
    SessionRecord record;
    record.id = "5f0c2d1e-7a3b-4c8d-9e0f-112233445566";
    record.name = "diagnosticsSession-42-2024-03-05_07.08.09.045Z_Ab3x";
    record.description = "slow \"checkout\" page";
    record.user = "operator";
    record.status = SessionStatus::Succeeded;
    record.created_at = t0;
    record.started_at = t0 + 5ms;
    record.ended_at = t0 + 2500ms;
    record.runners = {
        RunnerRecord{"heartbeat", "Heartbeat", TaskCadence{0ms, 100ms, 10}, 10, RunnerState::Finished, std::nullopt},
        RunnerRecord{"threads", "Thread List", TaskCadence{50ms, 200ms, 5}, 0, RunnerState::FailedToStart,
                     std::string{"before_start failed: no disk"}},
    };
    return record;
}

}  // namespace

TEST(SessionRecordTest, EncodeDecodeKeepsEveryField) {
    SessionRecord created_only;
    created_only.id = "2";
    created_only.name = "diagnosticsSession-never-run";
    created_only.status = SessionStatus::None;
    created_only.created_at = ms_now();

    std::vector<SessionRecord> records{finished_record(), created_only};
    auto decoded = decode_records(encode_records(records));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(*decoded, records);
}

TEST(SessionRecordTest, EnumsAreWrittenAsNames) {
    auto text = encode_records({finished_record()});
    EXPECT_NE(text.find("sessions"), std::string::npos);
    EXPECT_NE(text.find("SUCCEEDED"), std::string::npos);
    EXPECT_NE(text.find("failed_to_start"), std::string::npos);
    EXPECT_NE(text.find("finished"), std::string::npos);
}

TEST(SessionRecordTest, MissingStatusStaysMissing) {
    auto decoded = decode_records(R"(
        [[sessions]]
        id = "abc"
        name = "diagnosticsSession-crashed"
        created_at = "2024-03-05T07:08:09.045Z"
        started_at = "2024-03-05T07:08:10Z"
    )");
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    ASSERT_EQ(decoded->size(), 1u);
    const auto& record = decoded->front();
    EXPECT_FALSE(record.status.has_value());
    EXPECT_TRUE(record.started_at.has_value());
    EXPECT_FALSE(record.ended_at.has_value());
    EXPECT_TRUE(record.runners.empty());
}

TEST(SessionRecordTest, EmptyDocumentHasNoRecords) {
    auto decoded = decode_records("");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST(SessionRecordTest, RejectsMalformedInput) {
    auto syntax = decode_records("[[sessions]\nid = ");
    ASSERT_FALSE(syntax.has_value());
    EXPECT_EQ(syntax.error().code, ErrorCode::Parse);

    auto no_id = decode_records("[[sessions]]\nname = \"x\"\n");
    ASSERT_FALSE(no_id.has_value());
    EXPECT_EQ(no_id.error().code, ErrorCode::Parse);

    auto bad_status = decode_records("[[sessions]]\nid = \"1\"\nname = \"x\"\nstatus = \"DONE\"\n");
    ASSERT_FALSE(bad_status.has_value());

    auto bad_time = decode_records("[[sessions]]\nid = \"1\"\nname = \"x\"\nstarted_at = \"noon\"\n");
    ASSERT_FALSE(bad_time.has_value());

    auto bad_state = decode_records(
        "[[sessions]]\nid = \"1\"\nname = \"x\"\n[[sessions.runners]]\ntask_id = \"t\"\nstate = \"paused\"\n");
    ASSERT_FALSE(bad_state.has_value());
}

class SessionRecordFileTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "de_test_records";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(SessionRecordFileTest, SaveThenLoad) {
    auto path = dir_ / "nested" / "diagnosticsSessions.toml";
    std::vector<SessionRecord> records{finished_record()};
    ASSERT_TRUE(save_records(path, records));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    auto loaded = load_records(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(*loaded, records);

    ASSERT_TRUE(save_records(path, {}));
    auto emptied = load_records(path);
    ASSERT_TRUE(emptied.has_value());
    EXPECT_TRUE(emptied->empty());
}

TEST_F(SessionRecordFileTest, MissingFileIsEmpty) {
    auto loaded = load_records(dir_ / "absent.toml");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->empty());
}
