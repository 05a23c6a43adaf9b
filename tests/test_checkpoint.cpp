/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "slotwise/checkpoint.hpp"
#include "slotwise/logger.hpp"
#include "test_util.hpp"

using namespace slotwise;
using slotwise::test::TempDir;
using slotwise::test::readFile;
using slotwise::test::writeFile;

TEST(CheckpointTest, MissingFileLoadsEmpty) {
    TempDir dir;
    CheckpointManager checkpoint(dir / "checkpoint.json");

    const auto [completed, failed] = checkpoint.load();
    EXPECT_TRUE(completed.empty());
    EXPECT_TRUE(failed.empty());
    EXPECT_FALSE(std::filesystem::exists(dir / "checkpoint.json"));
}

TEST(CheckpointTest, SaveThenLoadRestoresState) {
    TempDir dir;
    const auto file = dir / "checkpoint.json";
    {
        CheckpointManager writer(file);
        writer.save({"a.jpg", "b.jpg"}, {"c.jpg"}, 10);
    }

    CheckpointManager reader(file);
    const auto [completed, failed] = reader.load();
    EXPECT_EQ(completed, (IdSet{"a.jpg", "b.jpg"}));
    EXPECT_EQ(failed, (IdSet{"c.jpg"}));
    EXPECT_EQ(reader.getProgressStats().totalFiles, 10u);
    EXPECT_FALSE(std::filesystem::exists(reader.tempFile()));
}

TEST(CheckpointTest, FileUsesDocumentedLayout) {
    TempDir dir;
    const auto file = dir / "checkpoint.json";
    CheckpointManager checkpoint(file);
    checkpoint.save({"done"}, {"broken"}, 2);

    const auto state = nlohmann::json::parse(readFile(file));
    ASSERT_TRUE(state.is_object());
    EXPECT_EQ(state.at("completed"), nlohmann::json::array({"done"}));
    EXPECT_EQ(state.at("failed"), nlohmann::json::array({"broken"}));
    EXPECT_EQ(state.at("total_files").get<std::size_t>(), 2u);
    EXPECT_TRUE(state.at("start_time").is_number());
    EXPECT_TRUE(state.at("last_update").is_number());
    EXPECT_GE(state.at("last_update").get<double>(), state.at("start_time").get<double>());
    EXPECT_EQ(state.at("version").get<std::string>(), "1.0");
}

TEST(CheckpointTest, CorruptFileLoadsEmpty) {
    TempDir dir;
    const auto file = dir / "checkpoint.json";
    writeFile(file, "{\"completed\": [\"a\", ");

    CheckpointManager checkpoint(file);
    const auto [completed, failed] = checkpoint.load();
    EXPECT_TRUE(completed.empty());
    EXPECT_TRUE(failed.empty());
    EXPECT_FALSE(checkpoint.shouldSkip("a"));
}

TEST(CheckpointTest, WrongShapeLoadsEmpty) {
    TempDir dir;
    const auto file = dir / "checkpoint.json";

    for (const char* body : {"[1, 2, 3]",
                             "{\"completed\": \"a.jpg\", \"failed\": []}",
                             "{\"completed\": [\"a\"], \"failed\": [], \"total_files\": -4}",
                             "{\"completed\": [1, 2], \"failed\": []}"}) {
        writeFile(file, body);
        CheckpointManager checkpoint(file);
        const auto [completed, failed] = checkpoint.load();
        EXPECT_TRUE(completed.empty()) << body;
        EXPECT_TRUE(failed.empty()) << body;
    }
}

TEST(CheckpointTest, UnknownVersionStillLoads) {
    TempDir dir;
    const auto file = dir / "checkpoint.json";
    writeFile(file, R"({"completed": ["x"], "failed": [], "total_files": 1, "version": "0.9"})");

    CheckpointManager checkpoint(file);
    const auto [completed, failed] = checkpoint.load();
    EXPECT_EQ(completed, IdSet{"x"});
    EXPECT_TRUE(failed.empty());
}

TEST(CheckpointTest, IdInBothSetsIsKeptAsCompleted) {
    TempDir dir;
    const auto file = dir / "checkpoint.json";
    writeFile(file, R"({"completed": ["x", "y"], "failed": ["x", "z"], "total_files": 3, "version": "1.0"})");

    CheckpointManager checkpoint(file);
    const auto [completed, failed] = checkpoint.load();
    EXPECT_EQ(completed, (IdSet{"x", "y"}));
    EXPECT_EQ(failed, IdSet{"z"});
}

TEST(CheckpointTest, OutcomesEvictOppositeSet) {
    TempDir dir;
    CheckpointManager checkpoint(dir / "checkpoint.json", 0);

    checkpoint.updateProgress("x", Outcome::Failed);
    EXPECT_EQ(checkpoint.failed(), IdSet{"x"});

    checkpoint.updateProgress("x", Outcome::Completed);
    EXPECT_EQ(checkpoint.completed(), IdSet{"x"});
    EXPECT_TRUE(checkpoint.failed().empty());

    checkpoint.updateProgress("x", Outcome::Failed);
    EXPECT_TRUE(checkpoint.completed().empty());
    EXPECT_EQ(checkpoint.failed(), IdSet{"x"});
}

TEST(CheckpointTest, AutoSavesAfterInterval) {
    TempDir dir;
    const auto file = dir / "checkpoint.json";
    CheckpointManager checkpoint(file, 3);

    checkpoint.updateProgress("a", Outcome::Completed);
    checkpoint.updateProgress("b", Outcome::Failed);
    EXPECT_FALSE(std::filesystem::exists(file));
    EXPECT_EQ(checkpoint.pendingChanges(), 2u);

    checkpoint.updateProgress("c", Outcome::Completed);
    ASSERT_TRUE(std::filesystem::exists(file));
    EXPECT_EQ(checkpoint.pendingChanges(), 0u);

    CheckpointManager reader(file);
    const auto [completed, failed] = reader.load();
    EXPECT_EQ(completed, (IdSet{"a", "c"}));
    EXPECT_EQ(failed, IdSet{"b"});
}

TEST(CheckpointTest, AutoSaveCanBeSuppressed) {
    TempDir dir;
    const auto file = dir / "checkpoint.json";
    CheckpointManager checkpoint(file, 1);

    checkpoint.updateProgress("a", Outcome::Completed, false);
    checkpoint.updateProgress("b", Outcome::Completed, false);
    EXPECT_FALSE(std::filesystem::exists(file));
    EXPECT_EQ(checkpoint.pendingChanges(), 2u);

    checkpoint.flush();
    EXPECT_TRUE(std::filesystem::exists(file));
    EXPECT_EQ(checkpoint.pendingChanges(), 0u);
}

TEST(CheckpointTest, ShouldSkipOnlyCompleted) {
    TempDir dir;
    CheckpointManager checkpoint(dir / "checkpoint.json", 0);
    checkpoint.updateProgress("good", Outcome::Completed);
    checkpoint.updateProgress("bad", Outcome::Failed);

    EXPECT_TRUE(checkpoint.shouldSkip("good"));
    EXPECT_FALSE(checkpoint.shouldSkip("bad"));
    EXPECT_FALSE(checkpoint.shouldSkip("unseen"));
    EXPECT_FALSE(checkpoint.shouldSkip("good", true));
}

TEST(CheckpointTest, ProgressStatsFromLoadedState) {
    TempDir dir;
    const auto file = dir / "checkpoint.json";
    {
        CheckpointManager writer(file);
        writer.save({"a", "b"}, {"c"}, 10);
    }

    CheckpointManager checkpoint(file);
    (void)checkpoint.load();
    const auto stats = checkpoint.getProgressStats();
    EXPECT_EQ(stats.completedCount, 2u);
    EXPECT_EQ(stats.failedCount, 1u);
    EXPECT_EQ(stats.processedCount, 3u);
    EXPECT_EQ(stats.remainingCount, 7u);
    EXPECT_EQ(stats.totalFiles, 10u);
    EXPECT_NEAR(stats.progressPercentage, 30.0, 1e-9);
    EXPECT_NEAR(stats.successRate, 200.0 / 3.0, 1e-9);
    EXPECT_GE(stats.elapsed.count(), 0.0);
    EXPECT_GE(stats.estimatedRemaining.count(), 0.0);
}

TEST(CheckpointTest, ProgressStatsWithNothingProcessed) {
    TempDir dir;
    CheckpointManager checkpoint(dir / "checkpoint.json");
    checkpoint.setTotalFiles(5);

    const auto stats = checkpoint.getProgressStats();
    EXPECT_EQ(stats.processedCount, 0u);
    EXPECT_EQ(stats.remainingCount, 5u);
    EXPECT_DOUBLE_EQ(stats.successRate, 0.0);
    EXPECT_DOUBLE_EQ(stats.progressPercentage, 0.0);
    EXPECT_DOUBLE_EQ(stats.estimatedRemaining.count(), 0.0);
}

TEST(CheckpointTest, StaleTempFileDoesNotShadowRecord) {
    TempDir dir;
    const auto file = dir / "checkpoint.json";
    {
        CheckpointManager writer(file);
        writer.save({"kept"}, {}, 1);
    }
    // A crash between writing the temp file and renaming it leaves this behind.
    writeFile(std::filesystem::path(file.string() + ".tmp"), "{\"completed\": [\"half");

    CheckpointManager reader(file);
    const auto [completed, failed] = reader.load();
    EXPECT_EQ(completed, IdSet{"kept"});

    reader.updateProgress("next", Outcome::Completed, false);
    reader.flush();
    EXPECT_FALSE(std::filesystem::exists(reader.tempFile()));

    CheckpointManager again(file);
    EXPECT_EQ(again.load().first, (IdSet{"kept", "next"}));
}

TEST(CheckpointTest, FailedWriteLeavesPreviousRecordIntact) {
    TempDir dir;
    const auto file = dir / "checkpoint.json";
    CheckpointManager checkpoint(file);
    checkpoint.save({"a"}, {}, 1);
    const std::string before = readFile(file);

    // A non-empty directory where the temp file belongs makes the write fail.
    writeFile(checkpoint.tempFile() / "occupied", "x");

    EXPECT_THROW(checkpoint.save({"a", "b"}, {}, 2), PersistenceError);
    EXPECT_EQ(readFile(file), before);

    CheckpointManager reader(file);
    EXPECT_EQ(reader.load().first, IdSet{"a"});
}

TEST(CheckpointTest, ResetRemovesFileAndState) {
    TempDir dir;
    const auto file = dir / "checkpoint.json";
    CheckpointManager checkpoint(file);
    checkpoint.save({"a"}, {"b"}, 2);
    ASSERT_TRUE(std::filesystem::exists(file));

    EXPECT_TRUE(checkpoint.reset());
    EXPECT_FALSE(std::filesystem::exists(file));
    EXPECT_TRUE(checkpoint.completed().empty());
    EXPECT_TRUE(checkpoint.failed().empty());
    EXPECT_EQ(checkpoint.getProgressStats().totalFiles, 0u);

    // Resetting an absent checkpoint is not an error.
    EXPECT_TRUE(checkpoint.reset());
}

TEST(CheckpointTest, StartTimeSurvivesReload) {
    TempDir dir;
    const auto file = dir / "checkpoint.json";
    writeFile(file, R"({"completed": [], "failed": [], "total_files": 0, "start_time": 1000.5, "version": "1.0"})");

    CheckpointManager checkpoint(file);
    (void)checkpoint.load();
    checkpoint.flush();

    const auto state = nlohmann::json::parse(readFile(file));
    EXPECT_DOUBLE_EQ(state.at("start_time").get<double>(), 1000.5);
    EXPECT_GT(checkpoint.getProgressStats().elapsed.count(), 1000.0);
}

TEST(CheckpointTest, CreatesParentDirectory) {
    TempDir dir;
    const auto file = dir / ".slotwise" / "nested" / "checkpoint.json";
    CheckpointManager checkpoint(file);
    checkpoint.flush();
    EXPECT_TRUE(std::filesystem::exists(file));
}

TEST(CheckpointTest, SummaryMentionsCountsAndPercentages) {
    ProgressStats stats;
    stats.completedCount = 1234;
    stats.failedCount = 2;
    stats.processedCount = 1236;
    stats.totalFiles = 2000;
    stats.remainingCount = 764;
    stats.successRate = 99.83;
    stats.progressPercentage = 61.8;
    stats.estimatedRemaining = std::chrono::duration<double>(7200.0 * 1.5);

    const std::string text = formatProgressSummary(stats);
    EXPECT_NE(text.find("Progress summary"), std::string::npos);
    EXPECT_NE(text.find("Completed: 1,234"), std::string::npos);
    EXPECT_NE(text.find("Failed: 2"), std::string::npos);
    EXPECT_NE(text.find("Success rate: 99.8%"), std::string::npos);
    EXPECT_NE(text.find("Progress: 61.8% (1,236/2,000)"), std::string::npos);
    EXPECT_NE(text.find("3.0 hours"), std::string::npos);
}

TEST(CheckpointTest, SummaryUsesMinutesForShortEstimates) {
    ProgressStats stats;
    stats.completedCount = 3;
    stats.processedCount = 3;
    stats.totalFiles = 10;
    stats.remainingCount = 7;
    stats.successRate = 100.0;
    stats.progressPercentage = 30.0;
    stats.estimatedRemaining = std::chrono::duration<double>(90.0);

    const std::string text = formatProgressSummary(stats);
    EXPECT_NE(text.find("Progress: 30.0% (3/10)"), std::string::npos);
    EXPECT_NE(text.find("1.5 minutes"), std::string::npos);
}

TEST(CheckpointTest, UnreadablePathIsReportedNotMistakenForMissing) {
    TempDir dir;
    // A component longer than NAME_MAX makes the existence check itself fail.
    const auto file = dir / std::string(300, 'x') / "checkpoint.json";
    CheckpointManager checkpoint(file);

    testing::internal::CaptureStderr();
    const auto [completed, failed] = checkpoint.load();
    const std::string output = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(completed.empty());
    EXPECT_TRUE(failed.empty());
    EXPECT_NE(output.find("Cannot read checkpoint"), std::string::npos);
    EXPECT_EQ(output.find("No checkpoint found"), std::string::npos);
}

TEST(CheckpointTest, SavesIntoCurrentDirectoryWithoutWarnings) {
    TempDir dir;
    const auto previousDir = std::filesystem::current_path();
    const auto previousLevel = Logger::level();
    std::filesystem::current_path(dir.path());
    Logger::setLevel(LogLevel::WARN);

    testing::internal::CaptureStderr();
    {
        CheckpointManager checkpoint("checkpoint.json");
        checkpoint.save({"a"}, {}, 1);
    }
    const std::string output = testing::internal::GetCapturedStderr();

    Logger::setLevel(previousLevel);
    std::filesystem::current_path(previousDir);

    EXPECT_TRUE(std::filesystem::exists(dir / "checkpoint.json"));
    EXPECT_FALSE(std::filesystem::exists(dir / "checkpoint.json.tmp"));
    EXPECT_EQ(output.find("sync"), std::string::npos) << output;
}
