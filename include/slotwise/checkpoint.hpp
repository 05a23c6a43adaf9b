/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include "slotwise/types.hpp"

namespace slotwise {

// A checkpoint could not be written. The previous checkpoint file is untouched.
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using IdSet = std::set<ItemId>;

struct ProgressStats {
    std::size_t completedCount = 0;
    std::size_t failedCount = 0;
    std::size_t processedCount = 0;
    std::size_t totalFiles = 0;
    std::size_t remainingCount = 0;
    double successRate = 0.0;
    double progressPercentage = 0.0;
    std::chrono::duration<double> elapsed{0};
    std::chrono::duration<double> estimatedRemaining{0};
};

// Durable record of which items completed or failed. Every write replaces the
// whole file through <file>.tmp and a rename, so readers see either the old
// record or the new one.
class CheckpointManager {
public:
    static constexpr const char* kVersion = "1.0";

    explicit CheckpointManager(std::filesystem::path file, std::size_t autoSaveInterval = 100);

    CheckpointManager(const CheckpointManager&) = delete;
    CheckpointManager& operator=(const CheckpointManager&) = delete;
    CheckpointManager(CheckpointManager&&) = delete;
    CheckpointManager& operator=(CheckpointManager&&) = delete;

    // Missing or unreadable checkpoints yield empty sets; corruption is logged, never thrown.
    [[nodiscard]] std::pair<IdSet, IdSet> load();

    // Throws PersistenceError if the record could not be written.
    void save(const IdSet& completed, const IdSet& failed, std::optional<std::size_t> totalFiles = std::nullopt);
    void flush();

    // Records one outcome, evicting the id from the opposite set. May save (and throw) when
    // the auto-save threshold is reached.
    void updateProgress(const ItemId& id, Outcome outcome, bool autoSave = true);

    [[nodiscard]] bool shouldSkip(const ItemId& id, bool forceRerun = false) const;
    [[nodiscard]] ProgressStats getProgressStats() const;

    void setTotalFiles(std::size_t total);
    [[nodiscard]] IdSet completed() const;
    [[nodiscard]] IdSet failed() const;
    [[nodiscard]] std::size_t pendingChanges() const;

    // Deletes the checkpoint file and clears all in-memory progress.
    [[nodiscard]] bool reset();

    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }
    [[nodiscard]] std::filesystem::path tempFile() const;

private:
    void saveLocked();
    void writeAtomically(const std::string& content) const;
    void clearLocked() noexcept;

    std::filesystem::path file_;
    std::size_t autoSaveInterval_;

    mutable std::mutex mutex_;
    IdSet completed_;
    IdSet failed_;
    std::size_t totalFiles_ = 0;
    std::size_t pending_ = 0;
    double startTime_;
};

// Multi-line, human readable progress report.
[[nodiscard]] std::string formatProgressSummary(const ProgressStats& stats);

}
