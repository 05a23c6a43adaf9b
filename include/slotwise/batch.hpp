/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

#include "slotwise/checkpoint.hpp"
#include "slotwise/config.hpp"
#include "slotwise/pool.hpp"
#include "slotwise/processor.hpp"

namespace slotwise {

struct BatchSummary {
    std::size_t found = 0;
    std::size_t skipped = 0;
    std::size_t submitted = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;       // task errors and timeouts
    std::size_t timedOut = 0;
    std::size_t cancelled = 0;
    std::chrono::duration<double> elapsed{0};
    bool stopped = false;
    PoolStats pool;
    ProgressStats progress;
};

// Drives one batch: resume from the checkpoint, discover items, push the
// unfinished ones through a TaskPool and record every outcome.
class BatchRunner final {
public:
    BatchRunner(Config config, std::shared_ptr<ItemProcessor> processor);

    BatchRunner(const BatchRunner&) = delete;
    BatchRunner& operator=(const BatchRunner&) = delete;
    BatchRunner(BatchRunner&&) = delete;
    BatchRunner& operator=(BatchRunner&&) = delete;

    // Throws PersistenceError when the checkpoint cannot be written.
    [[nodiscard]] BatchSummary run(const std::filesystem::path& root);

    // Safe from any thread. Stops submission and cancels in-flight work;
    // run() still records what finished and flushes the checkpoint.
    void requestStop() noexcept;
    [[nodiscard]] bool stopRequested() const noexcept { return stopRequested_.load(); }

private:
    // True when the item's result file (same stem, output extension) exists.
    [[nodiscard]] bool hasResultFile(const std::filesystem::path& item) const;
    std::size_t drainOutcomes(BatchSummary& summary, CheckpointManager& checkpoint,
                              std::vector<TaskResult>& failures);
    [[nodiscard]] bool writeErrorLog(const std::filesystem::path& path,
                                     const std::vector<TaskResult>& failures) const noexcept;

    Config config_;
    std::shared_ptr<ItemProcessor> processor_;

    std::atomic<bool> stopRequested_{false};

    std::mutex poolMutex_;
    TaskPool* activePool_ = nullptr;

    std::mutex outcomeMutex_;
    std::condition_variable outcomeReady_;
    std::deque<TaskResult> outcomes_;
};

}
