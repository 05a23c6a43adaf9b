/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slotwise/batch.hpp"
#include "slotwise/logger.hpp"
#include "slotwise/scanner.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace slotwise {

namespace {

std::string fixed1(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value;
    return ss.str();
}

double epochSeconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

}

BatchRunner::BatchRunner(Config config, std::shared_ptr<ItemProcessor> processor)
    : config_(std::move(config)), processor_(std::move(processor)) {
    if (!processor_) {
        throw std::invalid_argument("BatchRunner requires an item processor");
    }
}

void BatchRunner::requestStop() noexcept {
    stopRequested_.store(true);
    std::lock_guard<std::mutex> lock(poolMutex_);
    if (activePool_) {
        activePool_->shutdown();
    }
}

BatchSummary BatchRunner::run(const std::filesystem::path& root) {
    const auto startTime = std::chrono::steady_clock::now();
    BatchSummary summary;
    {
        std::lock_guard<std::mutex> lock(outcomeMutex_);
        outcomes_.clear();
    }

    CheckpointManager checkpoint(config_.checkpointPathFor(root), config_.checkpointInterval);
    const auto previous = checkpoint.load();

    Scanner scanner(config_.extensions);
    const auto items = scanner.scan(root);
    summary.found = items.size();
    checkpoint.setTotalFiles(items.size());

    std::vector<std::filesystem::path> pending;
    pending.reserve(items.size());
    std::size_t recovered = 0;
    for (const auto& item : items) {
        if (checkpoint.shouldSkip(item.string(), config_.forceRerun)) {
            ++summary.skipped;
        } else if (!config_.forceRerun && hasResultFile(item)) {
            // Result already on disk from a run whose checkpoint was lost.
            checkpoint.updateProgress(item.string(), Outcome::Completed, false);
            ++summary.skipped;
            ++recovered;
        } else {
            pending.push_back(item);
        }
    }
    if (recovered > 0) {
        LOG_INFO("Recovered " + std::to_string(recovered) + " completed item(s) from existing result files");
    }

    LOG_INFO("Directory: " + root.string());
    LOG_INFO("Items found: " + std::to_string(summary.found) +
             ", already completed: " + std::to_string(summary.skipped) +
             ", previously failed: " + std::to_string(previous.second.size()) +
             ", to process: " + std::to_string(pending.size()));

    if (pending.empty()) {
        LOG_INFO("All items already processed");
        checkpoint.flush();
        summary.progress = checkpoint.getProgressStats();
        summary.elapsed = std::chrono::steady_clock::now() - startTime;
        summary.stopped = stopRequested_.load();
        return summary;
    }

    LOG_INFO("Concurrency: " + std::to_string(config_.concurrency) +
             ", task timeout: " + std::to_string(config_.taskTimeout.count()) + "s");

    PoolOptions options;
    options.capacity = config_.concurrency;
    options.taskTimeout = config_.taskTimeout;
    options.shutdownGrace = config_.shutdownGrace;
    options.onComplete = [this](const TaskResult& result) {
        {
            std::lock_guard<std::mutex> lock(outcomeMutex_);
            outcomes_.push_back(result);
        }
        outcomeReady_.notify_one();
    };

    std::vector<TaskResult> failures;
    {
        TaskPool pool(options);

        // Unregisters the pool on every exit path so requestStop never sees a dead pool.
        struct ActivePool {
            BatchRunner& runner;
            ActivePool(BatchRunner& r, TaskPool& p) : runner(r) {
                std::lock_guard<std::mutex> lock(runner.poolMutex_);
                runner.activePool_ = &p;
            }
            ~ActivePool() {
                std::lock_guard<std::mutex> lock(runner.poolMutex_);
                runner.activePool_ = nullptr;
            }
        } active(*this, pool);

        if (stopRequested_.load()) {
            pool.shutdown();
        }

        std::size_t received = 0;
        for (const auto& item : pending) {
            if (stopRequested_.load()) {
                LOG_INFO("Stop requested, no further items will be submitted");
                break;
            }
            auto processor = processor_;
            (void)pool.submit(
                [processor, item](const CancelToken& cancel) { return processor->process(item, cancel); },
                WorkMetadata{item.string(), item.string()});
            ++summary.submitted;
            received += drainOutcomes(summary, checkpoint, failures);
        }

        while (received < summary.submitted) {
            {
                std::unique_lock<std::mutex> lock(outcomeMutex_);
                outcomeReady_.wait_for(lock, config_.pollInterval, [this] { return !outcomes_.empty(); });
            }
            const std::size_t drained = drainOutcomes(summary, checkpoint, failures);
            received += drained;
            if (drained == 0) {
                const auto progress = checkpoint.getProgressStats();
                LOG_INFO("Progress: " + std::to_string(progress.processedCount) + "/" +
                         std::to_string(progress.totalFiles) + " (" + fixed1(progress.progressPercentage) +
                         "%), waiting for " + std::to_string(summary.submitted - received) + " task(s)");
            }
        }

        summary.pool = pool.getStats();
    }

    checkpoint.flush();

    if (!failures.empty()) {
        const auto logPath = config_.errorLogPathFor(root);
        if (writeErrorLog(logPath, failures)) {
            LOG_INFO("Error log: " + logPath.string());
        }
    }

    summary.progress = checkpoint.getProgressStats();
    summary.elapsed = std::chrono::steady_clock::now() - startTime;
    summary.stopped = stopRequested_.load();

    LOG_INFO("Batch finished - succeeded: " + std::to_string(summary.succeeded) +
             ", failed: " + std::to_string(summary.failed) +
             " (timed out: " + std::to_string(summary.timedOut) + ")" +
             ", cancelled: " + std::to_string(summary.cancelled) +
             ", time: " + fixed1(summary.elapsed.count()) + "s");
    return summary;
}

bool BatchRunner::hasResultFile(const std::filesystem::path& item) const {
    if (config_.outputExtension.empty()) {
        return false;
    }
    auto result = item;
    result.replace_extension(config_.outputExtension);
    if (result == item) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(result, ec);
}

std::size_t BatchRunner::drainOutcomes(BatchSummary& summary, CheckpointManager& checkpoint,
                                       std::vector<TaskResult>& failures) {
    std::deque<TaskResult> ready;
    {
        std::lock_guard<std::mutex> lock(outcomeMutex_);
        ready.swap(outcomes_);
    }

    for (auto& result : ready) {
        switch (result.status) {
            case TaskStatus::Success:
                ++summary.succeeded;
                checkpoint.updateProgress(result.identifier, Outcome::Completed);
                break;
            case TaskStatus::TimeoutError:
                ++summary.timedOut;
                ++summary.failed;
                checkpoint.updateProgress(result.identifier, Outcome::Failed);
                failures.push_back(std::move(result));
                break;
            case TaskStatus::TaskError:
                ++summary.failed;
                LOG_WARN("Failed: " + result.identifier + " - " + result.error);
                checkpoint.updateProgress(result.identifier, Outcome::Failed);
                failures.push_back(std::move(result));
                break;
            case TaskStatus::Cancelled:
            case TaskStatus::Pending:
                // Left unrecorded so the next run picks it up again.
                ++summary.cancelled;
                break;
        }
    }
    return ready.size();
}

bool BatchRunner::writeErrorLog(const std::filesystem::path& path,
                                const std::vector<TaskResult>& failures) const noexcept {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            LOG_ERROR("Cannot open error log: " + path.string());
            return false;
        }

        const double now = epochSeconds();
        for (const auto& failure : failures) {
            nlohmann::json entry;
            entry["file"] = failure.payloadRef;
            entry["error_type"] = toString(failure.status);
            entry["message"] = failure.error;
            if (!failure.trace.empty()) {
                entry["trace"] = failure.trace;
            }
            entry["timestamp"] = now;
            file << entry.dump() << "\n";
        }
        file.flush();
        return file.good();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write error log " + path.string() + ": " + e.what());
        return false;
    }
}

}
