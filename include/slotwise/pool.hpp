/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "slotwise/task.hpp"
#include "slotwise/types.hpp"

namespace slotwise {

using Work = std::function<std::string(const CancelToken&)>;
using SimpleWork = std::function<std::string()>;
using CompletionCallback = std::function<void(const TaskResult&)>;
// Starts `body` on a new thread that outlives the call. Throws std::system_error
// when no thread can be created.
using ThreadLauncher = std::function<void(std::function<void()> body)>;

struct PoolOptions {
    std::size_t capacity = 50'000;
    // Zero disables the per-task deadline.
    std::chrono::milliseconds taskTimeout = std::chrono::hours(72);
    // How long the destructor waits for abandoned work threads to return.
    std::chrono::milliseconds shutdownGrace = std::chrono::seconds(5);
    // Runs once per terminal outcome, outside the pool lock. Timeouts are
    // reported from the pool's notifier thread, everything else from the
    // thread that resolved the task. Must not call shutdown().
    CompletionCallback onComplete;
    // Empty means a detached std::thread.
    ThreadLauncher launcher;
};

struct PoolStats {
    std::size_t capacity = 0;
    std::size_t inFlight = 0;
    std::size_t peakInFlight = 0;
    std::uint64_t submitted = 0;
    std::uint64_t completed = 0;
    std::uint64_t failed = 0;      // task errors and timeouts
    std::uint64_t timedOut = 0;
    std::uint64_t cancelled = 0;
    std::size_t abandoned = 0;     // work still running after its task was finalized
    double successRate = 0.0;
};

namespace detail {
struct PoolState;
}

// Admission-controlled executor. At most `capacity` tasks are in flight; each
// runs on its own thread and is raced against a deadline by a watchdog thread.
// Every admitted task releases its slot exactly once, whichever of success,
// error, timeout or shutdown gets there first.
class TaskPool {
public:
    explicit TaskPool(std::size_t capacity);
    explicit TaskPool(PoolOptions options);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;
    TaskPool(TaskPool&&) = delete;
    TaskPool& operator=(TaskPool&&) = delete;

    // Blocks until a slot is free. Throws std::invalid_argument for an empty
    // identifier or an empty callable. After shutdown() the returned handle is
    // already resolved as Cancelled.
    [[nodiscard]] TaskHandle submit(Work work, WorkMetadata metadata);
    [[nodiscard]] TaskHandle submit(SimpleWork work, WorkMetadata metadata);

    [[nodiscard]] PoolStats getStats() const noexcept;
    [[nodiscard]] bool isShutdown() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept;

    // Cancels everything in flight and wakes blocked submitters. Idempotent.
    void shutdown() noexcept;

    // Blocks until nothing is in flight and every outcome has been reported,
    // logging every `pollInterval`.
    void waitForCompletion(std::chrono::milliseconds pollInterval = std::chrono::seconds(60)) const;

private:
    void watchdogLoop();
    void notifierLoop();

    std::shared_ptr<detail::PoolState> state_;
    std::thread watchdog_;
    std::thread notifier_;
};

}
