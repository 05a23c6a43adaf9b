/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "slotwise/types.hpp"

namespace slotwise {

namespace detail {
struct CancelState {
    std::atomic<bool> requested{false};
    std::mutex mutex;
    std::condition_variable signalled;
};
}

// Cooperative cancellation flag shared between the pool and a running work item.
// Work that never polls it keeps running after its task has been finalized.
class CancelToken {
public:
    CancelToken() : state_(std::make_shared<detail::CancelState>()) {}

    [[nodiscard]] bool cancelled() const noexcept { return state_->requested.load(); }

    void requestCancel() const {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->requested.store(true);
        }
        state_->signalled.notify_all();
    }

    // Sleeps for up to `duration`. Returns false if cancellation cut the sleep short.
    template <typename Rep, typename Period>
    bool sleepFor(const std::chrono::duration<Rep, Period>& duration) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return !state_->signalled.wait_for(lock, duration, [this] { return state_->requested.load(); });
    }

private:
    std::shared_ptr<detail::CancelState> state_;
};

struct WorkMetadata {
    ItemId identifier;
    std::string payloadRef;
};

struct TaskResult {
    TaskStatus status = TaskStatus::Pending;
    TaskId taskId = 0;
    ItemId identifier;
    std::string payloadRef;
    std::string payload;
    std::string error;
    std::string trace;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool ok() const noexcept { return status == TaskStatus::Success; }
};

namespace detail {
struct TaskState {
    TaskId id = 0;
    WorkMetadata metadata;
    CancelToken token;
    std::chrono::steady_clock::time_point started;
    std::chrono::steady_clock::time_point deadline;

    // Exactly one finalizer wins the Pending -> terminal transition.
    std::atomic<TaskStatus> status{TaskStatus::Pending};

    // Guarded by the owning pool's mutex.
    bool workReturned = false;
    bool abandoned = false;

    std::mutex mutex;
    std::condition_variable resolved;
    bool ready = false;
    TaskResult result;
};
}

// Caller-side view of a submitted task.
class TaskHandle {
public:
    TaskHandle() = default;
    explicit TaskHandle(std::shared_ptr<detail::TaskState> state) noexcept : state_(std::move(state)) {}

    [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(state_); }
    [[nodiscard]] TaskId id() const noexcept { return state_ ? state_->id : 0; }
    [[nodiscard]] const ItemId& identifier() const { return checked().metadata.identifier; }

    [[nodiscard]] bool done() const {
        auto& state = checked();
        std::lock_guard<std::mutex> lock(state.mutex);
        return state.ready;
    }

    void wait() const {
        auto& state = checked();
        std::unique_lock<std::mutex> lock(state.mutex);
        state.resolved.wait(lock, [&state] { return state.ready; });
    }

    template <typename Rep, typename Period>
    [[nodiscard]] bool waitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        auto& state = checked();
        std::unique_lock<std::mutex> lock(state.mutex);
        return state.resolved.wait_for(lock, timeout, [&state] { return state.ready; });
    }

    // Blocks until the task is terminal. The result never changes afterwards.
    [[nodiscard]] const TaskResult& result() const {
        wait();
        return state_->result;
    }

private:
    detail::TaskState& checked() const {
        if (!state_) {
            throw std::logic_error("empty TaskHandle");
        }
        return *state_;
    }

    std::shared_ptr<detail::TaskState> state_;
};

}
