/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slotwise/pool.hpp"
#include "slotwise/logger.hpp"
#include <algorithm>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <exception>
#include <mutex>
#include <set>
#include <stdexcept>
#include <system_error>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>
#include <cxxabi.h>

namespace slotwise {

namespace detail {

using Clock = std::chrono::steady_clock;

struct PoolState {
    explicit PoolState(PoolOptions opts) : options(std::move(opts)) {}

    const PoolOptions options;

    mutable std::mutex mutex;
    std::condition_variable slotFreed;
    mutable std::condition_variable drained;
    std::condition_variable deadlineChanged;
    std::condition_variable workExited;
    std::condition_variable reportQueued;

    std::unordered_map<TaskId, std::shared_ptr<TaskState>> inFlight;
    std::set<std::pair<Clock::time_point, TaskId>> deadlines;

    // Timed-out tasks whose outcome the notifier thread has yet to report.
    std::deque<std::pair<std::shared_ptr<TaskState>, TaskResult>> reports;
    std::size_t reportsPending = 0;
    bool notifierStop = false;

    TaskId nextId = 1;
    std::uint64_t submitted = 0;
    std::uint64_t completed = 0;
    std::uint64_t failed = 0;
    std::uint64_t timedOut = 0;
    std::uint64_t cancelled = 0;
    std::size_t peakInFlight = 0;
    std::size_t runningWork = 0;
    std::size_t abandoned = 0;
    bool shutdown = false;
};

}

namespace {

using detail::Clock;
using detail::PoolState;
using detail::TaskState;

std::string demangle(const char* name) {
    int status = 0;
    char* readable = abi::__cxa_demangle(name, nullptr, nullptr, &status);
    if (status != 0 || readable == nullptr) {
        return name;
    }
    std::string out(readable);
    std::free(readable);
    return out;
}

void appendExceptionChain(std::string& out, const std::exception& e, int depth) {
    out += std::string(static_cast<std::size_t>(depth) * 2, ' ');
    out += demangle(typeid(e).name()) + ": " + e.what() + "\n";
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        appendExceptionChain(out, nested, depth + 1);
    } catch (...) {
        out += std::string(static_cast<std::size_t>(depth + 1) * 2, ' ') + "<non-standard exception>\n";
    }
}

std::string describeFailure(const TaskState& task, const std::exception* e) {
    std::string trace = "task " + std::to_string(task.id) + " (" + task.metadata.identifier + ") raised:\n";
    if (e) {
        appendExceptionChain(trace, *e, 1);
    } else {
        trace += "  <non-standard exception>\n";
    }
    return trace;
}

TaskResult makeResult(TaskStatus status) {
    TaskResult result;
    result.status = status;
    return result;
}

// Wins the Pending -> terminal transition and releases the slot. Returns false
// if another finalizer already won.
bool claim(PoolState& pool, const std::shared_ptr<TaskState>& task, TaskStatus status, bool fromWork) {
    TaskStatus expected = TaskStatus::Pending;
    if (!task->status.compare_exchange_strong(expected, status)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(pool.mutex);
        // Tasks rejected at submission were never admitted and hold no slot.
        if (pool.inFlight.erase(task->id) > 0) {
            pool.deadlines.erase({task->deadline, task->id});
            switch (status) {
                case TaskStatus::Success:
                    ++pool.completed;
                    break;
                case TaskStatus::TimeoutError:
                    ++pool.timedOut;
                    ++pool.failed;
                    break;
                case TaskStatus::TaskError:
                    ++pool.failed;
                    break;
                case TaskStatus::Cancelled:
                    ++pool.cancelled;
                    break;
                case TaskStatus::Pending:
                    break;
            }
        }
        if (!fromWork && !task->workReturned) {
            task->abandoned = true;
            ++pool.abandoned;
        }
    }
    pool.slotFreed.notify_one();
    pool.drained.notify_all();

    if (status == TaskStatus::TimeoutError || status == TaskStatus::Cancelled) {
        task->token.requestCancel();
    }
    return true;
}

void stamp(const TaskState& task, TaskResult& result) {
    result.taskId = task.id;
    result.identifier = task.metadata.identifier;
    result.payloadRef = task.metadata.payloadRef;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - task.started);
}

// Runs the completion callback, then resolves the handle.
void publish(PoolState& pool, const std::shared_ptr<TaskState>& task, TaskResult result) {
    if (pool.options.onComplete) {
        try {
            pool.options.onComplete(result);
        } catch (const std::exception& e) {
            LOG_ERROR("Completion callback failed for task " + std::to_string(task->id) + ": " + e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(task->mutex);
        task->result = std::move(result);
        task->ready = true;
    }
    task->resolved.notify_all();
}

// Single exit for every task resolved on the calling thread.
bool finalize(PoolState& pool, const std::shared_ptr<TaskState>& task, TaskResult result, bool fromWork) {
    if (!claim(pool, task, result.status, fromWork)) {
        return false;
    }
    stamp(*task, result);
    publish(pool, task, std::move(result));
    return true;
}

std::string timeoutMessage(const PoolState& pool) {
    return "task exceeded timeout of " + std::to_string(pool.options.taskTimeout.count()) + "ms";
}

// Accounts for the work thread on every exit path, including unwinding.
class WorkScope {
public:
    WorkScope(std::shared_ptr<PoolState> pool, std::shared_ptr<TaskState> task) noexcept
        : pool_(std::move(pool)), task_(std::move(task)) {}

    WorkScope(const WorkScope&) = delete;
    WorkScope& operator=(const WorkScope&) = delete;

    ~WorkScope() {
        if (task_->status.load() == TaskStatus::Pending) {
            try {
                auto result = makeResult(TaskStatus::TaskError);
                result.error = "work thread exited without a result";
                (void)finalize(*pool_, task_, std::move(result), true);
            } catch (const std::exception& e) {
                LOG_ERROR("Task " + std::to_string(task_->id) + " could not be finalized: " + e.what());
            }
        }

        bool wasAbandoned = false;
        {
            std::lock_guard<std::mutex> lock(pool_->mutex);
            task_->workReturned = true;
            if (task_->abandoned) {
                wasAbandoned = true;
                --pool_->abandoned;
            }
            --pool_->runningWork;
        }
        pool_->workExited.notify_all();

        if (wasAbandoned) {
            LOG_DEBUG("Abandoned work returned late, result discarded: " + task_->metadata.identifier);
        }
        clearThreadName();
    }

private:
    std::shared_ptr<PoolState> pool_;
    std::shared_ptr<TaskState> task_;
};

void runTask(std::shared_ptr<PoolState> pool, std::shared_ptr<TaskState> task, Work work) {
    WorkScope scope(pool, task);
    setThreadName("Task-" + std::to_string(task->id));
    LOG_TRACE("Task " + std::to_string(task->id) + " started: " + task->metadata.identifier);

    TaskResult outcome;
    try {
        outcome = makeResult(TaskStatus::Success);
        outcome.payload = work(task->token);
    } catch (const std::exception& e) {
        outcome = makeResult(TaskStatus::TaskError);
        outcome.error = e.what();
        outcome.trace = describeFailure(*task, &e);
    } catch (...) {
        outcome = makeResult(TaskStatus::TaskError);
        outcome.error = "unknown exception";
        outcome.trace = describeFailure(*task, nullptr);
    }

    // The watchdog may be late; a deadline that passed still wins over the work.
    if (task->deadline != Clock::time_point::max() && Clock::now() >= task->deadline) {
        outcome = makeResult(TaskStatus::TimeoutError);
        outcome.error = timeoutMessage(*pool);
    }

    const TaskStatus status = outcome.status;
    if (finalize(*pool, task, std::move(outcome), true)) {
        if (status == TaskStatus::Success) {
            LOG_DEBUG("Task " + std::to_string(task->id) + " succeeded: " + task->metadata.identifier);
        } else if (status == TaskStatus::TimeoutError) {
            LOG_WARN("Task " + std::to_string(task->id) + " finished after its deadline: " +
                     task->metadata.identifier);
        } else {
            LOG_WARN("Task " + std::to_string(task->id) + " failed: " + task->metadata.identifier);
        }
    }
}

}

TaskPool::TaskPool(std::size_t capacity) : TaskPool([capacity] {
    PoolOptions options;
    options.capacity = capacity;
    return options;
}()) {}

TaskPool::TaskPool(PoolOptions options) {
    if (options.capacity == 0) {
        throw std::invalid_argument("task pool capacity must be positive");
    }
    state_ = std::make_shared<detail::PoolState>(std::move(options));
    notifier_ = std::thread(&TaskPool::notifierLoop, this);
    try {
        watchdog_ = std::thread(&TaskPool::watchdogLoop, this);
    } catch (const std::system_error&) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->notifierStop = true;
        }
        state_->reportQueued.notify_all();
        notifier_.join();
        throw;
    }

    LOG_DEBUG("TaskPool created - capacity: " + std::to_string(state_->options.capacity) +
              ", timeout: " + std::to_string(state_->options.taskTimeout.count()) + "ms");
}

TaskPool::~TaskPool() {
    shutdown();

    std::unique_lock<std::mutex> lock(state_->mutex);
    if (!state_->workExited.wait_for(lock, state_->options.shutdownGrace,
                                     [this] { return state_->runningWork == 0; })) {
        LOG_WARN("Leaving " + std::to_string(state_->runningWork) + " abandoned work thread(s) running");
    }
}

TaskHandle TaskPool::submit(SimpleWork work, WorkMetadata metadata) {
    if (!work) {
        throw std::invalid_argument("work item '" + metadata.identifier + "' has no callable");
    }
    return submit(Work([fn = std::move(work)](const CancelToken&) { return fn(); }), std::move(metadata));
}

TaskHandle TaskPool::submit(Work work, WorkMetadata metadata) {
    if (metadata.identifier.empty()) {
        throw std::invalid_argument("work item identifier must not be empty");
    }
    if (!work) {
        throw std::invalid_argument("work item '" + metadata.identifier + "' has no callable");
    }

    auto task = std::make_shared<TaskState>();
    task->metadata = std::move(metadata);

    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->slotFreed.wait(lock, [this] {
            return state_->shutdown || state_->inFlight.size() < state_->options.capacity;
        });

        if (state_->shutdown) {
            lock.unlock();
            LOG_DEBUG("Cannot submit to stopped pool: " + task->metadata.identifier);
            task->started = Clock::now();
            task->workReturned = true;
            auto result = makeResult(TaskStatus::Cancelled);
            result.error = "pool is shut down";
            (void)finalize(*state_, task, std::move(result), true);
            return TaskHandle(task);
        }

        task->id = state_->nextId++;
        task->started = Clock::now();
        if (state_->options.taskTimeout.count() > 0) {
            task->deadline = task->started + state_->options.taskTimeout;
            state_->deadlines.emplace(task->deadline, task->id);
        } else {
            task->deadline = Clock::time_point::max();
        }
        state_->inFlight.emplace(task->id, task);
        ++state_->submitted;
        ++state_->runningWork;
        state_->peakInFlight = std::max(state_->peakInFlight, state_->inFlight.size());
    }
    state_->deadlineChanged.notify_one();

    try {
        if (state_->options.launcher) {
            state_->options.launcher([pool = state_, task, work = std::move(work)]() mutable {
                runTask(std::move(pool), std::move(task), std::move(work));
            });
        } else {
            std::thread(&runTask, state_, task, std::move(work)).detach();
        }
    } catch (const std::system_error& e) {
        // Out of threads says nothing about the item; leave it for a later run.
        LOG_ERROR("Failed to start work thread for " + task->metadata.identifier + ": " + e.what());
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            task->workReturned = true;
            --state_->runningWork;
        }
        auto result = makeResult(TaskStatus::Cancelled);
        result.error = std::string("failed to start work thread: ") + e.what();
        result.trace = describeFailure(*task, &e);
        (void)finalize(*state_, task, std::move(result), true);
    }

    return TaskHandle(task);
}

PoolStats TaskPool::getStats() const noexcept {
    PoolStats stats;
    std::lock_guard<std::mutex> lock(state_->mutex);
    stats.capacity = state_->options.capacity;
    stats.inFlight = state_->inFlight.size();
    stats.peakInFlight = state_->peakInFlight;
    stats.submitted = state_->submitted;
    stats.completed = state_->completed;
    stats.failed = state_->failed;
    stats.timedOut = state_->timedOut;
    stats.cancelled = state_->cancelled;
    stats.abandoned = state_->abandoned;
    stats.successRate = static_cast<double>(state_->completed) /
                        static_cast<double>(std::max<std::uint64_t>(state_->submitted, 1)) * 100.0;
    return stats;
}

bool TaskPool::isShutdown() const noexcept {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->shutdown;
}

std::size_t TaskPool::capacity() const noexcept {
    return state_->options.capacity;
}

void TaskPool::shutdown() noexcept {
    std::vector<std::shared_ptr<TaskState>> inFlight;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->shutdown) {
            return;
        }
        state_->shutdown = true;
        inFlight.reserve(state_->inFlight.size());
        for (const auto& entry : state_->inFlight) {
            inFlight.push_back(entry.second);
        }
    }
    state_->slotFreed.notify_all();
    state_->deadlineChanged.notify_all();

    if (!inFlight.empty()) {
        LOG_INFO("Cancelling " + std::to_string(inFlight.size()) + " in-flight task(s)...");
    }
    for (const auto& task : inFlight) {
        auto result = makeResult(TaskStatus::Cancelled);
        result.error = "cancelled by pool shutdown";
        (void)finalize(*state_, task, std::move(result), false);
    }

    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->drained.wait(lock, [this] { return state_->inFlight.empty(); });
    }

    if (watchdog_.joinable()) {
        watchdog_.join();
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->notifierStop = true;
    }
    state_->reportQueued.notify_all();
    if (notifier_.joinable()) {
        notifier_.join();
    }

    LOG_INFO("Task pool shut down");
}

void TaskPool::waitForCompletion(std::chrono::milliseconds pollInterval) const {
    auto idle = [this] { return state_->inFlight.empty() && state_->reportsPending == 0; };

    std::unique_lock<std::mutex> lock(state_->mutex);
    while (!idle()) {
        if (state_->drained.wait_for(lock, pollInterval, idle)) {
            break;
        }
        const auto remaining = state_->inFlight.size() + state_->reportsPending;
        lock.unlock();
        LOG_INFO("Waiting for " + std::to_string(remaining) + " task(s) to complete...");
        lock.lock();
    }
}

void TaskPool::watchdogLoop() {
    setThreadName("Watchdog");
    LOG_DEBUG("Watchdog started");

    std::vector<std::shared_ptr<TaskState>> expired;
    std::unique_lock<std::mutex> lock(state_->mutex);
    while (!state_->shutdown) {
        if (state_->deadlines.empty()) {
            state_->deadlineChanged.wait(lock);
            continue;
        }

        const auto now = Clock::now();
        if (now < state_->deadlines.begin()->first) {
            state_->deadlineChanged.wait_until(lock, state_->deadlines.begin()->first);
            continue;
        }

        while (!state_->deadlines.empty() && state_->deadlines.begin()->first <= now) {
            auto it = state_->inFlight.find(state_->deadlines.begin()->second);
            state_->deadlines.erase(state_->deadlines.begin());
            if (it != state_->inFlight.end()) {
                expired.push_back(it->second);
            }
        }

        // Counted before the slots are released so waitForCompletion cannot
        // slip between a claim and its report.
        state_->reportsPending += expired.size();

        // Release slots here; callbacks run on the notifier so a slow one
        // cannot delay the next deadline.
        lock.unlock();
        std::size_t queued = 0;
        for (auto& task : expired) {
            if (!claim(*state_, task, TaskStatus::TimeoutError, false)) {
                std::lock_guard<std::mutex> queueLock(state_->mutex);
                --state_->reportsPending;
                continue;
            }
            LOG_WARN("Task " + std::to_string(task->id) + " timed out: " + task->metadata.identifier);
            auto result = makeResult(TaskStatus::TimeoutError);
            result.error = timeoutMessage(*state_);
            stamp(*task, result);

            std::lock_guard<std::mutex> queueLock(state_->mutex);
            state_->reports.emplace_back(std::move(task), std::move(result));
            ++queued;
        }
        expired.clear();
        if (queued > 0) {
            state_->reportQueued.notify_one();
        }
        state_->drained.notify_all();
        lock.lock();
    }

    lock.unlock();
    LOG_DEBUG("Watchdog stopped");
    clearThreadName();
}

void TaskPool::notifierLoop() {
    setThreadName("Notifier");

    std::unique_lock<std::mutex> lock(state_->mutex);
    while (true) {
        state_->reportQueued.wait(lock, [this] { return state_->notifierStop || !state_->reports.empty(); });
        if (state_->reports.empty()) {
            break;
        }

        auto batch = std::move(state_->reports);
        state_->reports.clear();
        lock.unlock();
        for (auto& report : batch) {
            publish(*state_, report.first, std::move(report.second));
        }
        lock.lock();
        state_->reportsPending -= batch.size();
        state_->drained.notify_all();
    }

    lock.unlock();
    clearThreadName();
}

}
