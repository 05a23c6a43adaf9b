/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace slotwise {

// Monotonic id assigned by the pool at admission time.
using TaskId = std::uint64_t;

// Caller-facing item identifier (a file path for image batches).
using ItemId = std::string;

// Terminal task outcomes. Pending is the only non-terminal state.
enum class TaskStatus : std::uint8_t { Pending, Success, TaskError, TimeoutError, Cancelled };

// What the orchestrator records in the checkpoint for a finished item.
enum class Outcome : std::uint8_t { Completed, Failed };

[[nodiscard]] inline const char* toString(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:      return "pending";
        case TaskStatus::Success:      return "success";
        case TaskStatus::TaskError:    return "task_error";
        case TaskStatus::TimeoutError: return "timeout_error";
        case TaskStatus::Cancelled:    return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] inline const char* toString(Outcome outcome) noexcept {
    return outcome == Outcome::Completed ? "completed" : "failed";
}

} // namespace slotwise
