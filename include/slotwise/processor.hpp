/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

#include "slotwise/task.hpp"

namespace slotwise {

// Performs the remote call for one item and returns its opaque response.
// Implementations throw on failure; the pool turns that into a task error.
class ItemProcessor {
public:
    virtual ~ItemProcessor() = default;
    [[nodiscard]] virtual std::string process(const std::filesystem::path& item, const CancelToken& cancel) = 0;
};

class CommandError : public std::runtime_error {
public:
    CommandError(const std::string& message, int exitCode)
        : std::runtime_error(message), exitCode_(exitCode) {}
    [[nodiscard]] int exitCode() const noexcept { return exitCode_; }

private:
    int exitCode_;
};

struct CommandOptions {
    // "{}" is replaced by the quoted item path; without it the path is appended.
    std::string commandTemplate;
    int retries = 0;
    // Empty disables writing the response next to the item.
    std::string outputExtension = ".json";
};

// Runs a shell command per item and captures its stdout. A command that is
// already running is not interrupted by cancellation; retries are.
class CommandProcessor final : public ItemProcessor {
public:
    explicit CommandProcessor(CommandOptions options);

    [[nodiscard]] std::string process(const std::filesystem::path& item, const CancelToken& cancel) override;

    [[nodiscard]] std::string buildCommand(const std::filesystem::path& item) const;
    [[nodiscard]] std::filesystem::path outputPathFor(const std::filesystem::path& item) const;

private:
    [[nodiscard]] std::string runOnce(const std::string& command) const;
    void writeOutput(const std::filesystem::path& item, const std::string& output) const;

    CommandOptions options_;
};

[[nodiscard]] std::string shellQuote(const std::string& value);

}
