/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace slotwise {

class Scanner {
public:
    explicit Scanner(std::vector<std::string> extensions);

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    // Recursively lists matching files under root, sorted. Unreadable entries are skipped.
    [[nodiscard]] std::vector<std::filesystem::path> scan(const std::filesystem::path& root) const;
    [[nodiscard]] bool matches(const std::filesystem::path& file) const;

private:
    std::vector<std::string> extensions_;
};

}
