/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace slotwise {

struct Config {
    std::size_t concurrency = 50'000;
    std::chrono::seconds taskTimeout = std::chrono::hours(72);
    std::size_t checkpointInterval = 100;
    std::chrono::seconds pollInterval{60};
    std::chrono::seconds shutdownGrace{5};
    int retries = 0;
    bool forceRerun = false;

    // Empty paths resolve to <root>/.slotwise/{checkpoint.json,errors.jsonl}.
    std::filesystem::path checkpointFile;
    std::filesystem::path errorLog;

    std::vector<std::string> extensions = {".jpg", ".jpeg", ".png", ".bmp", ".webp"};
    std::string outputExtension = ".json";

    // Defaults overlaid with SLOTWISE_* environment variables.
    [[nodiscard]] static Config fromEnvironment();

    [[nodiscard]] std::filesystem::path checkpointPathFor(const std::filesystem::path& root) const;
    [[nodiscard]] std::filesystem::path errorLogPathFor(const std::filesystem::path& root) const;
};

// Directory under the batch root that holds run state.
constexpr const char* kStateDirName = ".slotwise";

}
