/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slotwise/config.hpp"
#include "slotwise/logger.hpp"
#include <cstdlib>
#include <stdexcept>

namespace slotwise {

namespace {
std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    if (*val == '-') {
        LOG_WARN(std::string("Ignoring negative ") + name + "=" + val);
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::logic_error&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::chrono::seconds env_seconds(const char* name, std::chrono::seconds defv) {
    return std::chrono::seconds(env_size(name, static_cast<std::size_t>(defv.count())));
}
}

Config Config::fromEnvironment() {
    Config config;
    config.concurrency = env_size("SLOTWISE_CONCURRENT_LIMIT", config.concurrency);
    config.taskTimeout = env_seconds("SLOTWISE_TASK_TIMEOUT", config.taskTimeout);
    config.checkpointInterval = env_size("SLOTWISE_CHECKPOINT_INTERVAL", config.checkpointInterval);
    config.pollInterval = env_seconds("SLOTWISE_POLL_INTERVAL", config.pollInterval);
    config.retries = static_cast<int>(env_size("SLOTWISE_RETRIES", static_cast<std::size_t>(config.retries)));
    return config;
}

std::filesystem::path Config::checkpointPathFor(const std::filesystem::path& root) const {
    return checkpointFile.empty() ? root / kStateDirName / "checkpoint.json" : checkpointFile;
}

std::filesystem::path Config::errorLogPathFor(const std::filesystem::path& root) const {
    return errorLog.empty() ? root / kStateDirName / "errors.jsonl" : errorLog;
}

}
