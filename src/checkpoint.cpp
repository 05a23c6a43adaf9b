/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slotwise/checkpoint.hpp"
#include "slotwise/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace slotwise {

namespace {

double nowSeconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string groupDigits(std::size_t value) {
    std::string digits = std::to_string(value);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            out.push_back(',');
        }
        out.push_back(*it);
        ++count;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string percent(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << "%";
    return ss.str();
}

IdSet readIdArray(const nlohmann::json& state, const char* key) {
    auto it = state.find(key);
    if (it == state.end() || it->is_null()) {
        return {};
    }
    if (!it->is_array()) {
        throw PersistenceError(std::string("'") + key + "' is not an array");
    }
    auto ids = it->get<std::vector<std::string>>();
    return IdSet(ids.begin(), ids.end());
}

void syncFile(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw PersistenceError("cannot reopen " + path.string() + ": " + std::strerror(errno));
    }
    int rc = ::fsync(fd);
    int syncErr = errno;
    ::close(fd);
    if (rc != 0) {
        throw PersistenceError("fsync failed for " + path.string() + ": " + std::strerror(syncErr));
    }
}

// Makes a completed rename durable. The new record is already visible, so a
// failure here is reported but not thrown.
void syncDirectory(const std::filesystem::path& dir) {
    const std::string path = dir.empty() ? std::string(".") : dir.string();
    int fd = ::open(path.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        LOG_WARN("Cannot open " + path + " to sync checkpoint rename: " + std::strerror(errno));
        return;
    }
    if (::fsync(fd) != 0) {
        LOG_WARN("fsync failed for directory " + path + ": " + std::strerror(errno));
    }
    ::close(fd);
}

}

CheckpointManager::CheckpointManager(std::filesystem::path file, std::size_t autoSaveInterval)
    : file_(std::move(file)), autoSaveInterval_(autoSaveInterval), startTime_(nowSeconds()) {
    LOG_DEBUG("CheckpointManager created - file: " + file_.string() +
              ", auto-save every " + std::to_string(autoSaveInterval_) + " outcomes");
}

std::filesystem::path CheckpointManager::tempFile() const {
    return std::filesystem::path(file_.string() + ".tmp");
}

std::pair<IdSet, IdSet> CheckpointManager::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    const bool present = std::filesystem::exists(file_, ec);
    if (ec) {
        LOG_ERROR("Cannot read checkpoint " + file_.string() + ", starting from scratch: " + ec.message());
        clearLocked();
        return {};
    }
    if (!present) {
        LOG_INFO("No checkpoint found at " + file_.string() + ", starting from scratch");
        return {};
    }

    try {
        std::ifstream in(file_, std::ios::binary);
        if (!in) {
            throw PersistenceError("cannot open " + file_.string());
        }
        const auto state = nlohmann::json::parse(in);
        if (!state.is_object()) {
            throw PersistenceError("top level is not a JSON object");
        }

        IdSet completed = readIdArray(state, "completed");
        IdSet failed = readIdArray(state, "failed");

        std::size_t totalFiles = 0;
        if (auto it = state.find("total_files"); it != state.end() && !it->is_null()) {
            if (!it->is_number_integer() || it->get<long long>() < 0) {
                throw PersistenceError("'total_files' is not a non-negative integer");
            }
            totalFiles = it->get<std::size_t>();
        }

        double startTime = nowSeconds();
        if (auto it = state.find("start_time"); it != state.end() && !it->is_null()) {
            if (!it->is_number()) {
                throw PersistenceError("'start_time' is not a number");
            }
            startTime = it->get<double>();
        }

        const std::string version = state.value("version", std::string());
        if (version != kVersion) {
            LOG_WARN("Checkpoint version '" + version + "' differs from " + kVersion + ", loading anyway");
        }

        std::size_t overlap = 0;
        for (const auto& id : completed) {
            overlap += failed.erase(id);
        }
        if (overlap > 0) {
            LOG_WARN(std::to_string(overlap) + " id(s) were recorded as both completed and failed; kept as completed");
        }

        completed_ = std::move(completed);
        failed_ = std::move(failed);
        totalFiles_ = totalFiles;
        startTime_ = startTime;
        pending_ = 0;

        std::string message = "Checkpoint loaded: " + groupDigits(completed_.size()) + " completed, " +
                              groupDigits(failed_.size()) + " failed";
        if (totalFiles_ > 0) {
            message += " (" + percent(static_cast<double>(completed_.size() + failed_.size()) /
                                      static_cast<double>(totalFiles_) * 100.0) + ")";
        }
        LOG_INFO(message);

        return {completed_, failed_};

    } catch (const std::exception& e) {
        LOG_ERROR("Checkpoint " + file_.string() + " is corrupt, starting from scratch: " + e.what());
        clearLocked();
        return {};
    }
}

void CheckpointManager::save(const IdSet& completed, const IdSet& failed, std::optional<std::size_t> totalFiles) {
    std::lock_guard<std::mutex> lock(mutex_);
    completed_ = completed;
    failed_ = failed;
    if (totalFiles) {
        totalFiles_ = *totalFiles;
    }
    saveLocked();
}

void CheckpointManager::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    saveLocked();
}

void CheckpointManager::saveLocked() {
    nlohmann::json state;
    state["completed"] = completed_;
    state["failed"] = failed_;
    state["total_files"] = totalFiles_;
    state["start_time"] = startTime_;
    state["last_update"] = nowSeconds();
    state["version"] = kVersion;

    writeAtomically(state.dump(2));
    pending_ = 0;

    LOG_DEBUG("Checkpoint saved: " + std::to_string(completed_.size()) + " completed, " +
              std::to_string(failed_.size()) + " failed");
}

void CheckpointManager::writeAtomically(const std::string& content) const {
    const auto temp = tempFile();

    auto discardTemp = [&temp]() {
        std::error_code ec;
        std::filesystem::remove(temp, ec);
        if (ec) {
            LOG_WARN("Could not remove temporary checkpoint " + temp.string() + ": " + ec.message());
        }
    };

    std::error_code ec;
    if (file_.has_parent_path()) {
        std::filesystem::create_directories(file_.parent_path(), ec);
        if (ec) {
            throw PersistenceError("cannot create " + file_.parent_path().string() + ": " + ec.message());
        }
    }

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            discardTemp();
            throw PersistenceError("cannot open " + temp.string() + " for writing");
        }
        out << content;
        out.flush();
        if (!out.good()) {
            out.close();
            discardTemp();
            throw PersistenceError("failed writing " + temp.string());
        }
    }

    try {
        syncFile(temp);
    } catch (const PersistenceError&) {
        discardTemp();
        throw;
    }

    std::filesystem::rename(temp, file_, ec);
    if (ec) {
        discardTemp();
        throw PersistenceError("cannot replace " + file_.string() + ": " + ec.message());
    }
    syncDirectory(file_.parent_path());
}

void CheckpointManager::updateProgress(const ItemId& id, Outcome outcome, bool autoSave) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outcome == Outcome::Completed) {
        completed_.insert(id);
        failed_.erase(id);
    } else {
        failed_.insert(id);
        completed_.erase(id);
    }
    ++pending_;

    if (autoSave && autoSaveInterval_ > 0 && pending_ >= autoSaveInterval_) {
        saveLocked();
    }
}

bool CheckpointManager::shouldSkip(const ItemId& id, bool forceRerun) const {
    if (forceRerun) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_.count(id) > 0;
}

ProgressStats CheckpointManager::getProgressStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ProgressStats stats;
    stats.completedCount = completed_.size();
    stats.failedCount = failed_.size();
    stats.processedCount = stats.completedCount + stats.failedCount;
    stats.totalFiles = totalFiles_;
    stats.remainingCount = totalFiles_ > stats.processedCount ? totalFiles_ - stats.processedCount : 0;
    if (stats.processedCount > 0) {
        stats.successRate = static_cast<double>(stats.completedCount) /
                            static_cast<double>(stats.processedCount) * 100.0;
    }
    if (stats.totalFiles > 0) {
        stats.progressPercentage = static_cast<double>(stats.processedCount) /
                                   static_cast<double>(stats.totalFiles) * 100.0;
    }
    stats.elapsed = std::chrono::duration<double>(std::max(0.0, nowSeconds() - startTime_));
    if (stats.processedCount > 0 && stats.remainingCount > 0) {
        stats.estimatedRemaining = stats.elapsed / static_cast<double>(stats.processedCount) *
                                   static_cast<double>(stats.remainingCount);
    }
    return stats;
}

void CheckpointManager::setTotalFiles(std::size_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    totalFiles_ = total;
}

IdSet CheckpointManager::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

IdSet CheckpointManager::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

std::size_t CheckpointManager::pendingChanges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

bool CheckpointManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);

    bool ok = true;
    for (const auto& path : {file_, tempFile()}) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            LOG_ERROR("Failed to remove " + path.string() + ": " + ec.message());
            ok = false;
        }
    }

    clearLocked();
    if (ok) {
        LOG_INFO("Checkpoint cleared: " + file_.string());
    }
    return ok;
}

void CheckpointManager::clearLocked() noexcept {
    completed_.clear();
    failed_.clear();
    totalFiles_ = 0;
    pending_ = 0;
    startTime_ = nowSeconds();
}

std::string formatProgressSummary(const ProgressStats& stats) {
    std::ostringstream ss;
    ss << "Progress summary\n";
    ss << "  Completed: " << groupDigits(stats.completedCount) << " files\n";
    ss << "  Failed: " << groupDigits(stats.failedCount) << " files\n";
    ss << "  Success rate: " << percent(stats.successRate) << "\n";
    ss << "  Progress: " << percent(stats.progressPercentage) << " (" << groupDigits(stats.processedCount)
       << "/" << groupDigits(stats.totalFiles) << ")\n";

    const double remaining = stats.estimatedRemaining.count();
    if (remaining > 0) {
        ss << std::fixed << std::setprecision(1);
        if (remaining / 3600.0 > 1.0) {
            ss << "  Estimated remaining: " << remaining / 3600.0 << " hours\n";
        } else {
            ss << "  Estimated remaining: " << remaining / 60.0 << " minutes\n";
        }
    }
    return ss.str();
}

}
