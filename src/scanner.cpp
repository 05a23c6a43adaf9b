/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slotwise/scanner.hpp"
#include "slotwise/config.hpp"
#include "slotwise/logger.hpp"
#include <algorithm>
#include <cctype>

namespace slotwise {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

Scanner::Scanner(std::vector<std::string> extensions) {
    for (auto& ext : extensions) {
        if (ext.empty()) {
            continue;
        }
        if (ext.front() != '.') {
            ext.insert(ext.begin(), '.');
        }
        extensions_.push_back(toLowerCopy(std::move(ext)));
    }
}

bool Scanner::matches(const std::filesystem::path& file) const {
    const std::string ext = toLowerCopy(file.extension().string());
    return !ext.empty() && std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

std::vector<std::filesystem::path> Scanner::scan(const std::filesystem::path& root) const {
    std::vector<std::filesystem::path> files;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        LOG_ERROR("Not a directory: " + root.string());
        return files;
    }

    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_ERROR("Cannot read " + root.string() + ": " + ec.message());
        return files;
    }

    const std::filesystem::recursive_directory_iterator end;
    while (it != end) {
        const auto& entry = *it;
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            if (entry.path().filename() == kStateDirName) {
                it.disable_recursion_pending();
            }
        } else if (entry.is_regular_file(typeEc) && matches(entry.path())) {
            files.push_back(entry.path());
            LOG_TRACE("Found item: " + entry.path().string());
        }

        it.increment(ec);
        if (ec) {
            LOG_WARN("Scan of " + root.string() + " stopped early: " + ec.message());
            break;
        }
    }

    std::sort(files.begin(), files.end());
    LOG_DEBUG("Scanner found " + std::to_string(files.size()) + " item(s) under " + root.string());
    return files;
}

}
