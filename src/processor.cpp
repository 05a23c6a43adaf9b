/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slotwise/processor.hpp"
#include "slotwise/logger.hpp"
#include <array>
#include <cerrno>
#include <cstdio>
#include <exception>
#include <fstream>
#include <system_error>
#include <sys/wait.h>

namespace slotwise {

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

CommandProcessor::CommandProcessor(CommandOptions options) : options_(std::move(options)) {
    if (options_.commandTemplate.empty()) {
        throw std::invalid_argument("command template must not be empty");
    }
    if (options_.retries < 0) {
        options_.retries = 0;
    }
    LOG_DEBUG("CommandProcessor created: " + options_.commandTemplate +
              " (retries: " + std::to_string(options_.retries) + ")");
}

std::string CommandProcessor::buildCommand(const std::filesystem::path& item) const {
    static const std::string placeholder = "{}";
    const std::string quoted = shellQuote(item.string());

    std::string command = options_.commandTemplate;
    std::size_t pos = command.find(placeholder);
    if (pos == std::string::npos) {
        return command + " " + quoted;
    }
    while (pos != std::string::npos) {
        command.replace(pos, placeholder.size(), quoted);
        pos = command.find(placeholder, pos + quoted.size());
    }
    return command;
}

std::filesystem::path CommandProcessor::outputPathFor(const std::filesystem::path& item) const {
    auto out = item;
    out.replace_extension(options_.outputExtension);
    return out;
}

std::string CommandProcessor::process(const std::filesystem::path& item, const CancelToken& cancel) {
    const std::string command = buildCommand(item);
    const int attempts = options_.retries + 1;

    for (int attempt = 1; ; ++attempt) {
        if (cancel.cancelled()) {
            throw std::runtime_error("cancelled before attempt " + std::to_string(attempt) + " for " + item.string());
        }

        try {
            std::string output = runOnce(command);
            if (!options_.outputExtension.empty()) {
                writeOutput(item, output);
            }
            return output;
        } catch (const CommandError& e) {
            if (attempt >= attempts) {
                std::throw_with_nested(std::runtime_error(
                    "processing " + item.string() + " failed after " + std::to_string(attempts) + " attempt(s)"));
            }
            LOG_WARN("Attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) +
                     " failed for " + item.string() + ": " + e.what());
        }
    }
}

std::string CommandProcessor::runOnce(const std::string& command) const {
    LOG_TRACE("Running: " + command);

    FILE* pipe = ::popen(command.c_str(), "r");
    if (!pipe) {
        throw std::system_error(errno, std::generic_category(), "popen failed");
    }

    std::string output;
    std::array<char, 4096> buffer{};
    std::size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.append(buffer.data(), n);
    }
    const bool readFailed = std::ferror(pipe) != 0;

    const int status = ::pclose(pipe);
    if (status == -1) {
        throw std::system_error(errno, std::generic_category(), "pclose failed");
    }
    if (readFailed) {
        throw CommandError("failed reading command output", -1);
    }
    if (WIFSIGNALED(status)) {
        throw CommandError("command killed by signal " + std::to_string(WTERMSIG(status)), 128 + WTERMSIG(status));
    }
    const int exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exitCode != 0) {
        throw CommandError("command exited with status " + std::to_string(exitCode), exitCode);
    }
    return output;
}

void CommandProcessor::writeOutput(const std::filesystem::path& item, const std::string& output) const {
    const auto finalPath = outputPathFor(item);
    const auto tempPath = std::filesystem::path(finalPath.string() + ".tmp");

    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("cannot open " + tempPath.string());
        }
        file << output;
        file.flush();
        if (!file.good()) {
            file.close();
            std::error_code ec;
            std::filesystem::remove(tempPath, ec);
            throw std::runtime_error("failed writing " + tempPath.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code rmEc;
        std::filesystem::remove(tempPath, rmEc);
        throw std::runtime_error("cannot publish " + finalPath.string() + ": " + ec.message());
    }
    LOG_DEBUG("Result written: " + finalPath.string());
}

}
