/*
 * slotwise - Batch runner CLI (slotwise)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slotwise/batch.hpp"
#include "slotwise/checkpoint.hpp"
#include "slotwise/config.hpp"
#include "slotwise/logger.hpp"
#include "slotwise/processor.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace slotwise;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "slotwise Batch Runner v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " run <root> --cmd <command> [options]\n";
    std::cout << "       " << progName << " status <checkpoint-file>\n";
    std::cout << "       " << progName << " reset <checkpoint-file>\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Run options:\n";
    std::cout << "  --cmd <command>       Command run per item; {} is replaced by the item path\n";
    std::cout << "  --concurrency <n>     Maximum items in flight (default 50000)\n";
    std::cout << "  --timeout <sec>       Per-item timeout in seconds (default 259200)\n";
    std::cout << "  --checkpoint <file>   Checkpoint file (default <root>/.slotwise/checkpoint.json)\n";
    std::cout << "  --interval <n>        Save the checkpoint every n outcomes (default 100)\n";
    std::cout << "  --retries <n>         Extra attempts when the command fails (default 0)\n";
    std::cout << "  --ext <suffix>        Result file suffix, empty to disable (default .json)\n";
    std::cout << "  --force               Reprocess items already completed\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SLOTWISE_LOG_LEVEL            Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  SLOTWISE_CONCURRENT_LIMIT     Default for --concurrency\n";
    std::cout << "  SLOTWISE_TASK_TIMEOUT         Default for --timeout\n";
    std::cout << "  SLOTWISE_CHECKPOINT_INTERVAL  Default for --interval\n";
    std::cout << "  SLOTWISE_POLL_INTERVAL        Seconds between progress lines while draining\n";
    std::cout << "  SLOTWISE_RETRIES              Default for --retries\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " run ./images --cmd \"./score.sh {}\" --concurrency 200\n";
    std::cout << "  " << progName << " status ./images/.slotwise/checkpoint.json\n";
}

bool parsePositive(const std::string& text, std::size_t& out) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size() || value <= 0) {
            return false;
        }
        out = static_cast<std::size_t>(value);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

void printSummary(const BatchSummary& summary) {
    std::cout << "\nBatch processing " << (summary.stopped ? "stopped" : "completed") << ".\n";
    std::cout << "Found: " << summary.found << ", skipped: " << summary.skipped << "\n";
    std::cout << "Success: " << summary.succeeded << "/" << summary.submitted << "\n";
    std::cout << "Failed: " << summary.failed << " (timed out: " << summary.timedOut << ")\n";
    if (summary.cancelled > 0) {
        std::cout << "Cancelled: " << summary.cancelled << "\n";
    }
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "Time: " << summary.elapsed.count() << " seconds\n";
    if (summary.elapsed.count() > 0 && summary.submitted > 0) {
        std::cout << "Speed: " << static_cast<double>(summary.submitted) / summary.elapsed.count() << " items/sec\n";
    }
    std::cout << "Peak in flight: " << summary.pool.peakInFlight << "/" << summary.pool.capacity << "\n";
    std::cout << "Pool success rate: " << summary.pool.successRate << "%\n";
    std::cout << formatProgressSummary(summary.progress);
}

int runCommand(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    Config config = Config::fromEnvironment();
    const std::filesystem::path root = argv[2];
    CommandOptions command;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << flag << " requires a value\n";
                return nullptr;
            }
            return argv[++i];
        };
        std::size_t number = 0;

        if (arg == "--force") {
            config.forceRerun = true;
        } else if (arg == "--cmd") {
            const char* value = needValue("--cmd");
            if (!value) return 1;
            command.commandTemplate = value;
        } else if (arg == "--checkpoint") {
            const char* value = needValue("--checkpoint");
            if (!value) return 1;
            config.checkpointFile = value;
        } else if (arg == "--ext") {
            const char* value = needValue("--ext");
            if (!value) return 1;
            config.outputExtension = value;
        } else if (arg == "--concurrency" || arg == "--timeout" || arg == "--interval" || arg == "--retries") {
            const char* value = needValue(arg.c_str());
            if (!value) return 1;
            if (!parsePositive(value, number) && !(arg == "--retries" && std::string(value) == "0")) {
                std::cerr << "Error: " << arg << " expects a positive integer, got '" << value << "'\n";
                return 1;
            }
            if (arg == "--concurrency") config.concurrency = number;
            if (arg == "--timeout") config.taskTimeout = std::chrono::seconds(number);
            if (arg == "--interval") config.checkpointInterval = number;
            if (arg == "--retries") config.retries = static_cast<int>(number);
        } else {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            return 1;
        }
    }

    if (command.commandTemplate.empty()) {
        std::cerr << "Error: --cmd is required\n";
        return 1;
    }
    command.retries = config.retries;
    command.outputExtension = config.outputExtension;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    BatchRunner runner(config, std::make_shared<CommandProcessor>(command));

    std::atomic<bool> finished{false};
    std::thread signalWatcher([&runner, &finished] {
        setThreadName("Signals");
        while (!finished.load()) {
            if (g_shutdown_requested) {
                LOG_WARN("Shutdown requested, cancelling in-flight work...");
                runner.requestStop();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        clearThreadName();
    });

    int exitCode = 0;
    std::size_t abandoned = 0;
    try {
        BatchSummary summary = runner.run(root);
        printSummary(summary);
        abandoned = summary.pool.abandoned;
        exitCode = summary.stopped ? 130 : 0;
    } catch (const PersistenceError& e) {
        std::cerr << "Error: checkpoint could not be saved: " << e.what() << std::endl;
        exitCode = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exitCode = 1;
    }

    finished.store(true);
    signalWatcher.join();

    if (abandoned > 0) {
        // Work threads outlived the pool; leave without running static destructors under them.
        LOG_WARN(std::to_string(abandoned) + " work thread(s) still running at exit");
        std::cout.flush();
        std::cerr.flush();
        std::_Exit(exitCode);
    }
    return exitCode;
}

int statusCommand(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }
    const std::filesystem::path file = argv[2];
    if (!std::filesystem::exists(file)) {
        std::cerr << "Error: no checkpoint at " << file.string() << "\n";
        return 1;
    }

    CheckpointManager checkpoint(file);
    (void)checkpoint.load();
    std::cout << formatProgressSummary(checkpoint.getProgressStats());
    return 0;
}

int resetCommand(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }
    CheckpointManager checkpoint(argv[2]);
    if (!checkpoint.reset()) {
        std::cerr << "Error: failed to clear checkpoint " << argv[2] << "\n";
        return 1;
    }
    std::cout << "Checkpoint cleared\n";
    return 0;
}

int main(int argc, char* argv[]) {
    setThreadName("Main");

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string subcommand = argv[1];
    if (subcommand == "-h" || subcommand == "--help") {
        printUsage(argv[0]);
        return 0;
    }
    if (subcommand == "-v" || subcommand == "--version") {
        std::cout << VERSION << "\n";
        return 0;
    }

    try {
        if (subcommand == "run") return runCommand(argc, argv);
        if (subcommand == "status") return statusCommand(argc, argv);
        if (subcommand == "reset") return resetCommand(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Error: unknown command '" << subcommand << "'\n";
    printUsage(argv[0]);
    return 1;
}
