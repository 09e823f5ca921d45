// =============================================================================
// qzbulk - Bulk Dump and Restore for Qizx XML Databases
// =============================================================================
// Main entry point for the qzbulk command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: dump, restore
// - Global options: verbose, debug, log-file
// - SIGINT/SIGTERM handling on a dedicated thread, interrupting the run
// =============================================================================

#include <CLI/CLI.hpp>

#include <pthread.h>
#include <signal.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "qzb/common/error.h"
#include "qzb/common/logger.h"
#include "qzb/common/types.h"

#include "commands/interrupt_relay.h"
#include "commands/transfer_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "1.0.0";
constexpr const char* kDescription =
    "qzbulk: parallel dump and restore of Qizx XML libraries\n"
    "DATABASE is a URL (http[s]://user:password@host:port/qizx/api#library)\n"
    "or the name of a section of /etc/qizx, ~/.qizx or ./.qizx.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    bool verbose = false;
    bool debug = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Transfer Command Options
// =============================================================================

struct CliTransferOptions {
    std::string database;
    std::string directory = ".";
    std::string tarFile;
    bool gzip = false;
    bool bzip2 = false;
    bool xz = false;
    bool zstd = false;
    std::string library;
    std::size_t jobs = qzb::kDefaultJobs;
    int timeout = 0;  // 0 = configuration file or none
};

CliTransferOptions gDumpOpts;
CliTransferOptions gRestoreOpts;

// =============================================================================
// Interrupt Handling
// =============================================================================

/// @brief Make an ExitStatus code a process exit code (-1 becomes 255).
[[nodiscard]] int processExitCode(int status) noexcept {
    return status & 0xff;
}

qzb::commands::InterruptRelay gInterrupts;

void signalHandlerThread(sigset_t set) {
    while (true) {
        int signal = 0;
        if (sigwait(&set, &signal) != 0) {
            continue;
        }
        switch (gInterrupts.onSignal()) {
            case qzb::commands::InterruptRelay::Action::kCancelled:
                QZB_LOG_WARNING("Interrupted by signal {}, shutting down", signal);
                break;
            case qzb::commands::InterruptRelay::Action::kIgnored:
                break;
            case qzb::commands::InterruptRelay::Action::kExit:
                QZB_LOG_WARNING("Interrupted by signal {} before the run started", signal);
                try {
                    qzb::log::flush();
                } catch (const std::exception& e) {
                    std::cerr << "Failed to flush the log: " << e.what() << std::endl;
                }
                std::_Exit(processExitCode(qzb::toExitCode(qzb::ExitStatus::kInterrupted)));
        }
    }
}

/// @brief Block SIGINT/SIGTERM in every thread and handle them on one.
void startSignalHandlerThread() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0) {
        throw qzb::QZBException(qzb::ErrorCode::kInvalidState, "Cannot block signals");
    }
    std::thread(signalHandlerThread, set).detach();
}

// =============================================================================
// Command Setup Functions
// =============================================================================

void addTransferOptions(CLI::App* command, CliTransferOptions& opts, bool dump) {
    command->add_option("database", opts.database, "Database URL or configuration section")
        ->required();

    command->add_option("-d,--directory", opts.directory,
                        dump ? "Target directory" : "Source directory")
        ->default_val(".");

    auto* tar = command->add_option("-t,--tar", opts.tarFile,
                                    dump ? "Dump into a tar file" : "Restore from a tar file");
    if (!dump) {
        tar->check(CLI::ExistingFile);
    }

    auto* gzip = command->add_flag("-z,--gzip", opts.gzip, "gzip-compressed tar file");
    auto* bzip2 = command->add_flag("-j,--bzip2", opts.bzip2, "bzip2-compressed tar file");
    auto* xz = command->add_flag("--xz", opts.xz, "xz-compressed tar file");
    auto* zstd = command->add_flag("--zstd", opts.zstd, "zstd-compressed tar file");
    gzip->excludes(bzip2)->excludes(xz)->excludes(zstd);
    bzip2->excludes(xz)->excludes(zstd);
    xz->excludes(zstd);

    command->add_option("-l,--library", opts.library,
                        dump ? "Dump only this library" : "Restore into this library");

    command->add_option("-J,--jobs", opts.jobs, "Number of concurrent jobs")
        ->default_val(qzb::kDefaultJobs)
        ->check(CLI::PositiveNumber);

    command->add_option("--timeout", opts.timeout, "Per-request timeout in seconds")
        ->check(CLI::NonNegativeNumber);
}

void setupDumpCommand(CLI::App& app) {
    auto* dump = app.add_subcommand("dump", "Dump libraries to a directory or tar file");
    addTransferOptions(dump, gDumpOpts, true);
}

void setupRestoreCommand(CLI::App& app) {
    auto* restore = app.add_subcommand("restore", "Restore libraries from a directory or tar file");
    addTransferOptions(restore, gRestoreOpts, false);
}

qzb::commands::TransferOptions toTransferOptions(const CliTransferOptions& opts) {
    qzb::commands::TransferOptions options;
    options.database = opts.database;
    options.directory = opts.directory;
    if (!opts.tarFile.empty()) {
        options.tarFile = opts.tarFile;
    }
    if (opts.gzip) {
        options.compression = qzb::io::CompressionFormat::kGzip;
    } else if (opts.bzip2) {
        options.compression = qzb::io::CompressionFormat::kBzip2;
    } else if (opts.xz) {
        options.compression = qzb::io::CompressionFormat::kXz;
    } else if (opts.zstd) {
        options.compression = qzb::io::CompressionFormat::kZstd;
    }
    if (!opts.library.empty()) {
        options.library = opts.library;
    }
    options.jobs = opts.jobs;
    if (opts.timeout > 0) {
        options.timeoutSeconds = opts.timeout;
    }
    return options;
}

int runCommand(std::unique_ptr<qzb::commands::TransferCommand> command) {
    gInterrupts.attach(*command);
    try {
        int status = command->execute();
        gInterrupts.detach();
        return status;
    } catch (const std::exception&) {
        gInterrupts.detach();
        throw;
    }
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_flag("-v,--verbose", gOptions.verbose, "Report progress");
    app.add_flag("--debug", gOptions.debug, "Report every transferred item");
    app.add_option("--log-file", gOptions.logFile, "Also write the log to this file");

    setupDumpCommand(app);
    setupRestoreCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        qzb::log::init({.level = qzb::log::levelFor(gOptions.verbose, gOptions.debug),
                        .logFile = gOptions.logFile});
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return qzb::toExitCode(qzb::ExitStatus::kFatal);
    }

    int status = qzb::toExitCode(qzb::ExitStatus::kSuccess);
    try {
        startSignalHandlerThread();

        if (app.got_subcommand("dump")) {
            status = runCommand(qzb::commands::createDumpCommand(toTransferOptions(gDumpOpts)));
        } else if (app.got_subcommand("restore")) {
            status =
                runCommand(qzb::commands::createRestoreCommand(toTransferOptions(gRestoreOpts)));
        }
    } catch (const qzb::QZBException& ex) {
        QZB_LOG_ERROR("Error: {}", ex.what());
        status = qzb::toExitCode(qzb::ExitStatus::kFatal);
    } catch (const std::exception& ex) {
        QZB_LOG_ERROR("Unexpected error: {}", ex.what());
        status = qzb::toExitCode(qzb::ExitStatus::kFatal);
    }

    gInterrupts.detach();
    qzb::log::shutdown();
    return processExitCode(status);
}
