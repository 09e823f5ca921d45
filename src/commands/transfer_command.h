// =============================================================================
// qzbulk - Dump and Restore Commands
// =============================================================================
// Command handlers behind "qzbulk dump" and "qzbulk restore".
//
// This module provides:
// - TransferOptions: command line options of both subcommands
// - TransferCommand: resolves the database, builds the PipelineConfig and
//   runs the PipelineController
// - createDumpCommand / createRestoreCommand factories
// =============================================================================

#ifndef QZB_COMMANDS_TRANSFER_COMMAND_H
#define QZB_COMMANDS_TRANSFER_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "qzb/common/types.h"
#include "qzb/io/compression_format.h"
#include "qzb/pipeline/pipeline.h"
#include "qzb/remote/client_config.h"

namespace qzb::commands {

// =============================================================================
// Transfer Options
// =============================================================================

/// @brief Configuration options for the dump and restore commands.
struct TransferOptions {
    TransferDirection direction = TransferDirection::kDump;

    /// @brief Database URL or configuration section name.
    std::string database;

    /// @brief Target (dump) or source (restore) directory.
    std::filesystem::path directory = ".";

    /// @brief Tar file; replaces the directory when set.
    std::optional<std::filesystem::path> tarFile;

    /// @brief Tar compression. Ignored on restore (detected from the file).
    io::CompressionFormat compression = io::CompressionFormat::kNone;

    /// @brief Dump: library to dump. Restore: library override.
    std::optional<std::string> library;

    std::size_t jobs = kDefaultJobs;

    /// @brief Overrides the timeout of the configuration file.
    std::optional<int> timeoutSeconds;
};

// =============================================================================
// TransferCommand Class
// =============================================================================

class TransferCommand {
public:
    explicit TransferCommand(TransferOptions options);

    ~TransferCommand();

    TransferCommand(const TransferCommand&) = delete;
    TransferCommand& operator=(const TransferCommand&) = delete;

    /// @brief Execute the command.
    /// @return Process exit status (toExitCode of the aggregated ExitStatus)
    [[nodiscard]] int execute();

    /// @brief Interrupt a running execute() (signal handler thread).
    void cancel() noexcept;

    [[nodiscard]] const TransferOptions& options() const noexcept { return options_; }

    /// @brief Build the pipeline configuration for a resolved client.
    [[nodiscard]] pipeline::PipelineConfig buildConfig(remote::ClientConfig client) const;

private:
    void printSummary(const pipeline::PipelineStats& stats, ExitStatus status) const;

    TransferOptions options_;
    std::mutex mutex_;
    std::unique_ptr<pipeline::PipelineController> controller_;
    bool cancelled_ = false;
};

// =============================================================================
// Factory Functions
// =============================================================================

[[nodiscard]] std::unique_ptr<TransferCommand> createDumpCommand(TransferOptions options);

[[nodiscard]] std::unique_ptr<TransferCommand> createRestoreCommand(TransferOptions options);

}  // namespace qzb::commands

#endif  // QZB_COMMANDS_TRANSFER_COMMAND_H
