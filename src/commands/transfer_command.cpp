// =============================================================================
// qzbulk - Dump and Restore Commands Implementation
// =============================================================================

#include "transfer_command.h"

#include <chrono>
#include <iostream>
#include <utility>

#include <fmt/format.h>

#include "qzb/common/error.h"
#include "qzb/common/logger.h"
#include "qzb/remote/http_remote_store.h"

namespace qzb::commands {

namespace {

/// Failed paths listed in the summary before it is truncated.
constexpr std::size_t kMaxListedFailures = 20;

}  // namespace

// =============================================================================
// TransferCommand Implementation
// =============================================================================

TransferCommand::TransferCommand(TransferOptions options) : options_(std::move(options)) {}

TransferCommand::~TransferCommand() = default;

int TransferCommand::execute() {
    remote::ClientConfig client;
    try {
        client = remote::ClientConfig::resolve(options_.database);
    } catch (const QZBException& e) {
        QZB_LOG_ERROR("Cannot resolve database '{}': {}", options_.database, e.what());
        return toExitCode(ExitStatus::kNoClient);
    }
    QZB_LOG_DEBUG("Database {} (library: {})", client.baseUrl,
                  client.defaultLibrary.value_or("none"));

    pipeline::PipelineController* controller = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        controller_ = std::make_unique<pipeline::PipelineController>(buildConfig(std::move(client)));
        if (cancelled_) {
            controller_->cancel();
        }
        controller = controller_.get();
    }

    ExitStatus status = controller->run();
    printSummary(controller->stats(), status);
    return toExitCode(status);
}

void TransferCommand::cancel() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    if (controller_) {
        controller_->cancel();
    }
}

pipeline::PipelineConfig TransferCommand::buildConfig(remote::ClientConfig client) const {
    pipeline::PipelineConfig config;
    config.direction = options_.direction;
    config.jobs = options_.jobs;
    config.library = options_.library ? options_.library : client.defaultLibrary;

    if (options_.tarFile) {
        config.archive.format = archive::ArchiveFormat::kTar;
        config.archive.path = *options_.tarFile;
        if (options_.direction == TransferDirection::kDump) {
            config.archive.compression =
                options_.compression != io::CompressionFormat::kNone
                    ? options_.compression
                    : io::detectCompressionFormatFromExtension(*options_.tarFile);
        }
    } else {
        config.archive.format = archive::ArchiveFormat::kDirectory;
        config.archive.path = options_.directory;
    }

    if (options_.timeoutSeconds) {
        client.timeout = std::chrono::seconds(*options_.timeoutSeconds);
    }
    config.storeFactory = remote::makeHttpRemoteStoreFactory(std::move(client));
    return config;
}

void TransferCommand::printSummary(const pipeline::PipelineStats& stats,
                                   ExitStatus status) const {
    std::cout << fmt::format("{}: {} jobs, {} transferred, {} failed ({:.1f}s)",
                             directionToString(options_.direction), stats.jobsQueued,
                             stats.jobsTransferred, stats.failedPaths.size(),
                             static_cast<double>(stats.elapsedMs) / 1000.0)
              << std::endl;

    for (std::size_t i = 0; i < stats.failedPaths.size() && i < kMaxListedFailures; ++i) {
        std::cout << "  failed: " << stats.failedPaths[i] << std::endl;
    }
    if (stats.failedPaths.size() > kMaxListedFailures) {
        std::cout << fmt::format("  ... and {} more", stats.failedPaths.size() - kMaxListedFailures)
                  << std::endl;
    }

    if (status != ExitStatus::kSuccess) {
        std::cout << fmt::format("exit status {} ({})", toExitCode(status),
                                 exitStatusToString(status))
                  << std::endl;
    }
}

// =============================================================================
// Factory Functions
// =============================================================================

std::unique_ptr<TransferCommand> createDumpCommand(TransferOptions options) {
    options.direction = TransferDirection::kDump;
    return std::make_unique<TransferCommand>(std::move(options));
}

std::unique_ptr<TransferCommand> createRestoreCommand(TransferOptions options) {
    options.direction = TransferDirection::kRestore;
    return std::make_unique<TransferCommand>(std::move(options));
}

}  // namespace qzb::commands
