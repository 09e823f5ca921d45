// =============================================================================
// qzbulk - Archive Writer Implementation
// =============================================================================

#include "qzb/pipeline/archive_writer.h"

#include <utility>
#include <variant>

#include <fmt/format.h>

#include "qzb/archive/archive_layout.h"
#include "qzb/common/error.h"
#include "qzb/common/logger.h"

namespace qzb::pipeline {

ArchiveWriter::ArchiveWriter(archive::Archiver& archiver, ArchiveQueue& queue,
                             PipelineHooks hooks)
    : archiver_(archiver), queue_(queue), hooks_(std::move(hooks)) {}

ArchiveWriter::~ArchiveWriter() {
    if (thread_.joinable()) {
        static_cast<void>(shutdown());
    }
}

void ArchiveWriter::start() {
    report_ = WorkerReport{};
    thread_ = std::thread([this] { run(); });
}

WorkerReport ArchiveWriter::shutdown() {
    if (!thread_.joinable()) {
        return report_;
    }
    if (!queue_.push(Shutdown{})) {
        // only reachable if someone interrupted the archive queue
        QZB_LOG_ERROR("Archive queue interrupted before the writer shut down");
    }
    thread_.join();
    return report_;
}

void ArchiveWriter::run() {
    log::ThreadContext context("writer");
    try {
        consume();
    } catch (const std::exception& e) {
        QZB_LOG_ERROR("Stopped: {}", e.what());
        report_.recordFatal(ExitStatus::kFatal, e.what());
    } catch (...) {
        QZB_LOG_ERROR("Stopped by an unknown exception");
        report_.recordFatal(ExitStatus::kFatal, "unknown exception");
    }

    // The writer owns the close, whatever ended the loop.
    try {
        archiver_.close();
    } catch (const std::exception& e) {
        QZB_LOG_ERROR("Failed to close the archive: {}", e.what());
        report_.recordFatal(ExitStatus::kFatal, e.what());
    } catch (...) {
        QZB_LOG_ERROR("Failed to close the archive: unknown exception");
        report_.recordFatal(ExitStatus::kFatal, "unknown exception");
    }
    QZB_LOG_DEBUG("Done: {} entries written, {} failed", report_.transferred,
                  report_.failedPaths.size());
}

void ArchiveWriter::consume() {
    while (true) {
        std::optional<ArchiveMessage> message = queue_.pop();
        if (!message) {
            report_.recordFatal(ExitStatus::kFatal, "Archive queue interrupted");
            return;
        }
        if (std::holds_alternative<Shutdown>(*message)) {
            report_.sawShutdown = true;
            if (hooks_.onWriterShutdown) {
                hooks_.onWriterShutdown();
            }
            return;
        }

        WriteRequest& request = std::get<WriteRequest>(*message);
        try {
            archiver_.write(request.name, std::move(request.payload));
            ++report_.transferred;
        } catch (const std::exception& e) {
            QZB_LOG_ERROR("Failed to write archive entry {}: {}", request.name, e.what());
            report_.failedPaths.push_back(entryLabel(request.name));
            report_.status = aggregate(report_.status, ExitStatus::kFatal);
        }
    }
}

std::string entryLabel(const std::string& entryName) {
    try {
        archive::layout::EntryRef ref = archive::layout::parseEntry(entryName);
        return fmt::format("{}:{}", ref.library, ref.path);
    } catch (const FormatError&) {
        return entryName;
    }
}

}  // namespace qzb::pipeline
