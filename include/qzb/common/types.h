// =============================================================================
// qzbulk - Common Type Definitions
// =============================================================================
// Core value types shared by the archive, remote and pipeline modules.
//
// This module defines:
// - Payload: raw bytes of a document body or encoded property set
// - TransferDirection: dump or restore
// - DocumentKind: XML or non-XML document body
// - JobKind / Job: one unit of transfer work
// - WriteRequest: one archive write routed to the archive writer
// - Shutdown: the queue sentinel
// - ExitStatus: per-worker and process exit status, max-severity aggregation
//
// Naming Conventions (project style guide):
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef QZB_COMMON_TYPES_H
#define QZB_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qzb {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Raw bytes of a document body or of an encoded property set.
using Payload = std::vector<std::uint8_t>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default number of concurrent jobs.
inline constexpr std::size_t kDefaultJobs = 8;

/// @brief Default capacity of the job queue, per worker.
inline constexpr std::size_t kDefaultJobQueueDepthPerWorker = 4;

/// @brief Default capacity of the archive write queue.
inline constexpr std::size_t kDefaultArchiveQueueCapacity = 64;

/// @brief Path of a library's root collection.
inline constexpr std::string_view kRootPath = "/";

// =============================================================================
// Transfer Direction
// =============================================================================

/// @brief Direction of a run.
enum class TransferDirection : std::uint8_t {
    /// @brief Database to archive.
    kDump = 0,

    /// @brief Archive to database.
    kRestore = 1
};

[[nodiscard]] constexpr std::string_view directionToString(TransferDirection direction) noexcept {
    switch (direction) {
        case TransferDirection::kDump: return "dump";
        case TransferDirection::kRestore: return "restore";
    }
    return "unknown";
}

// =============================================================================
// Document Kind
// =============================================================================

/// @brief Storage kind of a document body.
enum class DocumentKind : std::uint8_t {
    /// @brief Parsed and indexed XML document.
    kXml = 0,

    /// @brief Opaque non-XML document.
    kNonXml = 1
};

[[nodiscard]] constexpr std::string_view documentKindToString(DocumentKind kind) noexcept {
    switch (kind) {
        case DocumentKind::kXml: return "xml";
        case DocumentKind::kNonXml: return "non-xml";
    }
    return "xml";
}

// =============================================================================
// Queue Messages
// =============================================================================

/// @brief What a job transfers.
enum class JobKind : std::uint8_t {
    /// @brief A document body.
    kDocument = 0,

    /// @brief The property set of a document or collection.
    kProperties = 1
};

[[nodiscard]] constexpr std::string_view jobKindToString(JobKind kind) noexcept {
    switch (kind) {
        case JobKind::kDocument: return "document";
        case JobKind::kProperties: return "properties";
    }
    return "unknown";
}

/// @brief One unit of transfer work.
/// @note Jobs never own a connection or a file handle; workers acquire those.
struct Job {
    JobKind kind = JobKind::kDocument;

    /// @brief Library the job belongs to (after any restore rename).
    std::string library;

    /// @brief Document or collection path, always starting with '/'.
    std::string path;

    DocumentKind documentKind = DocumentKind::kXml;

    /// @brief Archive entry the payload is read from (restore only).
    std::string entryName;

    /// @brief Archive entry of the document's property set (restore only).
    /// @note Stored after the document body so the target exists.
    std::optional<std::string> propertiesEntry;

    /// @brief Payload read ahead by the enumerator (restore from a stream).
    std::optional<Payload> payload;

    /// @brief Property payload read ahead by the enumerator.
    std::optional<Payload> propertiesPayload;

    /// @brief Why the enumerator could not read the payloads ahead. A job
    ///        carrying it fails when a worker takes it.
    std::optional<std::string> prefetchError;
};

/// @brief One archive write routed to the archive writer.
struct WriteRequest {
    std::string name;
    Payload payload;
};

/// @brief Queue sentinel: the consumer that receives it terminates.
struct Shutdown {};

// =============================================================================
// Exit Status
// =============================================================================

/// @brief Outcome of a worker, of the archive writer, and of the whole run.
enum class ExitStatus : int {
    /// @brief Aborted by an interrupt; overrides every other status.
    kInterrupted = -1,

    kSuccess = 0,

    /// @brief At least one job failed.
    kTransferFailed = 1,

    /// @brief Fatal error during the run.
    kFatal = 2,

    /// @brief No client could be created.
    kNoClient = 100
};

/// @brief Severity rank used by max-severity-wins aggregation.
[[nodiscard]] constexpr int severity(ExitStatus status) noexcept {
    switch (status) {
        case ExitStatus::kSuccess: return 0;
        case ExitStatus::kTransferFailed: return 1;
        case ExitStatus::kFatal: return 2;
        case ExitStatus::kNoClient: return 3;
        case ExitStatus::kInterrupted: return 4;
    }
    return 2;
}

/// @brief Combine two statuses: the more severe one wins.
/// @note Priority: -1 > 100 > 2 > 1 > 0.
[[nodiscard]] constexpr ExitStatus aggregate(ExitStatus a, ExitStatus b) noexcept {
    return severity(b) > severity(a) ? b : a;
}

/// @brief Fold a set of statuses with aggregate(); empty sets yield kSuccess.
template <typename Range>
[[nodiscard]] constexpr ExitStatus aggregateAll(const Range& statuses) noexcept {
    ExitStatus result = ExitStatus::kSuccess;
    for (ExitStatus status : statuses) {
        result = aggregate(result, status);
    }
    return result;
}

[[nodiscard]] constexpr ExitStatus aggregateAll(std::initializer_list<ExitStatus> statuses) noexcept {
    ExitStatus result = ExitStatus::kSuccess;
    for (ExitStatus status : statuses) {
        result = aggregate(result, status);
    }
    return result;
}

/// @brief Integer value of a status, as returned by main().
[[nodiscard]] constexpr int toExitCode(ExitStatus status) noexcept {
    return static_cast<int>(status);
}

[[nodiscard]] constexpr std::string_view exitStatusToString(ExitStatus status) noexcept {
    switch (status) {
        case ExitStatus::kInterrupted: return "interrupted";
        case ExitStatus::kSuccess: return "success";
        case ExitStatus::kTransferFailed: return "transfer failed";
        case ExitStatus::kFatal: return "fatal";
        case ExitStatus::kNoClient: return "no client";
    }
    return "unknown";
}

/// @brief Convert a string to a Payload.
[[nodiscard]] inline Payload toPayload(std::string_view text) {
    return Payload(text.begin(), text.end());
}

/// @brief Convert a Payload to a string.
[[nodiscard]] inline std::string toString(const Payload& payload) {
    return std::string(payload.begin(), payload.end());
}

}  // namespace qzb

#endif  // QZB_COMMON_TYPES_H
