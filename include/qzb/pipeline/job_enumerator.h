// =============================================================================
// qzbulk - Job Enumeration
// =============================================================================
// Produces the jobs of a run and hands them to a JobSink, which either
// pushes them onto the job queue or transfers them inline (single job mode).
//
// Dump:    pre-order walk of every collection of a library. One properties
//          job per collection (root included), and per document a document
//          job followed by a properties job.
// Restore: one pass over the archive entries. One job per document entry,
//          carrying its companion properties entry, and one properties job
//          per remaining properties entry.
//
// All jobs of a library are listed before the first one is handed out, so a
// listing failure aborts the library before any of its jobs is queued.
// =============================================================================

#ifndef QZB_PIPELINE_JOB_ENUMERATOR_H
#define QZB_PIPELINE_JOB_ENUMERATOR_H

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "qzb/archive/archiver.h"
#include "qzb/common/types.h"
#include "qzb/remote/remote_store.h"

namespace qzb::pipeline {

/// @brief Receives the enumerated jobs.
/// @return false to stop the enumeration (the run was interrupted)
using JobSink = std::function<bool(Job)>;

// =============================================================================
// Dump
// =============================================================================

class DumpEnumerator {
public:
    explicit DumpEnumerator(remote::RemoteStore& store) noexcept : store_(store) {}

    /// @brief Libraries a dump covers: the given one, or every library.
    /// @throws EnumerationError if the library does not exist or the
    ///         listing fails
    [[nodiscard]] std::vector<std::string> resolveLibraries(
        const std::optional<std::string>& library);

    /// @brief All jobs of one library, in pre-order.
    /// @throws EnumerationError if a collection cannot be listed
    [[nodiscard]] std::vector<Job> listJobs(const std::string& library);

    /// @brief Enumerate one library into a sink.
    /// @return false if the sink stopped the enumeration
    /// @throws EnumerationError
    bool enumerate(const std::string& library, const JobSink& sink);

private:
    void walk(const std::string& library, const std::string& path, std::vector<Job>& jobs);

    remote::RemoteStore& store_;
};

// =============================================================================
// Restore
// =============================================================================

/// @brief The jobs restoring one archived library.
struct LibraryPlan {
    /// @brief Library name inside the archive.
    std::string archiveName;

    /// @brief Library the jobs write to (differs when renamed).
    std::string targetName;

    std::vector<Job> jobs;
};

/// @brief Group archive entries into per-library restore jobs.
///
/// Jobs follow the archive order of their first entry. With an override:
/// if the archive holds that library only it is restored; else if the
/// archive holds exactly one library it is restored under the new name.
///
/// @param entries Archive entry names, in archive order
/// @param libraryOverride Value of --library, if any
/// @throws EnumerationError for a malformed entry name or an override that
///         matches no library of a multi-library archive
[[nodiscard]] std::vector<LibraryPlan> planRestore(
    const std::vector<std::string>& entries, const std::optional<std::string>& libraryOverride);

class RestoreEnumerator {
public:
    struct Options {
        /// @brief Restore into (or only) this library.
        std::optional<std::string> libraryOverride;

        /// @brief Read payloads ahead into the jobs (sequential archives).
        /// @note An unreadable entry does not stop the enumeration: its job
        ///       carries a prefetchError instead of payloads.
        bool prefetch = false;
    };

    RestoreEnumerator(archive::Archiver& archiver, remote::RemoteStore& store,
                      Options options) noexcept
        : archiver_(archiver), store_(store), options_(std::move(options)) {}

    /// @brief Enumerate the whole archive into a sink.
    ///
    /// Each target library is created first (ensureLibrary) if missing.
    ///
    /// @return false if the sink stopped the enumeration
    /// @throws EnumerationError
    bool enumerate(const JobSink& sink);

private:
    void prefetch(Job& job);

    archive::Archiver& archiver_;
    remote::RemoteStore& store_;
    Options options_;
};

}  // namespace qzb::pipeline

#endif  // QZB_PIPELINE_JOB_ENUMERATOR_H
