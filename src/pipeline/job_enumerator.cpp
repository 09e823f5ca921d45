// =============================================================================
// qzbulk - Job Enumeration Implementation
// =============================================================================

#include "qzb/pipeline/job_enumerator.h"

#include <algorithm>
#include <map>

#include <fmt/format.h>

#include "qzb/archive/archive_layout.h"
#include "qzb/common/error.h"
#include "qzb/common/logger.h"

namespace qzb::pipeline {

namespace {

Job propertiesJob(const std::string& library, const std::string& path) {
    Job job;
    job.kind = JobKind::kProperties;
    job.library = library;
    job.path = path;
    return job;
}

Job documentJob(const std::string& library, const std::string& path, DocumentKind kind) {
    Job job;
    job.kind = JobKind::kDocument;
    job.library = library;
    job.path = path;
    job.documentKind = kind;
    return job;
}

/// Entries of one archived member, keyed by its path.
struct ArchivedMember {
    std::size_t order = 0;
    std::optional<std::string> contentEntry;
    std::optional<std::string> propertiesEntry;
};

using ArchivedLibrary = std::map<std::string, ArchivedMember>;

}  // namespace

// =============================================================================
// DumpEnumerator
// =============================================================================

std::vector<std::string> DumpEnumerator::resolveLibraries(
    const std::optional<std::string>& library) {
    std::vector<std::string> libraries;
    try {
        libraries = store_.listLibraries();
    } catch (const QZBException& e) {
        throw EnumerationError(fmt::format("Cannot list libraries: {}", e.message()));
    }

    if (library) {
        if (std::find(libraries.begin(), libraries.end(), *library) == libraries.end()) {
            throw EnumerationError(fmt::format("No library named '{}'", *library),
                                   ErrorContext{}.withLibrary(*library));
        }
        return {*library};
    }

    std::sort(libraries.begin(), libraries.end());
    return libraries;
}

std::vector<Job> DumpEnumerator::listJobs(const std::string& library) {
    std::vector<Job> jobs;
    walk(library, std::string(kRootPath), jobs);
    return jobs;
}

bool DumpEnumerator::enumerate(const std::string& library, const JobSink& sink) {
    std::vector<Job> jobs = listJobs(library);
    QZB_LOG_INFO("Dumping library {} ({} jobs)", library, jobs.size());

    for (Job& job : jobs) {
        if (!sink(std::move(job))) {
            return false;
        }
    }
    return true;
}

void DumpEnumerator::walk(const std::string& library, const std::string& path,
                          std::vector<Job>& jobs) {
    jobs.push_back(propertiesJob(library, path));

    std::vector<remote::Member> members;
    try {
        members = store_.listMembers(library, path, 1);
    } catch (const QZBException& e) {
        throw EnumerationError(fmt::format("Cannot list collection {}: {}", path, e.message()),
                               ErrorContext{}.withLibrary(library).withPath(path));
    }
    std::sort(members.begin(), members.end(),
              [](const remote::Member& a, const remote::Member& b) { return a.path < b.path; });

    for (const remote::Member& member : members) {
        if (member.path == path) {
            continue;
        }
        if (member.isCollection()) {
            walk(library, member.path, jobs);
        } else {
            jobs.push_back(documentJob(library, member.path, member.documentKind()));
            jobs.push_back(propertiesJob(library, member.path));
        }
    }
}

// =============================================================================
// Restore Planning
// =============================================================================

std::vector<LibraryPlan> planRestore(const std::vector<std::string>& entries,
                                     const std::optional<std::string>& libraryOverride) {
    std::map<std::string, ArchivedLibrary> libraries;

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const std::string& name = entries[i];
        archive::layout::EntryRef ref;
        try {
            ref = archive::layout::parseEntry(name);
        } catch (const FormatError& e) {
            throw EnumerationError(e.message(), ErrorContext{}.withEntry(name));
        }

        auto [it, inserted] = libraries[ref.library].try_emplace(ref.path);
        ArchivedMember& member = it->second;
        if (inserted) {
            member.order = i;
        }

        auto& slot = ref.kind == archive::layout::EntryKind::kContent ? member.contentEntry
                                                                      : member.propertiesEntry;
        if (slot) {
            throw EnumerationError("Duplicate archive entry", ErrorContext{}.withEntry(name));
        }
        slot = name;
    }

    std::vector<std::pair<std::string, std::string>> selected;  // archive name, target name
    if (libraryOverride) {
        if (libraries.contains(*libraryOverride)) {
            selected.emplace_back(*libraryOverride, *libraryOverride);
        } else if (libraries.size() == 1) {
            selected.emplace_back(libraries.begin()->first, *libraryOverride);
        } else {
            throw EnumerationError(
                fmt::format("Archive holds {} libraries, none named '{}'", libraries.size(),
                            *libraryOverride),
                ErrorContext{}.withLibrary(*libraryOverride));
        }
    } else {
        for (const auto& [name, members] : libraries) {
            selected.emplace_back(name, name);
        }
    }

    std::vector<LibraryPlan> plans;
    plans.reserve(selected.size());
    for (const auto& [archiveName, targetName] : selected) {
        const ArchivedLibrary& members = libraries.at(archiveName);

        std::vector<std::pair<std::size_t, Job>> ordered;
        ordered.reserve(members.size());
        for (const auto& [path, member] : members) {
            Job job;
            job.library = targetName;
            job.path = path;
            if (member.contentEntry) {
                job.kind = JobKind::kDocument;
                job.entryName = *member.contentEntry;
                job.propertiesEntry = member.propertiesEntry;
            } else {
                job.kind = JobKind::kProperties;
                job.entryName = *member.propertiesEntry;
            }
            ordered.emplace_back(member.order, std::move(job));
        }
        std::sort(ordered.begin(), ordered.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        LibraryPlan plan;
        plan.archiveName = archiveName;
        plan.targetName = targetName;
        plan.jobs.reserve(ordered.size());
        for (auto& entry : ordered) {
            plan.jobs.push_back(std::move(entry.second));
        }
        plans.push_back(std::move(plan));
    }
    return plans;
}

// =============================================================================
// RestoreEnumerator
// =============================================================================

bool RestoreEnumerator::enumerate(const JobSink& sink) {
    std::vector<std::string> entries;
    try {
        entries = archiver_.listEntries();
    } catch (const QZBException& e) {
        throw EnumerationError(fmt::format("Cannot list the archive: {}", e.message()));
    }

    std::vector<LibraryPlan> plans = planRestore(entries, options_.libraryOverride);
    if (plans.empty()) {
        QZB_LOG_WARNING("The archive is empty");
    }

    for (LibraryPlan& plan : plans) {
        try {
            store_.ensureLibrary(plan.targetName);
        } catch (const QZBException& e) {
            throw EnumerationError(
                fmt::format("Cannot create library '{}': {}", plan.targetName, e.message()),
                ErrorContext{}.withLibrary(plan.targetName));
        }

        if (plan.archiveName != plan.targetName) {
            QZB_LOG_INFO("Restoring library {} as {} ({} jobs)", plan.archiveName,
                         plan.targetName, plan.jobs.size());
        } else {
            QZB_LOG_INFO("Restoring library {} ({} jobs)", plan.targetName, plan.jobs.size());
        }

        for (Job& job : plan.jobs) {
            if (options_.prefetch) {
                prefetch(job);
            }
            if (!sink(std::move(job))) {
                return false;
            }
        }
    }
    return true;
}

void RestoreEnumerator::prefetch(Job& job) {
    try {
        job.payload = archiver_.read(job.entryName);
        if (job.propertiesEntry) {
            job.propertiesPayload = archiver_.read(*job.propertiesEntry);
        }
    } catch (const QZBException& e) {
        QZB_LOG_WARNING("Cannot read {} ahead: {}", job.entryName, e.message());
        job.payload.reset();
        job.propertiesPayload.reset();
        job.prefetchError = e.message();
    }
}

}  // namespace qzb::pipeline
