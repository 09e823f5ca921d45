// =============================================================================
// qzbulk - Job Enumeration Tests
// =============================================================================

#include "qzb/pipeline/job_enumerator.h"

#include <gtest/gtest.h>

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "qzb/common/error.h"
#include "../support/memory_remote_store.h"
#include "../support/mock_archivers.h"

namespace qzb::pipeline::test {

using qzb::test::ArchiveLedger;
using qzb::test::MemoryArchiver;
using qzb::test::MemoryDatabase;

namespace {

struct JobSummary {
    JobKind kind;
    std::string path;

    bool operator==(const JobSummary&) const = default;
};

std::vector<JobSummary> summarize(const std::vector<Job>& jobs) {
    std::vector<JobSummary> result;
    for (const Job& job : jobs) {
        result.push_back({job.kind, job.path});
    }
    return result;
}

void PrintTo(const JobSummary& job, std::ostream* os) {
    *os << jobKindToString(job.kind) << " " << job.path;
}

std::shared_ptr<MemoryDatabase> sampleDatabase() {
    auto db = MemoryDatabase::create();
    db->addDocument("books", "/b.xml", "<b/>");
    db->addDocument("books", "/a/z.xml", "<z/>");
    db->addDocument("books", "/a/y.bin", "raw", DocumentKind::kNonXml);
    db->addCollection("books", "/a/empty");
    db->addLibrary("music");
    return db;
}

}  // namespace

// =============================================================================
// DumpEnumerator
// =============================================================================

TEST(DumpEnumeratorTest, PreOrderWithPropertiesJobs) {
    auto db = sampleDatabase();
    auto store = db->factory()();
    DumpEnumerator enumerator(*store);

    const std::vector<JobSummary> expected{
        {JobKind::kProperties, "/"},
        {JobKind::kProperties, "/a"},
        {JobKind::kProperties, "/a/empty"},
        {JobKind::kDocument, "/a/y.bin"},
        {JobKind::kProperties, "/a/y.bin"},
        {JobKind::kDocument, "/a/z.xml"},
        {JobKind::kProperties, "/a/z.xml"},
        {JobKind::kDocument, "/b.xml"},
        {JobKind::kProperties, "/b.xml"},
    };
    auto jobs = enumerator.listJobs("books");
    EXPECT_EQ(summarize(jobs), expected);

    for (const Job& job : jobs) {
        EXPECT_EQ(job.library, "books");
    }
    EXPECT_EQ(jobs[3].documentKind, DocumentKind::kNonXml);
    EXPECT_EQ(jobs[5].documentKind, DocumentKind::kXml);
}

TEST(DumpEnumeratorTest, EmptyLibraryHasRootPropertiesOnly) {
    auto db = sampleDatabase();
    auto store = db->factory()();
    DumpEnumerator enumerator(*store);

    EXPECT_EQ(summarize(enumerator.listJobs("music")),
              (std::vector<JobSummary>{{JobKind::kProperties, "/"}}));
}

TEST(DumpEnumeratorTest, ResolveLibraries) {
    auto db = sampleDatabase();
    auto store = db->factory()();
    DumpEnumerator enumerator(*store);

    EXPECT_EQ(enumerator.resolveLibraries(std::nullopt),
              (std::vector<std::string>{"books", "music"}));
    EXPECT_EQ(enumerator.resolveLibraries("music"), std::vector<std::string>{"music"});
    EXPECT_THROW(static_cast<void>(enumerator.resolveLibraries("missing")), EnumerationError);
}

TEST(DumpEnumeratorTest, ListingFailureIsEnumerationError) {
    auto db = sampleDatabase();
    db->failListing("/a");
    auto store = db->factory()();
    DumpEnumerator enumerator(*store);

    std::vector<Job> emitted;
    EXPECT_THROW(enumerator.enumerate("books", [&](Job job) {
        emitted.push_back(std::move(job));
        return true;
    }),
                 EnumerationError);
    EXPECT_TRUE(emitted.empty());
}

TEST(DumpEnumeratorTest, SinkCanStopEnumeration) {
    auto db = sampleDatabase();
    auto store = db->factory()();
    DumpEnumerator enumerator(*store);

    int accepted = 0;
    EXPECT_FALSE(enumerator.enumerate("books", [&](Job) { return ++accepted < 3; }));
    EXPECT_EQ(accepted, 3);
}

// =============================================================================
// Restore Planning
// =============================================================================

namespace {

const std::vector<std::string> kBooksEntries{
    "books/content/a/z.xml",
    "books/properties/a/z.xml/.properties",
    "books/properties/a/.properties",
    "books/content/b.xml",
    "books/properties/.properties",
};

}  // namespace

TEST(PlanRestoreTest, OneJobPerMemberInArchiveOrder) {
    auto plans = planRestore(kBooksEntries, std::nullopt);
    ASSERT_EQ(plans.size(), 1u);
    const LibraryPlan& plan = plans[0];
    EXPECT_EQ(plan.archiveName, "books");
    EXPECT_EQ(plan.targetName, "books");

    const std::vector<JobSummary> expected{
        {JobKind::kDocument, "/a/z.xml"},
        {JobKind::kProperties, "/a"},
        {JobKind::kDocument, "/b.xml"},
        {JobKind::kProperties, "/"},
    };
    EXPECT_EQ(summarize(plan.jobs), expected);

    EXPECT_EQ(plan.jobs[0].entryName, "books/content/a/z.xml");
    ASSERT_TRUE(plan.jobs[0].propertiesEntry.has_value());
    EXPECT_EQ(*plan.jobs[0].propertiesEntry, "books/properties/a/z.xml/.properties");
    EXPECT_FALSE(plan.jobs[2].propertiesEntry.has_value());
    EXPECT_EQ(plan.jobs[1].entryName, "books/properties/a/.properties");
}

TEST(PlanRestoreTest, PropertiesBeforeContentStillMakeOneDocumentJob) {
    auto plans = planRestore({"lib/properties/d.xml/.properties", "lib/content/d.xml"},
                             std::nullopt);
    ASSERT_EQ(plans.size(), 1u);
    ASSERT_EQ(plans[0].jobs.size(), 1u);
    EXPECT_EQ(plans[0].jobs[0].kind, JobKind::kDocument);
    EXPECT_EQ(plans[0].jobs[0].entryName, "lib/content/d.xml");
}

TEST(PlanRestoreTest, SeveralLibraries) {
    auto plans = planRestore({"b/content/x.xml", "a/content/y.xml"}, std::nullopt);
    ASSERT_EQ(plans.size(), 2u);
    EXPECT_EQ(plans[0].targetName, "a");
    EXPECT_EQ(plans[1].targetName, "b");
}

TEST(PlanRestoreTest, OverrideSelectsMatchingLibrary) {
    auto plans = planRestore({"a/content/x.xml", "b/content/y.xml"}, "b");
    ASSERT_EQ(plans.size(), 1u);
    EXPECT_EQ(plans[0].archiveName, "b");
    EXPECT_EQ(plans[0].targetName, "b");
    EXPECT_EQ(plans[0].jobs[0].library, "b");
}

TEST(PlanRestoreTest, OverrideRenamesSingleLibrary) {
    auto plans = planRestore(kBooksEntries, "archive2024");
    ASSERT_EQ(plans.size(), 1u);
    EXPECT_EQ(plans[0].archiveName, "books");
    EXPECT_EQ(plans[0].targetName, "archive2024");
    for (const Job& job : plans[0].jobs) {
        EXPECT_EQ(job.library, "archive2024");
    }
}

TEST(PlanRestoreTest, OverrideWithoutMatchInMultiLibraryArchive) {
    EXPECT_THROW(static_cast<void>(planRestore({"a/content/x.xml", "b/content/y.xml"}, "c")),
                 EnumerationError);
}

TEST(PlanRestoreTest, MalformedAndDuplicateEntries) {
    EXPECT_THROW(static_cast<void>(planRestore({"a/unknown/x.xml"}, std::nullopt)),
                 EnumerationError);
    EXPECT_THROW(static_cast<void>(planRestore({"a/content/x.xml", "a/content/x.xml"},
                                               std::nullopt)),
                 EnumerationError);
}

TEST(PlanRestoreTest, EmptyArchive) {
    EXPECT_TRUE(planRestore({}, std::nullopt).empty());
}

// =============================================================================
// RestoreEnumerator
// =============================================================================

namespace {

std::shared_ptr<ArchiveLedger> booksArchive() {
    auto ledger = std::make_shared<ArchiveLedger>();
    for (const auto& name : kBooksEntries) {
        ledger->put(name, "<" + name + ">");
    }
    return ledger;
}

}  // namespace

TEST(RestoreEnumeratorTest, EnsuresLibraryBeforeEmitting) {
    auto ledger = booksArchive();
    MemoryArchiver archiver(ledger, false);
    auto db = MemoryDatabase::create();
    auto store = db->factory()();

    RestoreEnumerator enumerator(archiver, *store, {});
    std::vector<Job> jobs;
    EXPECT_TRUE(enumerator.enumerate([&](Job job) {
        EXPECT_TRUE(db->hasLibrary("books"));
        jobs.push_back(std::move(job));
        return true;
    }));
    EXPECT_EQ(jobs.size(), 4u);
    EXPECT_EQ(db->librariesCreated(), 1);
    EXPECT_FALSE(jobs[0].payload.has_value());
}

TEST(RestoreEnumeratorTest, PrefetchReadsPayloads) {
    auto ledger = booksArchive();
    MemoryArchiver archiver(ledger, false);
    auto db = MemoryDatabase::create();
    auto store = db->factory()();

    RestoreEnumerator enumerator(archiver, *store, {std::nullopt, true});
    std::vector<Job> jobs;
    ASSERT_TRUE(enumerator.enumerate([&](Job job) {
        jobs.push_back(std::move(job));
        return true;
    }));

    ASSERT_EQ(jobs.size(), 4u);
    ASSERT_TRUE(jobs[0].payload.has_value());
    EXPECT_EQ(toString(*jobs[0].payload), "<books/content/a/z.xml>");
    ASSERT_TRUE(jobs[0].propertiesPayload.has_value());
    EXPECT_EQ(toString(*jobs[0].propertiesPayload), "<books/properties/a/z.xml/.properties>");
    EXPECT_FALSE(jobs[2].propertiesPayload.has_value());
}

TEST(RestoreEnumeratorTest, UnreadableEntryIsMarkedAndEnumerationContinues) {
    auto ledger = booksArchive();
    ledger->failingReads.insert("books/content/b.xml");
    MemoryArchiver archiver(ledger, false);
    auto db = MemoryDatabase::create();
    auto store = db->factory()();

    RestoreEnumerator enumerator(archiver, *store, {std::nullopt, true});
    std::vector<Job> jobs;
    ASSERT_TRUE(enumerator.enumerate([&](Job job) {
        jobs.push_back(std::move(job));
        return true;
    }));

    ASSERT_EQ(jobs.size(), 4u);
    EXPECT_EQ(jobs[2].path, "/b.xml");
    ASSERT_TRUE(jobs[2].prefetchError.has_value());
    EXPECT_FALSE(jobs[2].payload.has_value());
    EXPECT_FALSE(jobs[0].prefetchError.has_value());
    EXPECT_TRUE(jobs[3].payload.has_value());
}

TEST(RestoreEnumeratorTest, ExistingLibraryIsNotRecreated) {
    auto ledger = booksArchive();
    MemoryArchiver archiver(ledger, true);
    auto db = MemoryDatabase::create();
    db->addLibrary("books");
    auto store = db->factory()();

    RestoreEnumerator enumerator(archiver, *store, {});
    EXPECT_TRUE(enumerator.enumerate([](Job) { return true; }));
    EXPECT_EQ(db->librariesCreated(), 0);
}

TEST(RestoreEnumeratorTest, FailuresAreEnumerationErrors) {
    auto ledger = booksArchive();
    MemoryArchiver archiver(ledger, false);
    auto db = MemoryDatabase::create();
    db->failEnsureLibrary();
    auto store = db->factory()();

    int emitted = 0;
    RestoreEnumerator failingLibrary(archiver, *store, {});
    EXPECT_THROW(failingLibrary.enumerate([&](Job) { return ++emitted > 0; }), EnumerationError);
    EXPECT_EQ(emitted, 0);

    auto broken = std::make_shared<ArchiveLedger>();
    broken->put("not-a-dump.txt", "x");
    MemoryArchiver brokenArchiver(broken, false);
    auto healthy = MemoryDatabase::create();
    auto healthyStore = healthy->factory()();
    RestoreEnumerator malformed(brokenArchiver, *healthyStore, {});
    EXPECT_THROW(malformed.enumerate([](Job) { return true; }), EnumerationError);
}

TEST(RestoreEnumeratorTest, EmptyArchiveSucceeds) {
    auto ledger = std::make_shared<ArchiveLedger>();
    MemoryArchiver archiver(ledger, false);
    auto db = MemoryDatabase::create();
    auto store = db->factory()();

    RestoreEnumerator enumerator(archiver, *store, {});
    int emitted = 0;
    EXPECT_TRUE(enumerator.enumerate([&](Job) {
        ++emitted;
        return true;
    }));
    EXPECT_EQ(emitted, 0);
}

}  // namespace qzb::pipeline::test
