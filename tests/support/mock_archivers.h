// =============================================================================
// qzbulk - Instrumented Archivers (test support)
// =============================================================================
// MemoryArchiver keeps entries in an ArchiveLedger shared with the test, so
// the test can inspect them after the pipeline has destroyed the archiver.
//
// The ledger counts open() and close() calls, notices writes after close,
// and, for archivers that declare no concurrent-write support, detects
// overlapping write() calls with a try_lock instrument.
// =============================================================================

#ifndef QZB_TESTS_SUPPORT_MOCK_ARCHIVERS_H
#define QZB_TESTS_SUPPORT_MOCK_ARCHIVERS_H

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "qzb/archive/archiver.h"
#include "qzb/common/error.h"
#include "qzb/common/types.h"
#include "qzb/pipeline/pipeline.h"

namespace qzb::test {

/// @brief State shared between a MemoryArchiver and the test.
struct ArchiveLedger {
    std::mutex mutex;
    std::map<std::string, Payload> entries;
    std::vector<std::string> order;

    std::atomic<int> openCalls{0};
    std::atomic<int> closeCalls{0};
    std::atomic<int> overlappingWrites{0};
    std::atomic<bool> writeAfterClose{false};
    std::atomic<std::size_t> writes{0};

    /// @brief Thread ids that called write().
    std::set<std::thread::id> writerThreads;

    /// @brief Entry names whose write() throws IOError.
    std::set<std::string> failingWrites;

    /// @brief Entry names whose write() throws std::runtime_error.
    std::set<std::string> crashingWrites;

    /// @brief Entry names whose read() throws IOError.
    std::set<std::string> failingReads;

    /// @brief listEntries() throws std::runtime_error.
    bool crashListing = false;
    bool failOpen = false;
    bool failClose = false;

    /// @brief Time spent inside each write().
    std::chrono::microseconds writeDelay{0};

    /// @brief Called on the first close().
    std::function<void()> onClose;

    void put(const std::string& name, std::string text) {
        std::lock_guard<std::mutex> lock(mutex);
        entries[name] = toPayload(text);
        order.push_back(name);
    }
};

class MemoryArchiver final : public archive::Archiver {
public:
    MemoryArchiver(std::shared_ptr<ArchiveLedger> ledger, bool concurrent)
        : ledger_(std::move(ledger)), concurrent_(concurrent) {}

    void open(archive::ArchiveMode mode) override {
        ++ledger_->openCalls;
        if (ledger_->failOpen) {
            throw IOError("injected open failure");
        }
        mode_ = mode;
    }

    void write(const std::string& name, Payload payload) override {
        std::unique_lock<std::mutex> guard(writeGuard_, std::defer_lock);
        if (!concurrent_ && !guard.try_lock()) {
            ++ledger_->overlappingWrites;
        }
        if (ledger_->closeCalls.load() > 0) {
            ledger_->writeAfterClose = true;
        }
        if (ledger_->writeDelay.count() > 0) {
            std::this_thread::sleep_for(ledger_->writeDelay);
        }

        std::lock_guard<std::mutex> lock(ledger_->mutex);
        ledger_->writerThreads.insert(std::this_thread::get_id());
        if (ledger_->failingWrites.contains(name)) {
            throw IOError("injected write failure", ErrorContext{}.withEntry(name));
        }
        if (ledger_->crashingWrites.contains(name)) {
            throw std::runtime_error("injected write crash on " + name);
        }
        ledger_->entries[name] = std::move(payload);
        ledger_->order.push_back(name);
        ++ledger_->writes;
    }

    Payload read(const std::string& name) override {
        std::lock_guard<std::mutex> lock(ledger_->mutex);
        if (ledger_->failingReads.contains(name)) {
            throw IOError("injected truncated entry", ErrorContext{}.withEntry(name));
        }
        auto it = ledger_->entries.find(name);
        if (it == ledger_->entries.end()) {
            throw IOError("No such archive entry", ErrorContext{}.withEntry(name));
        }
        return it->second;
    }

    std::vector<std::string> listEntries() override {
        std::lock_guard<std::mutex> lock(ledger_->mutex);
        if (ledger_->crashListing) {
            throw std::runtime_error("injected listing crash");
        }
        return ledger_->order;
    }

    void close() override {
        if (ledger_->closeCalls++ == 0 && ledger_->onClose) {
            ledger_->onClose();
        }
        if (ledger_->failClose) {
            throw IOError("injected close failure");
        }
    }

    bool supportsConcurrentWrites() const noexcept override { return concurrent_; }
    bool supportsRandomAccess() const noexcept override { return concurrent_; }

private:
    std::shared_ptr<ArchiveLedger> ledger_;
    bool concurrent_;
    std::mutex writeGuard_;
    std::optional<archive::ArchiveMode> mode_;
};

/// @brief Factory handing the pipeline a MemoryArchiver over a ledger.
/// @param concurrent false behaves like a tar archive, true like a directory
inline pipeline::ArchiverFactory memoryArchiverFactory(std::shared_ptr<ArchiveLedger> ledger,
                                                       bool concurrent) {
    return [ledger = std::move(ledger), concurrent]() -> std::unique_ptr<archive::Archiver> {
        return std::make_unique<MemoryArchiver>(ledger, concurrent);
    };
}

}  // namespace qzb::test

#endif  // QZB_TESTS_SUPPORT_MOCK_ARCHIVERS_H
