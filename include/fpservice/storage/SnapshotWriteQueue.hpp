#pragma once

#include "fpservice/storage/Template.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fpservice {
namespace storage {

/**
 * @brief Single-consumer queue of registry snapshots awaiting durable write
 *
 * Producers push point-in-time copies taken under their own lock; one
 * worker thread hands them to the writer in order, without holding any
 * producer lock. The channel is bounded: when full, the oldest pending
 * snapshot is dropped because every newer snapshot supersedes it.
 *
 * The first writer failure is recorded and ends all further writing.
 * push() and flush() then rethrow it as core::FileException.
 */
class SnapshotWriteQueue {
public:
    using Snapshot = std::vector<Template>;
    using Writer = std::function<void(const Snapshot&)>;

    SnapshotWriteQueue(Writer writer, size_t capacity, std::string name);

    /**
     * Drains pending snapshots, then joins the worker
     */
    ~SnapshotWriteQueue();

    SnapshotWriteQueue(const SnapshotWriteQueue&) = delete;
    SnapshotWriteQueue& operator=(const SnapshotWriteQueue&) = delete;

    /**
     * @throws core::FileException if an earlier write failed
     */
    void push(Snapshot snapshot);

    /**
     * Block until every pushed snapshot has been written or dropped
     * @throws core::FileException if a write failed
     */
    void flush();

    /**
     * @throws core::FileException if a write failed
     */
    void throwIfFailed() const;

    bool hasFailed() const;
    bool isIdle() const;
    size_t pendingCount() const;
    uint64_t completedWrites() const { return completed_writes_.load(); }
    uint64_t droppedSnapshots() const { return dropped_snapshots_.load(); }

private:
    void workerLoop();
    void throwIfFailedLocked() const;

    Writer writer_;
    const size_t capacity_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Snapshot> pending_;
    bool writing_ = false;
    bool shutdown_requested_ = false;
    std::exception_ptr failure_;
    std::string failure_message_;

    std::atomic<uint64_t> completed_writes_{0};
    std::atomic<uint64_t> dropped_snapshots_{0};

    std::thread worker_;
};

} // namespace storage
} // namespace fpservice
