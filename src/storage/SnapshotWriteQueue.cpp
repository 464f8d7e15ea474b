#include "fpservice/storage/SnapshotWriteQueue.hpp"
#include "fpservice/core/Logger.hpp"
#include "fpservice/core/exception.h"

#include <utility>

namespace fpservice {
namespace storage {

SnapshotWriteQueue::SnapshotWriteQueue(Writer writer, size_t capacity, std::string name)
    : writer_(std::move(writer))
    , capacity_(capacity == 0 ? 1 : capacity)
    , name_(std::move(name)) {
    worker_ = std::thread(&SnapshotWriteQueue::workerLoop, this);
    FPSERVICE_LOG_DEBUG("SnapshotWriteQueue") << name_ << ": writer started, capacity " << capacity_;
}

SnapshotWriteQueue::~SnapshotWriteQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_requested_ = true;
    }
    work_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    FPSERVICE_LOG_DEBUG("SnapshotWriteQueue") << name_ << ": writer stopped after "
                                              << completed_writes_.load() << " writes";
}

void SnapshotWriteQueue::push(Snapshot snapshot) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        throwIfFailedLocked();

        if (pending_.size() >= capacity_) {
            pending_.pop_front();
            dropped_snapshots_++;
        }
        pending_.push_back(std::move(snapshot));
    }
    work_cv_.notify_one();
}

void SnapshotWriteQueue::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() {
        return (pending_.empty() && !writing_) || failure_ != nullptr;
    });
    throwIfFailedLocked();
}

void SnapshotWriteQueue::throwIfFailed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfFailedLocked();
}

void SnapshotWriteQueue::throwIfFailedLocked() const {
    if (failure_) {
        FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                             name_ + ": durable write failed earlier: " + failure_message_);
    }
}

bool SnapshotWriteQueue::hasFailed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_ != nullptr;
}

bool SnapshotWriteQueue::isIdle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.empty() && !writing_;
}

size_t SnapshotWriteQueue::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void SnapshotWriteQueue::workerLoop() {
    while (true) {
        Snapshot snapshot;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this]() {
                return !pending_.empty() || shutdown_requested_;
            });

            if (pending_.empty() || failure_) {
                // shutdown with nothing left, or writing has been abandoned
                return;
            }
            snapshot = std::move(pending_.front());
            pending_.pop_front();
            writing_ = true;
        }

        try {
            writer_(snapshot);
            completed_writes_++;
        } catch (const std::exception& e) {
            size_t discarded = 0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                failure_ = std::current_exception();
                failure_message_ = e.what();
                discarded = pending_.size();
                pending_.clear();
            }
            FPSERVICE_LOG_CRITICAL("SnapshotWriteQueue") << name_ << ": durable write failed, "
                                                         << discarded << " pending discarded: "
                                                         << e.what();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            writing_ = false;
        }
        idle_cv_.notify_all();
    }
}

} // namespace storage
} // namespace fpservice
