#include "SnapshotStore.h"
#include <utility>

SnapshotStore::SnapshotStore()
    : current_(std::make_shared<const Snapshot>()) {}

void SnapshotStore::Publish(Snapshot snapshot) {
    // Built outside the lock so readers only ever wait for a pointer swap
    auto next = std::make_shared<const Snapshot>(std::move(snapshot));
    std::shared_ptr<const Snapshot> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (*current_ == *next) return;
        previous = std::move(current_);
        current_ = std::move(next);
        version_.fetch_add(1, std::memory_order_release);
    }
    // previous is released here, outside the lock
}

std::shared_ptr<const Snapshot> SnapshotStore::Current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}
