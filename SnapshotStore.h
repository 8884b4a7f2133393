#ifndef SNAPSHOT_STORE_H
#define SNAPSHOT_STORE_H

#include "Snapshot.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

// Latest-value handoff between the sampler thread and the render loop.
// Snapshots are immutable once published and replaced as a whole; the lock
// only covers the handle copy, never a read of the lines themselves.
class SnapshotStore {
public:
    SnapshotStore();

    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    // Replaces the current snapshot. Publishing a snapshot equal to the
    // current one is a no-op.
    void Publish(Snapshot snapshot);

    // Never null. Empty snapshot until the first Publish.
    std::shared_ptr<const Snapshot> Current() const;

    // Number of content-changing publishes so far
    uint64_t Version() const { return version_.load(std::memory_order_acquire); }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Snapshot> current_;
    std::atomic<uint64_t> version_{0};
};

#endif // SNAPSHOT_STORE_H
