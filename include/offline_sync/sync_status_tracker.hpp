// === Sync Status Tracker =====================================================
//
// Folds the event stream into the snapshot a UI needs: connectivity, how many
// messages are still waiting, whether a sync is running and when the last one
// finished. It also offers a guarded manual sync trigger.

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>

#include "offline_sync/connectivity_monitor.hpp"
#include "offline_sync/event_bus.hpp"
#include "offline_sync/logging.hpp"
#include "offline_sync/queue_manager.hpp"
#include "offline_sync/sync_coordinator.hpp"

namespace offline_sync {

/** @brief Point-in-time view of queue and sync health. */
struct SyncStatus final {
    bool online{};
    std::size_t queued_count{};
    bool syncing{};
    std::optional<TimePoint> last_sync_time{};
    std::size_t last_synced_count{};
    std::size_t last_failed_count{};
};

class SyncStatusTracker final {
  public:
    SyncStatusTracker(EventBus& event_bus,
                      const QueueManager& queue_manager,
                      const ConnectivityMonitor& connectivity,
                      SyncCoordinator& coordinator);

    SyncStatusTracker(const SyncStatusTracker&) = delete;
    SyncStatusTracker& operator=(const SyncStatusTracker&) = delete;

    [[nodiscard]] SyncStatus snapshot() const;

    /** @brief Run a sync now unless offline or one is already running. */
    SyncResult trigger_sync();

    /** @brief Re-read the pending count from the queue. */
    void refresh_queued_count();

  private:
    void on_event(const QueueEvent& event);

    const QueueManager& queue_manager_;
    SyncCoordinator& coordinator_;
    mutable std::mutex mutex_;
    SyncStatus status_;
    std::shared_ptr<spdlog::logger> logger_;
    Subscription subscription_;
};

}  // namespace offline_sync
