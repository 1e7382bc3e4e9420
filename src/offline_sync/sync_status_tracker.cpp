#include "offline_sync/sync_status_tracker.hpp"

#include "offline_sync/errors.hpp"

namespace offline_sync {

SyncStatusTracker::SyncStatusTracker(EventBus& event_bus,
                                     const QueueManager& queue_manager,
                                     const ConnectivityMonitor& connectivity,
                                     SyncCoordinator& coordinator)
    : queue_manager_(queue_manager),
      coordinator_(coordinator),
      logger_(get_logger()) {
    status_.online = connectivity.is_online();
    subscription_ = event_bus.subscribe([this](const QueueEvent& event) { on_event(event); });
}

SyncStatus SyncStatusTracker::snapshot() const {
    std::scoped_lock lock(mutex_);
    return status_;
}

SyncResult SyncStatusTracker::trigger_sync() {
    const SyncStatus current = snapshot();
    if (!current.online) {
        return SyncResult{false, SyncSkipReason::Offline};
    }
    if (current.syncing) {
        return SyncResult{false, SyncSkipReason::SyncInProgress};
    }
    return coordinator_.sync_queue();
}

void SyncStatusTracker::refresh_queued_count() {
    std::size_t queued_count = 0;
    try {
        queued_count = queue_manager_.count();
    } catch (const StorageError& exc) {
        logger_->error("Unable to refresh queued count: {}", exc.what());
        return;
    }
    std::scoped_lock lock(mutex_);
    status_.queued_count = queued_count;
}

void SyncStatusTracker::on_event(const QueueEvent& event) {
    switch (event.type) {
        case QueueEventType::Online:
        case QueueEventType::Offline: {
            std::scoped_lock lock(mutex_);
            status_.online = event.type == QueueEventType::Online;
            return;
        }
        case QueueEventType::SyncStarted: {
            std::scoped_lock lock(mutex_);
            status_.syncing = true;
            return;
        }
        case QueueEventType::SyncCompleted:
        case QueueEventType::SyncError: {
            {
                std::scoped_lock lock(mutex_);
                status_.syncing = false;
                status_.last_sync_time = SystemClock::now();
                status_.last_synced_count = event.success_count;
                status_.last_failed_count = event.failed_count;
            }
            refresh_queued_count();
            return;
        }
        case QueueEventType::MessageQueued:
        case QueueEventType::MessageRemoved:
        case QueueEventType::MessageSynced:
        case QueueEventType::MessageFailed:
        case QueueEventType::AllQueuesCleared:
            refresh_queued_count();
            return;
    }
}

}  // namespace offline_sync
