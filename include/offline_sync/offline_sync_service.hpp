// === Offline Sync Service ====================================================
//
// Wires the store, event bus, connectivity monitor, queue manager, sync
// coordinator, background worker and status tracker into one explicitly
// constructed object. Everything it depends on from the outside world (the
// store, the reachability probe and the delivery function) is injected, so
// tests can drive it deterministically.

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "offline_sync/backoff_strategy.hpp"
#include "offline_sync/connectivity_monitor.hpp"
#include "offline_sync/connectivity_probe.hpp"
#include "offline_sync/event_bus.hpp"
#include "offline_sync/logging.hpp"
#include "offline_sync/queue_manager.hpp"
#include "offline_sync/queue_store.hpp"
#include "offline_sync/sync_coordinator.hpp"
#include "offline_sync/sync_status_tracker.hpp"
#include "offline_sync/sync_worker.hpp"

namespace offline_sync {

/**
 * @brief Tunables for queueing and delivery.
 *
 * Populated at startup by the configuration loader and treated as immutable
 * while the service runs.
 */
struct SyncConfig final {
    int max_retries{k_default_max_retries};
    std::chrono::milliseconds delivery_timeout{30'000};
    BackoffConfig backoff{};
    bool auto_sync{true}; /**< Sync in the background on start and on reconnect. */
};

/** @brief Durable outbound queue with connectivity-driven delivery. */
class OfflineSyncService final {
  public:
    OfflineSyncService(std::unique_ptr<QueueStore> store,
                       ConnectivityProbe& probe,
                       DeliveryFunction deliver,
                       SyncConfig config,
                       ClockFunction clock = now_epoch_ms);
    ~OfflineSyncService();

    OfflineSyncService(const OfflineSyncService&) = delete;
    OfflineSyncService& operator=(const OfflineSyncService&) = delete;

    /**
     * @brief Open the store and begin following connectivity.
     * @throws StorageError if the store cannot be opened or migrated.
     */
    void start();
    /** @brief Stop following connectivity and join the background worker. */
    void stop();

    QueueId enqueue(const std::string& chat_id, Payload payload);
    [[nodiscard]] std::vector<QueuedMessage> queued_messages(const std::optional<std::string>& chat_id = std::nullopt) const;
    [[nodiscard]] std::vector<QueuedMessage> failed_messages(const std::optional<std::string>& chat_id = std::nullopt) const;
    [[nodiscard]] std::size_t queue_count(const std::optional<std::string>& chat_id = std::nullopt) const;
    bool remove(QueueId queue_id);
    std::size_t clear_chat_queue(const std::string& chat_id);
    std::size_t clear_all_queues();
    bool retry_failed(QueueId queue_id);

    /** @brief Run a sync pass on the calling thread. */
    [[nodiscard]] SyncResult sync_queue();
    /** @brief Ask the background worker for a sync pass. */
    void request_sync();

    [[nodiscard]] bool is_online() const noexcept;
    [[nodiscard]] Subscription subscribe(QueueEventListener listener);
    [[nodiscard]] SyncStatus status() const;

  private:
    /** @brief Hand a reconnect to the worker when background sync is enabled. */
    void on_online();

    SyncConfig config_;
    std::unique_ptr<QueueStore> store_;
    EventBus event_bus_;
    ConnectivityMonitor monitor_;
    QueueManager queue_manager_;
    SyncCoordinator coordinator_;
    SyncWorker worker_;
    SyncStatusTracker status_tracker_;
    std::atomic<bool> flag_started_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_sync
