// === Sync Coordinator ========================================================
//
// Drains pending queue entries through the injected delivery function while
// online. One run at a time: overlapping calls are rejected, not queued. Each
// entry's outcome is isolated; a failing entry consumes one unit of its retry
// budget and never blocks the entries behind it.
//
// Run outline
// 1. Offline -> skip (reason offline). Busy -> skip (reason sync_in_progress).
// 2. Publish syncStarted, load pending entries oldest first (global FIFO).
// 3. Deliver each due entry sequentially, bounded by the attempt timeout.
//    Success removes the entry; failure bumps retry_count and either keeps it
//    pending (with its next attempt time) or marks it failed.
// 4. Publish syncCompleted with the counts. Storage failures end the run with
//    syncError instead; sync_queue itself never throws.
//
// A timed-out attempt keeps running on its own thread until the transport
// returns. At most k_max_outstanding_deliveries such attempts may be alive;
// further bounded attempts fail with k_delivery_backlog_error until one ends.

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "offline_sync/backoff_strategy.hpp"
#include "offline_sync/connectivity_monitor.hpp"
#include "offline_sync/event_bus.hpp"
#include "offline_sync/logging.hpp"
#include "offline_sync/queue_manager.hpp"

namespace offline_sync {

/** @brief Outcome reported by the external chat transport. */
struct DeliveryResult final {
    bool success{};
    std::optional<std::string> delivered_id{}; /**< Backend id of the sent message. */
    std::string error{};                       /**< Failure reason when !success. */
};

/**
 * @brief External send call. May throw; exceptions count as failed attempts.
 *
 * The queue does not deduplicate: a send that reached the backend but lost its
 * acknowledgement is retried and may appear twice in the chat.
 */
using DeliveryFunction = std::function<DeliveryResult(const std::string& chat_id, const Payload& payload)>;

/** @brief Why a sync run did not complete normally. */
enum class SyncSkipReason {
    None,            /**< The run completed. */
    Offline,         /**< Not online; nothing touched. */
    SyncInProgress,  /**< Another run holds the coordinator. */
    StorageError     /**< The store (or the queue around it) failed mid-run. */
};

[[nodiscard]] std::string_view to_string(SyncSkipReason reason) noexcept;

struct SyncResult final {
    bool success{};
    SyncSkipReason reason{SyncSkipReason::None};
    std::size_t synced{};
    std::size_t failed{};
    std::string error{};
};

/** @brief Failure text recorded when an attempt exceeds the timeout. */
inline constexpr std::string_view k_delivery_timeout_error{"delivery timed out"};
/** @brief Failure text when too many timed-out attempts are still running. */
inline constexpr std::string_view k_delivery_backlog_error{"delivery backlog"};
/** @brief Failure text when the transport throws something not derived from std::exception. */
inline constexpr std::string_view k_unknown_delivery_error{"unknown delivery error"};
/** @brief Cap on attempt threads left running after their timeout. */
inline constexpr std::size_t k_max_outstanding_deliveries{4};

class SyncCoordinator final {
  public:
    /**
     * @param delivery_timeout Per-attempt bound; zero or negative calls the
     *        delivery function inline without a bound.
     * @param backoff Delay policy between attempts; null means no backoff.
     */
    SyncCoordinator(QueueManager& queue_manager,
                    const ConnectivityMonitor& connectivity,
                    EventBus& event_bus,
                    DeliveryFunction deliver,
                    std::chrono::milliseconds delivery_timeout,
                    std::shared_ptr<const BackoffStrategy> backoff = nullptr,
                    ClockFunction clock = now_epoch_ms);

    SyncCoordinator(const SyncCoordinator&) = delete;
    SyncCoordinator& operator=(const SyncCoordinator&) = delete;

    /** @brief Execute one sync run on the calling thread. */
    [[nodiscard]] SyncResult sync_queue();
    /** @brief Whether a run currently holds the coordinator. */
    [[nodiscard]] bool in_progress() const noexcept;
    /** @brief Bounded attempts whose transport call has not returned yet. */
    [[nodiscard]] std::size_t outstanding_deliveries() const noexcept;

  private:
    /** @brief Call the delivery function, applying the timeout. */
    DeliveryResult attempt_delivery(const QueuedMessage& entry);
    DeliveryResult attempt_bounded_delivery(const QueuedMessage& entry);
    /** @brief Persist a failed attempt; publishes messageFailed when terminal. */
    void record_failure(const QueuedMessage& entry, const std::string& error);
    /** @brief Remove a delivered entry and publish messageSynced. */
    void record_success(const QueuedMessage& entry, const DeliveryResult& result);

    QueueManager& queue_manager_;
    const ConnectivityMonitor& connectivity_;
    EventBus& event_bus_;
    DeliveryFunction deliver_;
    std::chrono::milliseconds delivery_timeout_;
    std::shared_ptr<const BackoffStrategy> backoff_;
    ClockFunction clock_;
    std::mutex sync_mutex_;
    std::atomic<bool> flag_in_progress_{false};
    std::shared_ptr<std::atomic<std::size_t>> outstanding_deliveries_{std::make_shared<std::atomic<std::size_t>>(0)};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_sync
