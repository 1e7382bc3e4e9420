// === Queue Manager ===========================================================
//
// Read/write API over the queue store used by producers, UI layers and the
// sync coordinator. Enqueue never attempts delivery; it only records the entry
// and announces it. The "active queue" views return pending entries only;
// failed entries are reachable through `list_failed`.

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "offline_sync/event_bus.hpp"
#include "offline_sync/logging.hpp"
#include "offline_sync/queue_store.hpp"

namespace offline_sync {

class QueueManager final {
  public:
    QueueManager(QueueStore& store, EventBus& event_bus, int max_retries = k_default_max_retries, ClockFunction clock = now_epoch_ms);

    /**
     * @brief Durably queue @p payload for @p chat_id.
     *
     * The entry starts pending with no retries and the configured budget.
     * Timestamps never go backwards within a process, so a wall clock step
     * cannot reorder a chat's messages.
     *
     * @throws StorageError when the store rejects the write.
     */
    QueueId enqueue(const std::string& chat_id, Payload payload);

    /** @brief Pending entries, oldest first, optionally for one chat. */
    [[nodiscard]] std::vector<QueuedMessage> list(const std::optional<std::string>& chat_id = std::nullopt) const;
    /** @brief Entries whose retry budget is exhausted. */
    [[nodiscard]] std::vector<QueuedMessage> list_failed(const std::optional<std::string>& chat_id = std::nullopt) const;
    /** @brief Number of pending entries. */
    [[nodiscard]] std::size_t count(const std::optional<std::string>& chat_id = std::nullopt) const;
    /** @brief Any entry by id, pending or failed. */
    [[nodiscard]] std::optional<QueuedMessage> find(QueueId queue_id) const;

    /** @brief Delete one entry; announces `messageRemoved` when it existed. */
    bool remove(QueueId queue_id);
    /** @throws NotFoundError if the entry no longer exists. */
    void update(QueueId queue_id, const QueuedMessageUpdate& fields);

    /** @brief Delete every entry of @p chat_id, pending and failed. */
    std::size_t clear(const std::string& chat_id);
    /** @brief Delete everything; announces `allQueuesCleared`. */
    std::size_t clear_all();

    /**
     * @brief Put a failed entry back in line with a fresh retry budget.
     * @return false when the entry was already pending.
     * @throws NotFoundError for unknown ids.
     */
    bool retry_failed(QueueId queue_id);

    [[nodiscard]] int max_retries() const noexcept;

  private:
    [[nodiscard]] std::vector<QueuedMessage> list_with_status(const std::optional<std::string>& chat_id, QueueStatus status) const;

    QueueStore& store_;
    EventBus& event_bus_;
    int max_retries_;
    ClockFunction clock_;
    std::mutex enqueue_mutex_;
    EpochMillis last_queued_at_{};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_sync
