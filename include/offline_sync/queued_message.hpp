// === Queued Message ==========================================================
//
// Record persisted for every undelivered message. Entries are created by the
// queue manager, mutated only by the sync coordinator and removed on delivery
// or by an explicit clear.

#pragma once

#include <optional>
#include <string>

#include "offline_sync/types.hpp"

namespace offline_sync {

/** @brief Retry budget assigned to new entries unless configured otherwise. */
inline constexpr int k_default_max_retries{3};

/**
 * @brief A single undelivered message awaiting sync.
 *
 * Invariants: `0 <= retry_count <= max_retries`; pending entries have
 * `retry_count < max_retries`; failed entries have `retry_count == max_retries`.
 */
struct QueuedMessage final {
    QueueId id{};                             /**< Store-assigned, strictly increasing. */
    std::string chat_id{};                    /**< Conversation the message belongs to. */
    Payload payload{};                        /**< Opaque message body handed to delivery. */
    EpochMillis queued_at{};                  /**< Creation time and FIFO ordering key. */
    QueueStatus status{QueueStatus::Pending}; /**< Pending or terminally failed. */
    int retry_count{};                        /**< Failed delivery attempts so far. */
    int max_retries{k_default_max_retries};   /**< Retry budget fixed at creation. */
    std::optional<std::string> last_error{};  /**< Reason of the most recent failure. */
    EpochMillis next_attempt_at{};            /**< Earliest time a sync may retry the entry. */
};

/**
 * @brief Partial update applied to a stored entry. Unset fields are untouched.
 */
struct QueuedMessageUpdate final {
    std::optional<QueueStatus> status{};
    std::optional<int> retry_count{};
    std::optional<std::string> last_error{};
    bool clear_last_error{false};             /**< Null out last_error; wins over last_error. */
    std::optional<EpochMillis> next_attempt_at{};

    [[nodiscard]] bool empty() const noexcept {
        return !status && !retry_count && !last_error && !clear_last_error && !next_attempt_at;
    }
};

}  // namespace offline_sync
