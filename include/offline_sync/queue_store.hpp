// === Queue Store =============================================================
//
// Abstract durable document store holding queue entries. Implementations must
// make every operation atomic and must keep an entry across process restarts
// once `add` has returned. Failures surface as `StorageError`.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "offline_sync/queued_message.hpp"

namespace offline_sync {

/** @brief CRUD plus index-backed scans over persisted queue entries. */
class QueueStore {
  public:
    virtual ~QueueStore() = default;

    /** @brief Open the store, creating or migrating the schema. Idempotent. */
    virtual void open() = 0;
    /** @brief Persist @p entry (its id is ignored) and return the assigned id. */
    [[nodiscard]] virtual QueueId add(const QueuedMessage& entry) = 0;
    /** @brief Fetch a single entry. */
    [[nodiscard]] virtual std::optional<QueuedMessage> get(QueueId id) = 0;
    /** @brief All entries, optionally for one chat, ordered by timestamp then id. */
    [[nodiscard]] virtual std::vector<QueuedMessage> get_all(const std::optional<std::string>& chat_id) = 0;
    /** @brief Apply a partial update; false when no entry has @p id. */
    virtual bool update(QueueId id, const QueuedMessageUpdate& update) = 0;
    /** @brief Delete one entry; false when it did not exist. */
    virtual bool remove(QueueId id) = 0;
    /** @brief Delete all entries, or one chat's entries; returns how many. */
    virtual std::size_t clear(const std::optional<std::string>& chat_id) = 0;
};

}  // namespace offline_sync
