// === Errors ==================================================================
//
// Exception types raised by the queue engine. Store failures are fatal for the
// operation that hit them; missing entries are reported separately so the sync
// coordinator can tell a concurrent clear apart from a broken database.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace offline_sync {

/** @brief Store open, migration or transaction failure. Never retried. */
class StorageError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief The referenced queue entry does not exist (or no longer exists). */
class NotFoundError : public std::runtime_error {
  public:
    explicit NotFoundError(std::int64_t queue_id)
        : std::runtime_error("Queue entry " + std::to_string(queue_id) + " not found"),
          queue_id_(queue_id) {}

    [[nodiscard]] std::int64_t queue_id() const noexcept { return queue_id_; }

  private:
    std::int64_t queue_id_;
};

}  // namespace offline_sync
