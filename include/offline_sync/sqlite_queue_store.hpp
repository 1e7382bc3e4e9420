// === SQLite Queue Store ======================================================
//
// Embedded SQLite implementation of `QueueStore`. The schema is versioned with
// `PRAGMA user_version` and migrated forward step by step inside a single
// transaction on `open()`. A mutex serializes access to the connection so the
// store can be shared by producers and the sync coordinator.

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "offline_sync/logging.hpp"
#include "offline_sync/queue_store.hpp"

struct sqlite3;

namespace offline_sync {

/** @brief Schema version written by this build. */
inline constexpr int k_queue_schema_version{2};

/** @brief Path understood by SQLite as a private in-memory database. */
inline constexpr char k_in_memory_database[] = ":memory:";

class SqliteQueueStore final : public QueueStore {
  public:
    explicit SqliteQueueStore(std::filesystem::path database_path);
    ~SqliteQueueStore() override;

    SqliteQueueStore(const SqliteQueueStore&) = delete;
    SqliteQueueStore& operator=(const SqliteQueueStore&) = delete;

    void open() override;
    [[nodiscard]] QueueId add(const QueuedMessage& entry) override;
    [[nodiscard]] std::optional<QueuedMessage> get(QueueId id) override;
    [[nodiscard]] std::vector<QueuedMessage> get_all(const std::optional<std::string>& chat_id) override;
    bool update(QueueId id, const QueuedMessageUpdate& update) override;
    bool remove(QueueId id) override;
    std::size_t clear(const std::optional<std::string>& chat_id) override;

    /** @brief Location of the database file. */
    [[nodiscard]] const std::filesystem::path& database_path() const noexcept;
    /** @brief Schema version found on disk after `open()`. */
    [[nodiscard]] int schema_version();

  private:
    /** @brief Throw unless `open()` succeeded. Caller holds the mutex. */
    sqlite3* require_open() const;
    /** @brief Run migrations from the on-disk version up to the current one. */
    void migrate();
    /** @brief Execute a statement batch, mapping failures to StorageError. */
    void exec(const std::string& sql);

    std::filesystem::path path_database_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_sync
