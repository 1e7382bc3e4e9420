// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the CLI and the sync
// service: log destination, database location, retry budget, delivery
// timeout, backoff policy and heartbeat cadence. `ConfigurationLoader`
// translates environment variables into these structures so downstream
// modules never touch `std::getenv` directly.

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "offline_sync/offline_sync_service.hpp"

namespace offline_sync {

/**
 * @brief Immutable bundle of runtime knobs for the offline queue.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};                  /**< Destination directory for structured logs. */
    std::string log_level{};                      /**< spdlog level name. */
    std::filesystem::path database_path{};        /**< SQLite file holding the queue. */
    SyncConfig sync{};                            /**< Retry, timeout and backoff settings. */
    std::chrono::milliseconds heartbeat_interval{}; /**< Polling cadence of the heartbeat probe. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Read the environment, initialize logging and return the result. */
    static Configuration load();

  private:
    static BackoffConfig load_backoff();
};

}  // namespace offline_sync
