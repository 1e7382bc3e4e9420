// === Sync Worker =============================================================
//
// Background thread that runs sync passes on request so connectivity
// callbacks and UI threads never block on delivery. Triggers that arrive
// while a pass is running collapse into a single follow-up pass.

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "offline_sync/logging.hpp"
#include "offline_sync/sync_coordinator.hpp"

namespace offline_sync {

class SyncWorker final {
  public:
    explicit SyncWorker(SyncCoordinator& coordinator);
    ~SyncWorker();

    SyncWorker(const SyncWorker&) = delete;
    SyncWorker& operator=(const SyncWorker&) = delete;

    /** @brief Launch the worker thread. Pending triggers run immediately. */
    void start();
    /** @brief Finish the current pass and join the thread. */
    void stop();
    /** @brief Request a sync pass without waiting for it. */
    void trigger();

    /** @brief Passes executed since start, whatever their outcome. */
    [[nodiscard]] std::size_t completed_passes() const noexcept;
    [[nodiscard]] bool running() const noexcept;

  private:
    void worker_loop();

    SyncCoordinator& coordinator_;
    std::mutex mutex_;
    std::condition_variable cv_trigger_;
    bool flag_pending_{false};
    std::atomic<bool> flag_running_{false};
    std::atomic<std::size_t> completed_passes_{0};
    std::thread worker_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_sync
