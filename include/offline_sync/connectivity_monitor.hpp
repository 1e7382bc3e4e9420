// === Connectivity Monitor ====================================================
//
// Maintains the single online/offline flag the engine consults. Reports from a
// `ConnectivityProbe` are reduced to edges: exactly one `online` or `offline`
// event per transition, nothing for re-confirmations. A transition to online
// fires the sync trigger; going offline only updates state and notifies, it
// never cancels a sync that is already running.

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

#include "offline_sync/connectivity_probe.hpp"
#include "offline_sync/event_bus.hpp"
#include "offline_sync/logging.hpp"

namespace offline_sync {

class ConnectivityMonitor final {
  public:
    using OnlineTrigger = std::function<void()>;

    /** @brief Seed the flag from @p probe; call `start()` to follow it. */
    ConnectivityMonitor(ConnectivityProbe& probe, EventBus& event_bus, OnlineTrigger on_online);

    ConnectivityMonitor(const ConnectivityMonitor&) = delete;
    ConnectivityMonitor& operator=(const ConnectivityMonitor&) = delete;

    /** @brief Subscribe to the probe. Idempotent. */
    void start();
    /** @brief Detach from the probe; the flag keeps its last value. */
    void stop();

    [[nodiscard]] bool is_online() const noexcept;

    /** @brief Feed a reachability report; publishes and triggers on edges only. */
    void observe(bool online);

  private:
    ConnectivityProbe& probe_;
    EventBus& event_bus_;
    OnlineTrigger on_online_;
    std::atomic<bool> flag_online_;
    std::mutex transition_mutex_;
    Subscription probe_subscription_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_sync
