// === Connectivity Probes =====================================================
//
// Sources of the raw reachability signal. A probe reports the current level
// and notifies listeners when it observes a change; edge filtering and event
// publication happen in `ConnectivityMonitor`.
//
// - `ManualConnectivityProbe` is driven by the host application (platform
//   network callbacks) or by tests.
// - `HeartbeatConnectivityProbe` polls a reachability check on its own thread.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "offline_sync/logging.hpp"
#include "offline_sync/subscription.hpp"

namespace offline_sync {

using ConnectivityListener = std::function<void(bool online)>;

/** @brief Boolean reachability signal with change notifications. */
class ConnectivityProbe {
  public:
    virtual ~ConnectivityProbe() = default;

    /** @brief Latest known reachability. */
    [[nodiscard]] virtual bool current() const = 0;
    /** @brief Register for reachability reports; detached when the token dies. */
    [[nodiscard]] virtual Subscription on_change(ConnectivityListener listener) = 0;
};

/** @brief Probe whose state is pushed in through `set_online`. */
class ManualConnectivityProbe final : public ConnectivityProbe {
  public:
    explicit ManualConnectivityProbe(bool initially_online);

    [[nodiscard]] bool current() const override;
    [[nodiscard]] Subscription on_change(ConnectivityListener listener) override;

    /**
     * @brief Record the platform's reachability and forward it to listeners.
     *
     * Every call is forwarded, including re-confirmations of the current
     * state; consumers are expected to filter for edges.
     */
    void set_online(bool online);

  private:
    std::atomic<bool> flag_online_;
    ListenerSet<bool> listeners_;
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Probe that periodically runs a reachability check on a worker thread. */
class HeartbeatConnectivityProbe final : public ConnectivityProbe {
  public:
    using ReachabilityCheck = std::function<bool()>;

    HeartbeatConnectivityProbe(ReachabilityCheck check, std::chrono::milliseconds interval);
    ~HeartbeatConnectivityProbe() override;

    HeartbeatConnectivityProbe(const HeartbeatConnectivityProbe&) = delete;
    HeartbeatConnectivityProbe& operator=(const HeartbeatConnectivityProbe&) = delete;

    [[nodiscard]] bool current() const override;
    [[nodiscard]] Subscription on_change(ConnectivityListener listener) override;

    /** @brief Run the first check synchronously, then start polling. */
    void start();
    /** @brief Stop polling and join the worker thread. */
    void stop();

  private:
    /** @brief Evaluate the check; a throwing check counts as unreachable. */
    bool poll_once();
    /** @brief Worker loop waking every interval until stopped. */
    void heartbeat_loop();

    ReachabilityCheck check_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> flag_online_{false};
    std::atomic<bool> flag_running_{false};
    std::mutex mutex_;
    std::condition_variable cv_stop_;
    std::thread heartbeat_thread_;
    ListenerSet<bool> listeners_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_sync
