#include "offline_sync/connectivity_monitor.hpp"

#include <utility>

namespace offline_sync {

ConnectivityMonitor::ConnectivityMonitor(ConnectivityProbe& probe, EventBus& event_bus, OnlineTrigger on_online)
    : probe_(probe),
      event_bus_(event_bus),
      on_online_(std::move(on_online)),
      flag_online_(probe.current()),
      logger_(get_logger()) {
    logger_->info(R"({{"component":"connectivity","initial_online":{}}})", flag_online_.load());
}

void ConnectivityMonitor::start() {
    if (probe_subscription_.active()) {
        return;
    }
    probe_subscription_ = probe_.on_change([this](bool online) { observe(online); });
    // Catch up on a change the probe reported before we subscribed.
    observe(probe_.current());
}

void ConnectivityMonitor::stop() {
    probe_subscription_.unsubscribe();
}

bool ConnectivityMonitor::is_online() const noexcept {
    return flag_online_.load();
}

void ConnectivityMonitor::observe(bool online) {
    {
        std::scoped_lock lock(transition_mutex_);
        if (flag_online_.exchange(online) == online) {
            return;
        }
        logger_->info(R"({{"component":"connectivity","transition":"{}"}})", online ? "online" : "offline");
        QueueEvent event{};
        event.type = online ? QueueEventType::Online : QueueEventType::Offline;
        event_bus_.publish(event);
    }

    // Outside the lock so a synchronous sync cannot hold up an offline report.
    if (online && on_online_) {
        on_online_();
    }
}

}  // namespace offline_sync
