#include "offline_sync/connectivity_probe.hpp"

#include <exception>
#include <utility>

namespace offline_sync {

namespace {

void notify_all(const ListenerSet<bool>& listeners, bool online, spdlog::logger& logger) {
    for (const auto& listener : listeners.snapshot()) {
        try {
            (*listener)(online);
        } catch (const std::exception& exc) {
            logger.error(R"({{"component":"connectivity_probe","online":{},"listener_error":"{}"}})", online, exc.what());
        } catch (...) {
            logger.error(
                R"({{"component":"connectivity_probe","online":{},"listener_error":"non-standard exception"}})",
                online
            );
        }
    }
}

}  // namespace

ManualConnectivityProbe::ManualConnectivityProbe(bool initially_online)
    : flag_online_(initially_online),
      logger_(get_logger()) {}

bool ManualConnectivityProbe::current() const {
    return flag_online_.load();
}

Subscription ManualConnectivityProbe::on_change(ConnectivityListener listener) {
    return listeners_.add(std::move(listener));
}

void ManualConnectivityProbe::set_online(bool online) {
    flag_online_.store(online);
    notify_all(listeners_, online, *logger_);
}

HeartbeatConnectivityProbe::HeartbeatConnectivityProbe(ReachabilityCheck check, std::chrono::milliseconds interval)
    : check_(std::move(check)),
      interval_(interval),
      logger_(get_logger()) {}

HeartbeatConnectivityProbe::~HeartbeatConnectivityProbe() {
    stop();
}

bool HeartbeatConnectivityProbe::current() const {
    return flag_online_.load();
}

Subscription HeartbeatConnectivityProbe::on_change(ConnectivityListener listener) {
    return listeners_.add(std::move(listener));
}

void HeartbeatConnectivityProbe::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    flag_online_.store(poll_once());
    logger_->info("Heartbeat probe started every {} ms (online={})", interval_.count(), flag_online_.load());
    heartbeat_thread_ = std::thread([this]() { heartbeat_loop(); });
}

void HeartbeatConnectivityProbe::stop() {
    {
        std::scoped_lock lock(mutex_);
        if (!flag_running_.exchange(false)) {
            return;
        }
    }
    cv_stop_.notify_all();
    if (heartbeat_thread_.joinable()) {
        heartbeat_thread_.join();
    }
}

bool HeartbeatConnectivityProbe::poll_once() {
    try {
        return check_();
    } catch (const std::exception& exc) {
        logger_->warn("Reachability check failed: {}", exc.what());
        return false;
    } catch (...) {
        logger_->error("Reachability check threw a non-standard exception");
        return false;
    }
}

void HeartbeatConnectivityProbe::heartbeat_loop() {
    while (true) {
        {
            std::unique_lock lock(mutex_);
            if (cv_stop_.wait_for(lock, interval_, [this]() { return !flag_running_.load(); })) {
                return;
            }
        }
        const bool online = poll_once();
        if (flag_online_.exchange(online) != online) {
            logger_->debug("Heartbeat observed reachability change to {}", online);
            notify_all(listeners_, online, *logger_);
        }
    }
}

}  // namespace offline_sync
