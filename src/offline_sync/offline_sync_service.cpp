#include "offline_sync/offline_sync_service.hpp"

#include <stdexcept>
#include <utility>

namespace offline_sync {

namespace {
QueueStore& require_store(const std::unique_ptr<QueueStore>& store) {
    if (!store) {
        throw std::invalid_argument("OfflineSyncService requires a queue store");
    }
    return *store;
}
}  // namespace

OfflineSyncService::OfflineSyncService(std::unique_ptr<QueueStore> store,
                                       ConnectivityProbe& probe,
                                       DeliveryFunction deliver,
                                       SyncConfig config,
                                       ClockFunction clock)
    : config_(config),
      store_(std::move(store)),
      event_bus_(),
      monitor_(probe, event_bus_, [this]() { on_online(); }),
      queue_manager_(require_store(store_), event_bus_, config_.max_retries, clock),
      coordinator_(queue_manager_,
                   monitor_,
                   event_bus_,
                   std::move(deliver),
                   config_.delivery_timeout,
                   make_backoff_strategy(config_.backoff),
                   clock),
      worker_(coordinator_),
      status_tracker_(event_bus_, queue_manager_, monitor_, coordinator_),
      logger_(get_logger()) {}

OfflineSyncService::~OfflineSyncService() {
    stop();
}

void OfflineSyncService::start() {
    if (flag_started_.load()) {
        return;
    }
    store_->open();
    status_tracker_.refresh_queued_count();

    if (config_.auto_sync) {
        worker_.start();
    }
    monitor_.start();
    flag_started_.store(true);

    logger_->info(
        R"({{"component":"service","action":"start","online":{},"pending":{},"max_retries":{},"backoff":"{}","auto_sync":{}}})",
        monitor_.is_online(),
        status_tracker_.snapshot().queued_count,
        config_.max_retries,
        to_string(config_.backoff.kind),
        config_.auto_sync
    );

    // Entries left over from a previous run go out as soon as we know we are online.
    if (config_.auto_sync && monitor_.is_online()) {
        worker_.trigger();
    }
}

void OfflineSyncService::stop() {
    if (!flag_started_.exchange(false)) {
        return;
    }
    monitor_.stop();
    worker_.stop();
    logger_->info(R"({"component":"service","action":"stop"})");
}

QueueId OfflineSyncService::enqueue(const std::string& chat_id, Payload payload) {
    return queue_manager_.enqueue(chat_id, std::move(payload));
}

std::vector<QueuedMessage> OfflineSyncService::queued_messages(const std::optional<std::string>& chat_id) const {
    return queue_manager_.list(chat_id);
}

std::vector<QueuedMessage> OfflineSyncService::failed_messages(const std::optional<std::string>& chat_id) const {
    return queue_manager_.list_failed(chat_id);
}

std::size_t OfflineSyncService::queue_count(const std::optional<std::string>& chat_id) const {
    return queue_manager_.count(chat_id);
}

bool OfflineSyncService::remove(QueueId queue_id) {
    return queue_manager_.remove(queue_id);
}

std::size_t OfflineSyncService::clear_chat_queue(const std::string& chat_id) {
    return queue_manager_.clear(chat_id);
}

std::size_t OfflineSyncService::clear_all_queues() {
    return queue_manager_.clear_all();
}

bool OfflineSyncService::retry_failed(QueueId queue_id) {
    const bool requeued = queue_manager_.retry_failed(queue_id);
    if (requeued && config_.auto_sync && monitor_.is_online()) {
        worker_.trigger();
    }
    return requeued;
}

SyncResult OfflineSyncService::sync_queue() {
    return coordinator_.sync_queue();
}

void OfflineSyncService::request_sync() {
    worker_.trigger();
}

bool OfflineSyncService::is_online() const noexcept {
    return monitor_.is_online();
}

Subscription OfflineSyncService::subscribe(QueueEventListener listener) {
    return event_bus_.subscribe(std::move(listener));
}

SyncStatus OfflineSyncService::status() const {
    return status_tracker_.snapshot();
}

void OfflineSyncService::on_online() {
    if (!config_.auto_sync) {
        logger_->debug("Background sync disabled; ignoring reconnect");
        return;
    }
    worker_.trigger();
}

}  // namespace offline_sync
