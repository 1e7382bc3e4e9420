#include "offline_sync/sync_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <thread>
#include <utility>
#include <vector>

#include "offline_sync/errors.hpp"

namespace offline_sync {

namespace {

DeliveryResult normalize(DeliveryResult result) {
    if (!result.success && result.error.empty()) {
        result.error = "delivery rejected";
    }
    return result;
}

/** @brief Holds the in-progress flag for one run; every exit path clears it. */
class RunFlag final {
  public:
    explicit RunFlag(std::atomic<bool>& flag) : flag_(flag) {
        flag_.store(true);
    }

    ~RunFlag() {
        release();
    }

    RunFlag(const RunFlag&) = delete;
    RunFlag& operator=(const RunFlag&) = delete;

    void release() noexcept {
        flag_.store(false);
    }

  private:
    std::atomic<bool>& flag_;
};

}  // namespace

std::string_view to_string(SyncSkipReason reason) noexcept {
    switch (reason) {
        case SyncSkipReason::None:
            return "none";
        case SyncSkipReason::Offline:
            return "offline";
        case SyncSkipReason::SyncInProgress:
            return "sync_in_progress";
        case SyncSkipReason::StorageError:
            return "storage_error";
    }
    return "none";
}

SyncCoordinator::SyncCoordinator(QueueManager& queue_manager,
                                 const ConnectivityMonitor& connectivity,
                                 EventBus& event_bus,
                                 DeliveryFunction deliver,
                                 std::chrono::milliseconds delivery_timeout,
                                 std::shared_ptr<const BackoffStrategy> backoff,
                                 ClockFunction clock)
    : queue_manager_(queue_manager),
      connectivity_(connectivity),
      event_bus_(event_bus),
      deliver_(std::move(deliver)),
      delivery_timeout_(delivery_timeout),
      backoff_(backoff ? std::move(backoff) : std::make_shared<NoBackoff>()),
      clock_(clock ? std::move(clock) : ClockFunction{now_epoch_ms}),
      logger_(get_logger()) {}

SyncResult SyncCoordinator::sync_queue() {
    if (!connectivity_.is_online()) {
        logger_->info(R"({"component":"sync","action":"skip","reason":"offline"})");
        return SyncResult{false, SyncSkipReason::Offline};
    }

    std::unique_lock run_lock(sync_mutex_, std::try_to_lock);
    if (!run_lock.owns_lock()) {
        logger_->info(R"({"component":"sync","action":"skip","reason":"sync_in_progress"})");
        return SyncResult{false, SyncSkipReason::SyncInProgress};
    }
    RunFlag run_flag{flag_in_progress_};

    QueueEvent started{};
    started.type = QueueEventType::SyncStarted;
    event_bus_.publish(started);

    std::size_t synced_count = 0;
    std::size_t failed_count = 0;
    bool flag_aborted = false;
    std::string str_abort_error;
    try {
        const std::vector<QueuedMessage> pending = queue_manager_.list();
        const EpochMillis now = clock_();
        logger_->info(R"({{"component":"sync","action":"start","pending":{}}})", pending.size());

        for (const QueuedMessage& entry : pending) {
            if (entry.next_attempt_at > now) {
                logger_->debug("Queue entry {} deferred until {}", entry.id, entry.next_attempt_at);
                continue;
            }
            const DeliveryResult delivery = attempt_delivery(entry);
            if (delivery.success) {
                record_success(entry, delivery);
                ++synced_count;
            } else {
                record_failure(entry, delivery.error);
                ++failed_count;
            }
        }
    } catch (const std::exception& exc) {
        flag_aborted = true;
        str_abort_error = exc.what();
    }

    run_flag.release();
    run_lock.unlock();

    if (flag_aborted) {
        logger_->error(R"({{"component":"sync","action":"abort","error":"{}"}})", str_abort_error);

        QueueEvent error_event{};
        error_event.type = QueueEventType::SyncError;
        error_event.success_count = synced_count;
        error_event.failed_count = failed_count;
        error_event.error = str_abort_error;
        event_bus_.publish(error_event);
        return SyncResult{false, SyncSkipReason::StorageError, synced_count, failed_count, str_abort_error};
    }

    logger_->info(R"({{"component":"sync","action":"complete","synced":{},"failed":{}}})", synced_count, failed_count);

    QueueEvent completed{};
    completed.type = QueueEventType::SyncCompleted;
    completed.success_count = synced_count;
    completed.failed_count = failed_count;
    event_bus_.publish(completed);
    return SyncResult{true, SyncSkipReason::None, synced_count, failed_count};
}

bool SyncCoordinator::in_progress() const noexcept {
    return flag_in_progress_.load();
}

std::size_t SyncCoordinator::outstanding_deliveries() const noexcept {
    return outstanding_deliveries_->load();
}

DeliveryResult SyncCoordinator::attempt_delivery(const QueuedMessage& entry) {
    try {
        if (delivery_timeout_.count() <= 0) {
            return normalize(deliver_(entry.chat_id, entry.payload));
        }
        return attempt_bounded_delivery(entry);
    } catch (const std::exception& exc) {
        return normalize(DeliveryResult{false, std::nullopt, exc.what()});
    } catch (...) {
        logger_->error(R"({{"component":"sync","queue_id":{},"error":"{}"}})", entry.id, k_unknown_delivery_error);
        return DeliveryResult{false, std::nullopt, std::string{k_unknown_delivery_error}};
    }
}

DeliveryResult SyncCoordinator::attempt_bounded_delivery(const QueuedMessage& entry) {
    if (outstanding_deliveries_->load() >= k_max_outstanding_deliveries) {
        logger_->warn(
            R"({{"component":"sync","queue_id":{},"error":"{}","outstanding":{}}})",
            entry.id,
            k_delivery_backlog_error,
            outstanding_deliveries_->load()
        );
        return DeliveryResult{false, std::nullopt, std::string{k_delivery_backlog_error}};
    }

    // The attempt owns copies of its inputs so an abandoned call stays valid.
    auto task = std::make_shared<std::packaged_task<DeliveryResult()>>(
        [deliver = deliver_, chat_id = entry.chat_id, payload = entry.payload]() {
            return deliver(chat_id, payload);
        }
    );
    std::future<DeliveryResult> future = task->get_future();
    ++*outstanding_deliveries_;
    std::thread([task, outstanding = outstanding_deliveries_]() {
        (*task)();
        --*outstanding;
    }).detach();

    if (future.wait_for(delivery_timeout_) == std::future_status::timeout) {
        logger_->warn(
            R"({{"component":"sync","queue_id":{},"error":"{}","timeout_ms":{},"outstanding":{}}})",
            entry.id,
            k_delivery_timeout_error,
            delivery_timeout_.count(),
            outstanding_deliveries_->load()
        );
        return DeliveryResult{false, std::nullopt, std::string{k_delivery_timeout_error}};
    }
    return normalize(future.get());
}

void SyncCoordinator::record_failure(const QueuedMessage& entry, const std::string& error) {
    const int retry_count = std::min(entry.retry_count + 1, entry.max_retries);
    const bool exhausted = retry_count >= entry.max_retries;

    QueuedMessageUpdate fields{};
    fields.retry_count = retry_count;
    fields.last_error = error;
    if (exhausted) {
        fields.status = QueueStatus::Failed;
    } else {
        fields.next_attempt_at = clock_() + backoff_->next_delay(retry_count).count();
    }

    logger_->warn(
        R"({{"component":"sync","chat":"{}","queue_id":{},"attempt":{},"max_retries":{},"error":"{}"}})",
        entry.chat_id,
        entry.id,
        retry_count,
        entry.max_retries,
        error
    );

    try {
        queue_manager_.update(entry.id, fields);
    } catch (const NotFoundError&) {
        logger_->warn("Queue entry {} was cleared during sync; dropping its retry state", entry.id);
        return;
    }

    if (exhausted) {
        QueueEvent event{};
        event.type = QueueEventType::MessageFailed;
        event.chat_id = entry.chat_id;
        event.queue_id = entry.id;
        event.error = error;
        event_bus_.publish(event);
    }
}

void SyncCoordinator::record_success(const QueuedMessage& entry, const DeliveryResult& result) {
    if (!queue_manager_.remove(entry.id)) {
        logger_->debug("Delivered queue entry {} was already cleared", entry.id);
    }

    QueueEvent event{};
    event.type = QueueEventType::MessageSynced;
    event.chat_id = entry.chat_id;
    event.queue_id = entry.id;
    event.delivered_id = result.delivered_id;
    event_bus_.publish(event);
}

}  // namespace offline_sync
