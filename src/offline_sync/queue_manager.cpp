#include "offline_sync/queue_manager.hpp"

#include <algorithm>
#include <utility>

#include "offline_sync/errors.hpp"

namespace offline_sync {

QueueManager::QueueManager(QueueStore& store, EventBus& event_bus, int max_retries, ClockFunction clock)
    : store_(store),
      event_bus_(event_bus),
      max_retries_(max_retries > 0 ? max_retries : k_default_max_retries),
      clock_(clock ? std::move(clock) : ClockFunction{now_epoch_ms}),
      logger_(get_logger()) {}

QueueId QueueManager::enqueue(const std::string& chat_id, Payload payload) {
    QueuedMessage entry{};
    entry.chat_id = chat_id;
    entry.payload = std::move(payload);
    entry.status = QueueStatus::Pending;
    entry.retry_count = 0;
    entry.max_retries = max_retries_;

    QueueId queue_id = 0;
    {
        std::scoped_lock lock(enqueue_mutex_);
        entry.queued_at = std::max(clock_(), last_queued_at_);
        queue_id = store_.add(entry);
        last_queued_at_ = entry.queued_at;
    }

    logger_->info(R"({{"component":"queue","action":"enqueue","chat":"{}","queue_id":{}}})", chat_id, queue_id);

    QueueEvent event{};
    event.type = QueueEventType::MessageQueued;
    event.chat_id = chat_id;
    event.queue_id = queue_id;
    event_bus_.publish(event);
    return queue_id;
}

std::vector<QueuedMessage> QueueManager::list(const std::optional<std::string>& chat_id) const {
    return list_with_status(chat_id, QueueStatus::Pending);
}

std::vector<QueuedMessage> QueueManager::list_failed(const std::optional<std::string>& chat_id) const {
    return list_with_status(chat_id, QueueStatus::Failed);
}

std::size_t QueueManager::count(const std::optional<std::string>& chat_id) const {
    return list(chat_id).size();
}

std::optional<QueuedMessage> QueueManager::find(QueueId queue_id) const {
    return store_.get(queue_id);
}

bool QueueManager::remove(QueueId queue_id) {
    if (!store_.remove(queue_id)) {
        logger_->debug("Queue entry {} already gone", queue_id);
        return false;
    }
    logger_->info(R"({{"component":"queue","action":"remove","queue_id":{}}})", queue_id);

    QueueEvent event{};
    event.type = QueueEventType::MessageRemoved;
    event.queue_id = queue_id;
    event_bus_.publish(event);
    return true;
}

void QueueManager::update(QueueId queue_id, const QueuedMessageUpdate& fields) {
    if (!store_.update(queue_id, fields)) {
        throw NotFoundError(queue_id);
    }
}

std::size_t QueueManager::clear(const std::string& chat_id) {
    std::size_t cleared_count = 0;
    for (const QueuedMessage& entry : store_.get_all(chat_id)) {
        if (remove(entry.id)) {
            ++cleared_count;
        }
    }
    logger_->info(R"({{"component":"queue","action":"clear_chat","chat":"{}","cleared":{}}})", chat_id, cleared_count);
    return cleared_count;
}

std::size_t QueueManager::clear_all() {
    const std::size_t cleared_count = store_.clear(std::nullopt);
    logger_->info(R"({{"component":"queue","action":"clear_all","cleared":{}}})", cleared_count);

    QueueEvent event{};
    event.type = QueueEventType::AllQueuesCleared;
    event.cleared_count = cleared_count;
    event_bus_.publish(event);
    return cleared_count;
}

bool QueueManager::retry_failed(QueueId queue_id) {
    const std::optional<QueuedMessage> entry = store_.get(queue_id);
    if (!entry.has_value()) {
        throw NotFoundError(queue_id);
    }
    if (entry->status != QueueStatus::Failed) {
        return false;
    }

    QueuedMessageUpdate fields{};
    fields.status = QueueStatus::Pending;
    fields.retry_count = 0;
    fields.clear_last_error = true;
    fields.next_attempt_at = 0;
    update(queue_id, fields);

    logger_->info(R"({{"component":"queue","action":"retry_failed","chat":"{}","queue_id":{}}})", entry->chat_id, queue_id);
    return true;
}

int QueueManager::max_retries() const noexcept {
    return max_retries_;
}

std::vector<QueuedMessage> QueueManager::list_with_status(const std::optional<std::string>& chat_id, QueueStatus status) const {
    std::vector<QueuedMessage> entries = store_.get_all(chat_id);
    entries.erase(
        std::remove_if(entries.begin(), entries.end(), [status](const QueuedMessage& entry) { return entry.status != status; }),
        entries.end()
    );
    return entries;
}

}  // namespace offline_sync
