#include "offline_sync/event_bus.hpp"

#include <exception>

namespace offline_sync {

std::string_view to_string(QueueEventType type) noexcept {
    switch (type) {
        case QueueEventType::Online:
            return "online";
        case QueueEventType::Offline:
            return "offline";
        case QueueEventType::MessageQueued:
            return "messageQueued";
        case QueueEventType::MessageRemoved:
            return "messageRemoved";
        case QueueEventType::MessageSynced:
            return "messageSynced";
        case QueueEventType::MessageFailed:
            return "messageFailed";
        case QueueEventType::SyncStarted:
            return "syncStarted";
        case QueueEventType::SyncCompleted:
            return "syncCompleted";
        case QueueEventType::SyncError:
            return "syncError";
        case QueueEventType::AllQueuesCleared:
            return "allQueuesCleared";
    }
    return "unknown";
}

EventBus::EventBus()
    : logger_(get_logger()) {}

Subscription EventBus::subscribe(QueueEventListener listener) {
    return listeners_.add(std::move(listener));
}

void EventBus::publish(const QueueEvent& event) const {
    logger_->debug(R"({{"component":"event_bus","event":"{}","chat":"{}"}})", to_string(event.type), event.chat_id);
    for (const auto& listener : listeners_.snapshot()) {
        try {
            (*listener)(event);
        } catch (const std::exception& exc) {
            logger_->error(
                R"({{"component":"event_bus","event":"{}","listener_error":"{}"}})",
                to_string(event.type),
                exc.what()
            );
        } catch (...) {
            logger_->error(
                R"({{"component":"event_bus","event":"{}","listener_error":"non-standard exception"}})",
                to_string(event.type)
            );
        }
    }
}

std::size_t EventBus::listener_count() const {
    return listeners_.size();
}

}  // namespace offline_sync
