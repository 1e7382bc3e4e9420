// === Event Bus ===============================================================
//
// Synchronous publish/subscribe channel that broadcasts queue and sync
// lifecycle events to UI layers and diagnostics. Every listener runs inside
// its own try/catch so one failing listener cannot starve the others or
// unwind into the publisher.

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "offline_sync/logging.hpp"
#include "offline_sync/subscription.hpp"
#include "offline_sync/types.hpp"

namespace offline_sync {

/** @brief Kinds of lifecycle notifications emitted by the engine. */
enum class QueueEventType {
    Online,           /**< Connectivity transitioned to online. */
    Offline,          /**< Connectivity transitioned to offline. */
    MessageQueued,    /**< An entry was durably enqueued. */
    MessageRemoved,   /**< An entry was deleted from the queue. */
    MessageSynced,    /**< An entry was delivered and removed. */
    MessageFailed,    /**< An entry exhausted its retry budget. */
    SyncStarted,      /**< A sync run began. */
    SyncCompleted,    /**< A sync run finished normally. */
    SyncError,        /**< A sync run aborted on a storage failure. */
    AllQueuesCleared  /**< Every entry was deleted. */
};

/** @brief Wire-style event name, e.g. "messageSynced". */
[[nodiscard]] std::string_view to_string(QueueEventType type) noexcept;

/** @brief A single notification; only the fields relevant to its type are set. */
struct QueueEvent final {
    QueueEventType type{QueueEventType::SyncStarted};
    std::string chat_id{};
    std::optional<QueueId> queue_id{};
    std::optional<std::string> delivered_id{};
    std::size_t success_count{};
    std::size_t failed_count{};
    std::size_t cleared_count{};
    std::string error{};
};

using QueueEventListener = std::function<void(const QueueEvent&)>;

/** @brief Thread-safe fan-out of queue events to registered listeners. */
class EventBus final {
  public:
    EventBus();

    /** @brief Register @p listener; it stays attached while the token lives. */
    [[nodiscard]] Subscription subscribe(QueueEventListener listener);
    /** @brief Deliver @p event to every listener on the calling thread. */
    void publish(const QueueEvent& event) const;
    /** @brief Number of attached listeners. */
    [[nodiscard]] std::size_t listener_count() const;

  private:
    ListenerSet<const QueueEvent&> listeners_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_sync
