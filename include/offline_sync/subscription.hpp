// === Subscriptions ===========================================================
//
// RAII unsubscribe tokens plus the thread-safe listener registry shared by the
// event bus and the connectivity probes. A token only holds a weak reference
// to its registry, so it may safely outlive the publisher.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace offline_sync {

/** @brief Move-only handle that detaches a listener when released or destroyed. */
class Subscription final {
  public:
    Subscription() = default;
    explicit Subscription(std::function<void()> detach);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    /** @brief Detach the listener now. Safe to call more than once. */
    void unsubscribe();
    /** @brief Whether the listener is still attached through this handle. */
    [[nodiscard]] bool active() const noexcept;

  private:
    std::function<void()> detach_;
};

/**
 * @brief Registry of callbacks keyed by insertion order.
 *
 * Notification is left to the owner: `snapshot()` copies the current
 * listeners so they can be invoked without holding the registry lock, which
 * lets a callback subscribe or unsubscribe re-entrantly.
 */
template <typename... Args>
class ListenerSet final {
  public:
    using Listener = std::function<void(Args...)>;
    using ListenerPtr = std::shared_ptr<const Listener>;

    ListenerSet() : state_(std::make_shared<State>()) {}

    [[nodiscard]] Subscription add(Listener listener) {
        std::uint64_t token = 0;
        {
            std::scoped_lock lock(state_->mutex);
            token = state_->next_token++;
            state_->map_listeners.emplace(token, std::make_shared<const Listener>(std::move(listener)));
        }
        std::weak_ptr<State> weak_state = state_;
        return Subscription{[weak_state, token]() {
            if (auto state = weak_state.lock()) {
                std::scoped_lock lock(state->mutex);
                state->map_listeners.erase(token);
            }
        }};
    }

    [[nodiscard]] std::vector<ListenerPtr> snapshot() const {
        std::scoped_lock lock(state_->mutex);
        std::vector<ListenerPtr> listeners;
        listeners.reserve(state_->map_listeners.size());
        for (const auto& [token, listener] : state_->map_listeners) {
            listeners.push_back(listener);
        }
        return listeners;
    }

    [[nodiscard]] std::size_t size() const {
        std::scoped_lock lock(state_->mutex);
        return state_->map_listeners.size();
    }

  private:
    struct State final {
        std::mutex mutex;
        std::uint64_t next_token{1};
        std::map<std::uint64_t, ListenerPtr> map_listeners;
    };

    std::shared_ptr<State> state_;
};

}  // namespace offline_sync
