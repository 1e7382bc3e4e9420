#pragma once

#include <algorithm>
#include <iterator>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "offline_sync/event_bus.hpp"
#include "offline_sync/types.hpp"

namespace offline_sync::test {

/** @brief Collects every event published on a bus. */
class EventRecorder final {
  public:
    explicit EventRecorder(EventBus& event_bus)
        : subscription_(event_bus.subscribe([this](const QueueEvent& event) {
              std::scoped_lock lock(mutex_);
              list_events_.push_back(event);
          })) {}

    [[nodiscard]] std::vector<QueueEvent> events() const {
        std::scoped_lock lock(mutex_);
        return list_events_;
    }

    [[nodiscard]] std::vector<QueueEventType> types() const {
        std::scoped_lock lock(mutex_);
        std::vector<QueueEventType> list_types;
        for (const auto& event : list_events_) {
            list_types.push_back(event.type);
        }
        return list_types;
    }

    [[nodiscard]] std::vector<QueueEvent> of_type(QueueEventType type) const {
        std::scoped_lock lock(mutex_);
        std::vector<QueueEvent> matching;
        std::copy_if(list_events_.begin(), list_events_.end(), std::back_inserter(matching), [type](const QueueEvent& event) {
            return event.type == type;
        });
        return matching;
    }

    [[nodiscard]] std::size_t count(QueueEventType type) const {
        return of_type(type).size();
    }

    void reset() {
        std::scoped_lock lock(mutex_);
        list_events_.clear();
    }

  private:
    mutable std::mutex mutex_;
    std::vector<QueueEvent> list_events_;
    Subscription subscription_;
};

/** @brief Clock that only moves when told to. */
class ManualClock final {
  public:
    explicit ManualClock(EpochMillis start) : now_(start) {}

    [[nodiscard]] ClockFunction function() {
        return [this]() { return now_.load(); };
    }

    void advance(std::chrono::milliseconds step) {
        now_ += step.count();
    }

    void set(EpochMillis value) {
        now_.store(value);
    }

  private:
    std::atomic<EpochMillis> now_;
};

/** @brief Fresh database path under the temp directory; stale files are removed. */
inline std::filesystem::path unique_database_path(const std::string& stem) {
    static std::atomic<int> counter{0};
    const auto directory = std::filesystem::temp_directory_path() / "offline_sync_tests_db";
    std::filesystem::create_directories(directory);
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto path = directory / fmt::format("{}_{}_{}.db", stem, stamp, counter++);
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::filesystem::remove(path.string() + suffix);
    }
    return path;
}

/** @brief Poll @p predicate until it holds or @p timeout elapses. */
template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds{2'000}) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return predicate();
}

}  // namespace offline_sync::test
