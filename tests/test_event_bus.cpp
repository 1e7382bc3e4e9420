#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "offline_sync/event_bus.hpp"

using namespace offline_sync;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    offline_sync::test::ensure_logger_initialized();
    return true;
}();

QueueEvent make_event(QueueEventType type, const std::string& chat_id = {}) {
    QueueEvent event{};
    event.type = type;
    event.chat_id = chat_id;
    return event;
}
}  // namespace

TEST_CASE("EventBus delivers events to listeners in subscription order") {
    EventBus bus{};
    std::vector<std::string> calls{};
    auto first = bus.subscribe([&calls](const QueueEvent& event) { calls.push_back("first:" + event.chat_id); });
    auto second = bus.subscribe([&calls](const QueueEvent& event) { calls.push_back("second:" + event.chat_id); });

    bus.publish(make_event(QueueEventType::MessageQueued, "chat-a"));

    REQUIRE(calls == std::vector<std::string>{"first:chat-a", "second:chat-a"});
    REQUIRE(bus.listener_count() == 2);
}

TEST_CASE("EventBus isolates a throwing listener from the others") {
    EventBus bus{};
    int received = 0;
    auto failing = bus.subscribe([](const QueueEvent&) { throw std::runtime_error("listener broke"); });
    auto healthy = bus.subscribe([&received](const QueueEvent&) { ++received; });

    REQUIRE_NOTHROW(bus.publish(make_event(QueueEventType::SyncStarted)));
    REQUIRE_NOTHROW(bus.publish(make_event(QueueEventType::SyncCompleted)));
    REQUIRE(received == 2);
}

TEST_CASE("EventBus isolates a listener that throws a non-standard value") {
    EventBus bus{};
    int others = 0;
    auto failing = bus.subscribe([](const QueueEvent&) { throw "boom"; });
    auto healthy = bus.subscribe([&others](const QueueEvent&) { ++others; });

    REQUIRE_NOTHROW(bus.publish(make_event(QueueEventType::MessageQueued, "chat-a")));
    REQUIRE(others == 1);
}

TEST_CASE("EventBus stops delivering once a subscription is released") {
    EventBus bus{};
    int received = 0;
    auto subscription = bus.subscribe([&received](const QueueEvent&) { ++received; });

    bus.publish(make_event(QueueEventType::Online));
    subscription.unsubscribe();
    bus.publish(make_event(QueueEventType::Offline));

    REQUIRE(received == 1);
    REQUIRE_FALSE(subscription.active());
    REQUIRE(bus.listener_count() == 0);

    SECTION("a destroyed token detaches as well") {
        {
            auto scoped = bus.subscribe([&received](const QueueEvent&) { ++received; });
            REQUIRE(bus.listener_count() == 1);
        }
        bus.publish(make_event(QueueEventType::Online));
        REQUIRE(received == 1);
    }
}

TEST_CASE("EventBus lets a listener unsubscribe itself while being notified") {
    EventBus bus{};
    int received = 0;
    Subscription self_removing{};
    self_removing = bus.subscribe([&](const QueueEvent&) {
        ++received;
        self_removing.unsubscribe();
    });

    bus.publish(make_event(QueueEventType::MessageSynced));
    bus.publish(make_event(QueueEventType::MessageSynced));

    REQUIRE(received == 1);
}

TEST_CASE("Subscription tokens may outlive their bus") {
    Subscription survivor{};
    {
        EventBus bus{};
        survivor = bus.subscribe([](const QueueEvent&) {});
    }
    REQUIRE(survivor.active());
    REQUIRE_NOTHROW(survivor.unsubscribe());
}

TEST_CASE("Queue event names match their wire spelling") {
    REQUIRE(to_string(QueueEventType::MessageQueued) == "messageQueued");
    REQUIRE(to_string(QueueEventType::AllQueuesCleared) == "allQueuesCleared");
    REQUIRE(to_string(QueueEventType::SyncError) == "syncError");
}
