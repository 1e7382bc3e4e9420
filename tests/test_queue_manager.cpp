#include <optional>
#include <string>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "queue_test_support.hpp"
#include "offline_sync/errors.hpp"
#include "offline_sync/queue_manager.hpp"
#include "offline_sync/sqlite_queue_store.hpp"

using namespace offline_sync;
using offline_sync::test::EventRecorder;
using offline_sync::test::ManualClock;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    offline_sync::test::ensure_logger_initialized();
    return true;
}();

struct QueueFixture {
    QueueFixture() {
        store.open();
    }

    SqliteQueueStore store{k_in_memory_database};
    EventBus bus{};
    ManualClock clock{1'000};
    QueueManager manager{store, bus, 3, clock.function()};
    EventRecorder recorder{bus};
};

void mark_failed(QueueManager& manager, QueueId queue_id) {
    QueuedMessageUpdate fields{};
    fields.status = QueueStatus::Failed;
    fields.retry_count = manager.max_retries();
    fields.last_error = "rejected";
    manager.update(queue_id, fields);
}
}  // namespace

TEST_CASE_METHOD(QueueFixture, "QueueManager enqueues pending entries and announces them") {
    const QueueId queue_id = manager.enqueue("chat-a", make_payload("hi"));

    const auto entry = manager.find(queue_id);
    REQUIRE(entry.has_value());
    REQUIRE(entry->status == QueueStatus::Pending);
    REQUIRE(entry->retry_count == 0);
    REQUIRE(entry->max_retries == 3);
    REQUIRE(entry->queued_at == 1'000);
    REQUIRE_FALSE(entry->last_error.has_value());

    const auto queued = recorder.of_type(QueueEventType::MessageQueued);
    REQUIRE(queued.size() == 1);
    REQUIRE(queued[0].chat_id == "chat-a");
    REQUIRE(queued[0].queue_id == std::optional<QueueId>{queue_id});
}

TEST_CASE_METHOD(QueueFixture, "QueueManager counts pending entries per chat and in total") {
    (void)manager.enqueue("chat-a", make_payload("1"));
    (void)manager.enqueue("chat-a", make_payload("2"));
    (void)manager.enqueue("chat-b", make_payload("3"));

    REQUIRE(manager.count() == 3);
    REQUIRE(manager.count(std::string{"chat-a"}) == 2);
    REQUIRE(manager.count(std::string{"chat-c"}) == 0);
}

TEST_CASE_METHOD(QueueFixture, "QueueManager keeps timestamps monotonic when the clock steps back") {
    const QueueId first = manager.enqueue("chat-a", make_payload("first"));
    clock.set(500);
    const QueueId second = manager.enqueue("chat-a", make_payload("second"));

    const auto entries = manager.list(std::string{"chat-a"});
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].id == first);
    REQUIRE(entries[1].id == second);
    REQUIRE(entries[1].queued_at >= entries[0].queued_at);
}

TEST_CASE_METHOD(QueueFixture, "QueueManager separates pending and failed views") {
    const QueueId ok_id = manager.enqueue("chat-a", make_payload("ok"));
    const QueueId failed_id = manager.enqueue("chat-a", make_payload("bad"));
    mark_failed(manager, failed_id);

    const auto pending = manager.list();
    REQUIRE(pending.size() == 1);
    REQUIRE(pending[0].id == ok_id);

    const auto failed = manager.list_failed(std::string{"chat-a"});
    REQUIRE(failed.size() == 1);
    REQUIRE(failed[0].id == failed_id);
    REQUIRE(manager.count() == 1);
}

TEST_CASE_METHOD(QueueFixture, "QueueManager removes entries and reports missing ones") {
    const QueueId queue_id = manager.enqueue("chat-a", make_payload("x"));
    recorder.reset();

    REQUIRE(manager.remove(queue_id));
    REQUIRE_FALSE(manager.remove(queue_id));
    REQUIRE(recorder.count(QueueEventType::MessageRemoved) == 1);

    QueuedMessageUpdate fields{};
    fields.retry_count = 1;
    REQUIRE_THROWS_AS(manager.update(queue_id, fields), NotFoundError);
}

TEST_CASE_METHOD(QueueFixture, "QueueManager clears one chat without touching others") {
    (void)manager.enqueue("chat-a", make_payload("1"));
    const QueueId failed_id = manager.enqueue("chat-a", make_payload("2"));
    mark_failed(manager, failed_id);
    const QueueId survivor = manager.enqueue("chat-b", make_payload("3"));
    recorder.reset();

    REQUIRE(manager.clear("chat-a") == 2);
    REQUIRE(recorder.count(QueueEventType::MessageRemoved) == 2);
    REQUIRE(manager.list_failed().empty());

    const auto remaining = manager.list();
    REQUIRE(remaining.size() == 1);
    REQUIRE(remaining[0].id == survivor);

    REQUIRE(manager.clear("chat-a") == 0);
}

TEST_CASE_METHOD(QueueFixture, "QueueManager clear_all empties everything and announces the count") {
    REQUIRE(manager.clear_all() == 0);
    auto cleared = recorder.of_type(QueueEventType::AllQueuesCleared);
    REQUIRE(cleared.size() == 1);
    REQUIRE(cleared[0].cleared_count == 0);

    (void)manager.enqueue("chat-a", make_payload("1"));
    (void)manager.enqueue("chat-b", make_payload("2"));
    recorder.reset();

    REQUIRE(manager.clear_all() == 2);
    cleared = recorder.of_type(QueueEventType::AllQueuesCleared);
    REQUIRE(cleared.size() == 1);
    REQUIRE(cleared[0].cleared_count == 2);
    REQUIRE(manager.count() == 0);
}

TEST_CASE_METHOD(QueueFixture, "QueueManager retry_failed restores a fresh retry budget") {
    const QueueId queue_id = manager.enqueue("chat-a", make_payload("again"));
    REQUIRE_FALSE(manager.retry_failed(queue_id));

    mark_failed(manager, queue_id);
    REQUIRE(manager.retry_failed(queue_id));

    const auto entry = manager.find(queue_id);
    REQUIRE(entry->status == QueueStatus::Pending);
    REQUIRE(entry->retry_count == 0);
    REQUIRE_FALSE(entry->last_error.has_value());
    REQUIRE(entry->next_attempt_at == 0);

    REQUIRE_THROWS_AS(manager.retry_failed(queue_id + 50), NotFoundError);
}

TEST_CASE("QueueManager falls back to the default budget for non-positive limits") {
    SqliteQueueStore store{k_in_memory_database};
    store.open();
    EventBus bus{};
    QueueManager manager{store, bus, 0};
    REQUIRE(manager.max_retries() == k_default_max_retries);
}
