#include <atomic>
#include <chrono>
#include <string>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "queue_test_support.hpp"
#include "offline_sync/sqlite_queue_store.hpp"
#include "offline_sync/sync_status_tracker.hpp"
#include "offline_sync/sync_worker.hpp"

using namespace offline_sync;
using offline_sync::test::wait_until;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    offline_sync::test::ensure_logger_initialized();
    return true;
}();

struct TrackerFixture {
    TrackerFixture() {
        store.open();
        monitor.start();
        tracker.refresh_queued_count();
    }

    SqliteQueueStore store{k_in_memory_database};
    EventBus bus{};
    ManualConnectivityProbe probe{false};
    ConnectivityMonitor monitor{probe, bus, nullptr};
    QueueManager manager{store, bus};
    bool deliveries_succeed{true};
    std::atomic<bool> deliveries_throw{false};
    SyncCoordinator coordinator{
        manager,
        monitor,
        bus,
        [this](const std::string&, const Payload&) {
            if (deliveries_throw.load()) {
                throw 13;
            }
            return DeliveryResult{deliveries_succeed, std::nullopt, deliveries_succeed ? "" : "nope"};
        },
        std::chrono::milliseconds{0}
    };
    SyncStatusTracker tracker{bus, manager, monitor, coordinator};
};
}  // namespace

TEST_CASE_METHOD(TrackerFixture, "SyncStatusTracker follows connectivity and the queue size") {
    REQUIRE_FALSE(tracker.snapshot().online);
    REQUIRE(tracker.snapshot().queued_count == 0);

    (void)manager.enqueue("chat-a", make_payload("1"));
    (void)manager.enqueue("chat-a", make_payload("2"));
    REQUIRE(tracker.snapshot().queued_count == 2);

    probe.set_online(true);
    REQUIRE(tracker.snapshot().online);

    (void)manager.clear_all();
    REQUIRE(tracker.snapshot().queued_count == 0);
}

TEST_CASE_METHOD(TrackerFixture, "SyncStatusTracker refuses a manual sync while offline") {
    (void)manager.enqueue("chat-a", make_payload("1"));
    const SyncResult result = tracker.trigger_sync();

    REQUIRE_FALSE(result.success);
    REQUIRE(result.reason == SyncSkipReason::Offline);
    REQUIRE(manager.count() == 1);
    REQUIRE_FALSE(tracker.snapshot().last_sync_time.has_value());
}

TEST_CASE_METHOD(TrackerFixture, "SyncStatusTracker records the outcome of the last sync") {
    (void)manager.enqueue("chat-a", make_payload("1"));
    (void)manager.enqueue("chat-a", make_payload("2"));
    probe.set_online(true);

    const SyncResult result = tracker.trigger_sync();
    REQUIRE(result.success);

    const SyncStatus status = tracker.snapshot();
    REQUIRE_FALSE(status.syncing);
    REQUIRE(status.last_sync_time.has_value());
    REQUIRE(status.last_synced_count == 2);
    REQUIRE(status.last_failed_count == 0);
    REQUIRE(status.queued_count == 0);

    deliveries_succeed = false;
    (void)manager.enqueue("chat-b", make_payload("3"));
    (void)tracker.trigger_sync();
    REQUIRE(tracker.snapshot().last_failed_count == 1);
    REQUIRE(tracker.snapshot().queued_count == 1);
}

TEST_CASE_METHOD(TrackerFixture, "SyncWorker runs triggered passes in the background") {
    probe.set_online(true);
    SyncWorker worker{coordinator};
    worker.trigger();
    worker.start();
    REQUIRE(worker.running());
    REQUIRE(wait_until([&worker]() { return worker.completed_passes() >= 1; }));

    (void)manager.enqueue("chat-a", make_payload("bg"));
    worker.trigger();
    REQUIRE(wait_until([this]() { return manager.count() == 0; }));

    worker.stop();
    REQUIRE_FALSE(worker.running());
    worker.stop();
}

TEST_CASE_METHOD(TrackerFixture, "SyncWorker keeps running when delivery throws a non-standard value") {
    probe.set_online(true);
    deliveries_throw.store(true);
    const QueueId queue_id = manager.enqueue("chat-a", make_payload("bg"));

    SyncWorker worker{coordinator};
    worker.start();
    worker.trigger();
    REQUIRE(wait_until([&worker]() { return worker.completed_passes() >= 1; }));
    REQUIRE(worker.running());
    REQUIRE_FALSE(coordinator.in_progress());
    REQUIRE(manager.find(queue_id)->retry_count == 1);

    deliveries_throw.store(false);
    worker.trigger();
    REQUIRE(wait_until([this]() { return manager.count() == 0; }));
    REQUIRE(worker.running());
    worker.stop();
}
