#include <chrono>

#include <catch2/catch.hpp>

#include "offline_sync/backoff_strategy.hpp"

using namespace offline_sync;
using std::chrono::milliseconds;

TEST_CASE("NoBackoff never delays") {
    const NoBackoff backoff{};
    REQUIRE(backoff.next_delay(1) == milliseconds{0});
    REQUIRE(backoff.next_delay(10) == milliseconds{0});
}

TEST_CASE("ExponentialBackoff doubles from the base and stops at the cap") {
    const ExponentialBackoff backoff{milliseconds{100}, milliseconds{1'000}};
    REQUIRE(backoff.next_delay(1) == milliseconds{100});
    REQUIRE(backoff.next_delay(2) == milliseconds{200});
    REQUIRE(backoff.next_delay(3) == milliseconds{400});
    REQUIRE(backoff.next_delay(4) == milliseconds{800});
    REQUIRE(backoff.next_delay(5) == milliseconds{1'000});
    REQUIRE(backoff.next_delay(500) == milliseconds{1'000});
    REQUIRE(backoff.next_delay(0) == milliseconds{100});
}

TEST_CASE("ExponentialBackoff jitter stays within its ratio") {
    const ExponentialBackoff backoff{milliseconds{1'000}, milliseconds{60'000}, 0.2};
    for (int sample = 0; sample < 200; ++sample) {
        const auto delay = backoff.next_delay(2);
        REQUIRE(delay >= milliseconds{1'600});
        REQUIRE(delay <= milliseconds{2'400});
    }
}

TEST_CASE("make_backoff_strategy honours the configured kind") {
    BackoffConfig config{};
    REQUIRE(make_backoff_strategy(config)->next_delay(3) == milliseconds{0});

    config.kind = BackoffKind::Exponential;
    config.base_delay = milliseconds{50};
    config.jitter_ratio = 0.0;
    REQUIRE(make_backoff_strategy(config)->next_delay(3) == milliseconds{200});

    REQUIRE(to_string(BackoffKind::Exponential) == "exponential");
    REQUIRE(to_string(BackoffKind::None) == "none");
}
