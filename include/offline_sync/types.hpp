// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight enums used throughout the
// offline queue (clock primitives, opaque payload bytes, entry status).

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace offline_sync {

/**
 * @brief Alias for the wall clock; queue timestamps must survive restarts.
 */
using SystemClock = std::chrono::system_clock;

/**
 * @brief Alias for timestamps captured from the wall clock.
 */
using TimePoint = std::chrono::time_point<SystemClock>;

/**
 * @brief Milliseconds since the Unix epoch, the persisted time representation.
 */
using EpochMillis = std::int64_t;

/**
 * @brief Source of the current time; injectable so tests can pin timestamps.
 */
using ClockFunction = std::function<EpochMillis()>;

/**
 * @brief Opaque message body. The queue never looks inside.
 */
using Payload = std::vector<std::uint8_t>;

/**
 * @brief Store-assigned identifier of a queue entry.
 */
using QueueId = std::int64_t;

/**
 * @brief Lifecycle state of a queue entry. Delivered entries are deleted.
 */
enum class QueueStatus {
    Pending, /**< Awaiting delivery; picked up by the next sync run. */
    Failed   /**< Retry budget exhausted; kept until cleared or retried by hand. */
};

/** @brief Current wall clock time in epoch milliseconds. */
[[nodiscard]] EpochMillis now_epoch_ms();

/** @brief Convert epoch milliseconds back to a wall clock time point. */
[[nodiscard]] TimePoint to_time_point(EpochMillis epoch_ms);

/** @brief Persisted spelling of @p status ("pending" / "failed"). */
[[nodiscard]] std::string_view to_string(QueueStatus status) noexcept;

/** @brief Parse a persisted status; empty for unknown spellings. */
[[nodiscard]] std::optional<QueueStatus> parse_queue_status(std::string_view text) noexcept;

/** @brief Copy text into a payload. */
[[nodiscard]] Payload make_payload(std::string_view text);

/** @brief Interpret payload bytes as text (diagnostics and the CLI only). */
[[nodiscard]] std::string payload_to_string(const Payload& payload);

}  // namespace offline_sync
