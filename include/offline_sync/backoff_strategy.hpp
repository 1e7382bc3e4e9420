// === Retry Backoff ===========================================================
//
// Delay policies applied between failed delivery attempts of one entry. The
// default `NoBackoff` makes a failed entry eligible again on the very next
// sync trigger; `ExponentialBackoff` spaces attempts out with a capped,
// jittered exponential schedule.

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <random>
#include <string_view>

namespace offline_sync {

/** @brief Selects the delay policy configured for the sync coordinator. */
enum class BackoffKind {
    None,        /**< Retry on the next sync trigger. */
    Exponential  /**< base * 2^(attempt-1), capped, with jitter. */
};

/** @brief Backoff settings hydrated from configuration. */
struct BackoffConfig final {
    BackoffKind kind{BackoffKind::None};
    std::chrono::milliseconds base_delay{1'000};
    std::chrono::milliseconds max_delay{60'000};
    double jitter_ratio{0.2};
};

/** @brief Interface for computing the wait before the next delivery attempt. */
class BackoffStrategy {
  public:
    virtual ~BackoffStrategy() = default;

    /**
     * @brief Delay to apply after the @p attempt-th failure (starting at 1).
     */
    [[nodiscard]] virtual std::chrono::milliseconds next_delay(int attempt) const = 0;
};

/** @brief Zero delay; failed entries are retried on the next sync run. */
class NoBackoff final : public BackoffStrategy {
  public:
    [[nodiscard]] std::chrono::milliseconds next_delay(int attempt) const override;
};

/** @brief Capped exponential delay with symmetric random jitter. */
class ExponentialBackoff final : public BackoffStrategy {
  public:
    ExponentialBackoff(std::chrono::milliseconds base, std::chrono::milliseconds max, double jitter_ratio = 0.0);

    [[nodiscard]] std::chrono::milliseconds next_delay(int attempt) const override;

  private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds max_;
    double jitter_ratio_;
    mutable std::mutex mutex_;
    mutable std::mt19937 generator_;
};

/** @brief Build the strategy described by @p config. */
[[nodiscard]] std::shared_ptr<const BackoffStrategy> make_backoff_strategy(const BackoffConfig& config);

/** @brief Configuration spelling of @p kind ("none" / "exponential"). */
[[nodiscard]] std::string_view to_string(BackoffKind kind) noexcept;

}  // namespace offline_sync
