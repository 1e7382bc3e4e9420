#include "offline_sync/backoff_strategy.hpp"

#include <algorithm>
#include <cstdint>

namespace offline_sync {

namespace {
// Beyond this shift the delay is far past any sane cap.
constexpr int k_max_exponent{30};
}  // namespace

std::chrono::milliseconds NoBackoff::next_delay(int) const {
    return std::chrono::milliseconds{0};
}

ExponentialBackoff::ExponentialBackoff(std::chrono::milliseconds base, std::chrono::milliseconds max, double jitter_ratio)
    : base_(base),
      max_(std::max(base, max)),
      jitter_ratio_(std::clamp(jitter_ratio, 0.0, 1.0)),
      generator_(std::random_device{}()) {}

std::chrono::milliseconds ExponentialBackoff::next_delay(int attempt) const {
    const int exponent = std::clamp(attempt - 1, 0, k_max_exponent);
    const std::int64_t raw_delay = base_.count() * (std::int64_t{1} << exponent);
    const std::int64_t delay = std::min(raw_delay, static_cast<std::int64_t>(max_.count()));
    if (jitter_ratio_ <= 0.0) {
        return std::chrono::milliseconds{delay};
    }

    const double spread = static_cast<double>(delay) * jitter_ratio_;
    std::uniform_real_distribution<double> distribution(-spread, spread);
    double jitter = 0.0;
    {
        std::scoped_lock lock(mutex_);
        jitter = distribution(generator_);
    }
    const auto jittered = static_cast<std::int64_t>(static_cast<double>(delay) + jitter);
    return std::chrono::milliseconds{std::max<std::int64_t>(0, jittered)};
}

std::shared_ptr<const BackoffStrategy> make_backoff_strategy(const BackoffConfig& config) {
    switch (config.kind) {
        case BackoffKind::Exponential:
            return std::make_shared<ExponentialBackoff>(config.base_delay, config.max_delay, config.jitter_ratio);
        case BackoffKind::None:
            break;
    }
    return std::make_shared<NoBackoff>();
}

std::string_view to_string(BackoffKind kind) noexcept {
    return kind == BackoffKind::Exponential ? "exponential" : "none";
}

}  // namespace offline_sync
