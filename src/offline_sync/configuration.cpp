// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the offline queue. This implementation provides a narrow interface
// (`ConfigurationLoader`) that transforms raw environment variables into the
// strongly-typed `Configuration` structure consumed by downstream modules.
//
// Responsibilities
// - Enforce defaults and sane bounds for retry budget, delivery timeout,
//   backoff schedule and heartbeat cadence.
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or violates expectations.
// - Shield the rest of the codebase from `std::getenv` lookups by returning a
//   fully-populated configuration object.
//
// Note: This file intentionally avoids reading from disk; callers are expected
// to populate the process environment ahead of time.

#include "offline_sync/configuration.hpp"

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "offline_sync/logging.hpp"

namespace offline_sync {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr std::string_view k_default_database_path{"offline_queue.db"};
constexpr std::int64_t k_default_delivery_timeout_ms{30'000};
constexpr std::int64_t k_default_backoff_base_ms{1'000};
constexpr std::int64_t k_default_backoff_max_ms{60'000};
constexpr std::int64_t k_default_heartbeat_ms{5'000};

std::string parse_string(const char* variable_name, std::string_view fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

std::int64_t parse_positive(const char* variable_name, std::int64_t fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const std::int64_t parsed_value = std::stoll(raw_value);
        if (parsed_value <= 0) {
            get_logger()->warn("{} must be positive; using fallback {}", variable_name, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse integer from {}; using fallback {}", variable_name, fallback);
        return fallback;
    }
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("OFFLINE_SYNC_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    config.log_level = parse_string("OFFLINE_SYNC_LOG_LEVEL", k_default_log_level);
    set_log_level(config.log_level);
    logger->info("Loading configuration from environment");

    config.database_path = parse_string("OFFLINE_SYNC_DB_PATH", k_default_database_path);
    config.sync.max_retries = static_cast<int>(parse_positive("OFFLINE_SYNC_MAX_RETRIES", k_default_max_retries));
    config.sync.delivery_timeout = std::chrono::milliseconds{
        parse_positive("OFFLINE_SYNC_DELIVERY_TIMEOUT_MS", k_default_delivery_timeout_ms)
    };
    config.sync.backoff = load_backoff();
    config.heartbeat_interval = std::chrono::milliseconds{parse_positive("OFFLINE_SYNC_HEARTBEAT_MS", k_default_heartbeat_ms)};

    logger->info(
        "Configuration loaded: database={} max_retries={} delivery_timeout_ms={} backoff={} heartbeat_ms={}",
        config.database_path.string(),
        config.sync.max_retries,
        config.sync.delivery_timeout.count(),
        to_string(config.sync.backoff.kind),
        config.heartbeat_interval.count()
    );

    return config;
}

BackoffConfig ConfigurationLoader::load_backoff() {
    BackoffConfig backoff{};
    const std::string str_kind = parse_string("OFFLINE_SYNC_BACKOFF", "none");
    if (str_kind == "exponential") {
        backoff.kind = BackoffKind::Exponential;
    } else if (str_kind != "none") {
        get_logger()->warn("Unknown backoff policy {}; retrying on the next sync instead", str_kind);
    }
    backoff.base_delay = std::chrono::milliseconds{parse_positive("OFFLINE_SYNC_BACKOFF_BASE_MS", k_default_backoff_base_ms)};
    backoff.max_delay = std::chrono::milliseconds{parse_positive("OFFLINE_SYNC_BACKOFF_MAX_MS", k_default_backoff_max_ms)};
    return backoff;
}

}  // namespace offline_sync
