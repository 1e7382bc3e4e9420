#include "offline_sync/types.hpp"

namespace offline_sync {

EpochMillis now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(SystemClock::now().time_since_epoch()).count();
}

TimePoint to_time_point(EpochMillis epoch_ms) {
    return TimePoint{std::chrono::duration_cast<SystemClock::duration>(std::chrono::milliseconds{epoch_ms})};
}

std::string_view to_string(QueueStatus status) noexcept {
    switch (status) {
        case QueueStatus::Pending:
            return "pending";
        case QueueStatus::Failed:
            return "failed";
    }
    return "pending";
}

std::optional<QueueStatus> parse_queue_status(std::string_view text) noexcept {
    if (text == "pending") {
        return QueueStatus::Pending;
    }
    if (text == "failed") {
        return QueueStatus::Failed;
    }
    return std::nullopt;
}

Payload make_payload(std::string_view text) {
    return Payload(text.begin(), text.end());
}

std::string payload_to_string(const Payload& payload) {
    return std::string(payload.begin(), payload.end());
}

}  // namespace offline_sync
