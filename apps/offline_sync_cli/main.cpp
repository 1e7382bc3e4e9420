#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "offline_sync/configuration.hpp"
#include "offline_sync/logging.hpp"
#include "offline_sync/offline_sync_service.hpp"
#include "offline_sync/sqlite_queue_store.hpp"
#include "offline_sync/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

void print_usage() {
    std::cerr << "offline_sync_cli " << offline_sync::k_version << "\n"
              << "usage: offline_sync_cli <command> [args]\n"
              << "  enqueue <chat> <text>   queue a message\n"
              << "  list [chat]             show pending messages\n"
              << "  failed [chat]           show messages that exhausted their retries\n"
              << "  count [chat]            number of pending messages\n"
              << "  sync                    deliver pending messages now\n"
              << "  retry <id>              give a failed message a fresh retry budget\n"
              << "  remove <id>             delete one message\n"
              << "  clear <chat>            delete every message of a chat\n"
              << "  clear-all               delete everything\n"
              << "  watch                   deliver whenever the outbox directory is reachable\n";
}

/**
 * @brief Loopback transport: appends each payload to the outbox file.
 *
 * The outbox directory stands in for the backend; removing it makes every
 * delivery fail and the heartbeat probe report offline.
 */
offline_sync::DeliveryFunction make_outbox_delivery(const std::filesystem::path& outbox_path) {
    return [outbox_path](const std::string& chat_id, const offline_sync::Payload& payload) {
        if (!std::filesystem::is_directory(outbox_path.parent_path())) {
            return offline_sync::DeliveryResult{false, std::nullopt, "outbox unreachable"};
        }
        std::ofstream outbox(outbox_path, std::ios::app);
        if (!outbox) {
            return offline_sync::DeliveryResult{false, std::nullopt, "cannot open outbox"};
        }
        const auto delivered_at = offline_sync::now_epoch_ms();
        outbox << delivered_at << '\t' << chat_id << '\t' << offline_sync::payload_to_string(payload) << '\n';
        return offline_sync::DeliveryResult{true, fmt::format("{}-{}", chat_id, delivered_at), {}};
    };
}

void print_entries(const std::vector<offline_sync::QueuedMessage>& entries) {
    for (const auto& entry : entries) {
        std::cout << fmt::format(
            "{}\t{}\t{}\t{}/{}\t{}\t{}\n",
            entry.id,
            entry.chat_id,
            offline_sync::to_string(entry.status),
            entry.retry_count,
            entry.max_retries,
            entry.last_error.value_or("-"),
            offline_sync::payload_to_string(entry.payload)
        );
    }
}

std::optional<std::string> optional_argument(const std::vector<std::string>& arguments, std::size_t index) {
    if (index < arguments.size()) {
        return arguments[index];
    }
    return std::nullopt;
}

const std::string& required_argument(const std::vector<std::string>& arguments, std::size_t index, const char* name) {
    if (index >= arguments.size()) {
        throw std::invalid_argument(fmt::format("missing argument <{}>", name));
    }
    return arguments[index];
}

offline_sync::QueueId parse_queue_id(const std::string& raw_value) {
    try {
        return std::stoll(raw_value);
    } catch (const std::exception&) {
        throw std::invalid_argument("queue id must be an integer: " + raw_value);
    }
}

int run_watch(offline_sync::OfflineSyncService& service, offline_sync::HeartbeatConnectivityProbe& probe) {
    auto logger = offline_sync::get_logger();
    auto subscription = service.subscribe([&logger](const offline_sync::QueueEvent& event) {
        logger->info("event {} chat={} synced={} failed={}",
                     offline_sync::to_string(event.type),
                     event.chat_id,
                     event.success_count,
                     event.failed_count);
    });

    service.start();
    while (!should_terminate.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    service.stop();
    probe.stop();
    return EXIT_SUCCESS;
}

int run_command(const std::vector<std::string>& arguments, const offline_sync::Configuration& configuration) {
    using namespace offline_sync;

    const std::string& command = arguments.front();
    const std::filesystem::path outbox_path = configuration.database_path.string() + ".outbox.d/outbox.log";

    SyncConfig sync_config = configuration.sync;
    sync_config.auto_sync = command == "watch";

    std::error_code error_directory;
    std::filesystem::create_directories(outbox_path.parent_path(), error_directory);
    if (error_directory) {
        get_logger()->warn("Cannot create outbox directory {}: {}", outbox_path.parent_path().string(), error_directory.message());
    }

    HeartbeatConnectivityProbe probe{
        [outbox_dir = outbox_path.parent_path()]() { return std::filesystem::is_directory(outbox_dir); },
        configuration.heartbeat_interval
    };
    probe.start();
    if (command != "watch") {
        // One-shot commands keep the first reading instead of polling.
        probe.stop();
    }

    OfflineSyncService service{
        std::make_unique<SqliteQueueStore>(configuration.database_path),
        probe,
        make_outbox_delivery(outbox_path),
        sync_config
    };

    if (command == "watch") {
        return run_watch(service, probe);
    }

    service.start();

    if (command == "enqueue") {
        const std::string& chat_id = required_argument(arguments, 1, "chat");
        const std::string& text = required_argument(arguments, 2, "text");
        std::cout << service.enqueue(chat_id, make_payload(text)) << '\n';
    } else if (command == "list") {
        print_entries(service.queued_messages(optional_argument(arguments, 1)));
    } else if (command == "failed") {
        print_entries(service.failed_messages(optional_argument(arguments, 1)));
    } else if (command == "count") {
        std::cout << service.queue_count(optional_argument(arguments, 1)) << '\n';
    } else if (command == "sync") {
        const SyncResult result = service.sync_queue();
        if (!result.success) {
            std::cout << fmt::format("sync skipped: {} {}\n", to_string(result.reason), result.error);
            return EXIT_FAILURE;
        }
        std::cout << fmt::format("synced={} failed={}\n", result.synced, result.failed);
    } else if (command == "retry") {
        const QueueId queue_id = parse_queue_id(required_argument(arguments, 1, "id"));
        std::cout << (service.retry_failed(queue_id) ? "requeued" : "already pending") << '\n';
    } else if (command == "remove") {
        const QueueId queue_id = parse_queue_id(required_argument(arguments, 1, "id"));
        std::cout << (service.remove(queue_id) ? "removed" : "not found") << '\n';
    } else if (command == "clear") {
        std::cout << "cleared=" << service.clear_chat_queue(required_argument(arguments, 1, "chat")) << '\n';
    } else if (command == "clear-all") {
        std::cout << "cleared=" << service.clear_all_queues() << '\n';
    } else {
        print_usage();
        return EXIT_FAILURE;
    }

    service.stop();
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace offline_sync;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    const std::vector<std::string> arguments(argv + 1, argv + argc);
    if (arguments.empty()) {
        print_usage();
        return EXIT_FAILURE;
    }

    try {
        const Configuration configuration = ConfigurationLoader::load();
        return run_command(arguments, configuration);
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }
}
