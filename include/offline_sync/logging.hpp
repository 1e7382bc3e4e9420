// === Logging =================================================================
//
// One process-wide spdlog logger shared by the queue, the sync engine and the
// CLI. Diagnostics go to stderr (stdout carries CLI results) and to a rotating
// JSON-lines file. Warnings and above are flushed at once so a failed delivery
// is on disk even if the process dies right after.

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace offline_sync {

/** @brief Name of the shared logger and stem of its log file. */
inline constexpr const char* k_logger_name{"offline_sync"};

/**
 * @brief Create the shared logger on first call; later calls return it.
 * @throws std::runtime_error if the log directory cannot be created.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @throws std::runtime_error before initialize_logger has run. */
std::shared_ptr<spdlog::logger> get_logger();

/** @brief File the shared logger writes to; empty before initialization. */
[[nodiscard]] std::filesystem::path log_file_path();

/** @brief Strict level lookup; unknown names yield nullopt instead of off. */
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str_level);

void set_log_level(const std::string& str_level);

}  // namespace offline_sync
