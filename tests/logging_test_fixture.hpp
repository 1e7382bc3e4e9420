#pragma once

#include "offline_sync/logging.hpp"

#include <filesystem>
#include <memory>

namespace offline_sync::test {

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "offline_sync_tests_logs";
        auto logger = offline_sync::initialize_logger(log_dir.string());
        logger->set_level(spdlog::level::warn);
        return logger;
    }();
    (void)logger_handle;
}

}  // namespace offline_sync::test
