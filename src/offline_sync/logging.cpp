#include "offline_sync/logging.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace offline_sync {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
std::filesystem::path path_active_log_file;
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};

std::vector<spdlog::sink_ptr> make_sinks(const std::filesystem::path& path_log_file) {
    // The CLI prints queue listings on stdout; diagnostics stay on stderr.
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%l] %v");

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path_log_file.string(),
        k_max_file_size_bytes,
        k_max_files
    );
    file_sink->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","logger":"%n","thread":%t,"msg":%v})");
    return {console_sink, file_sink};
}
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(
        logger_once_flag,
        [&log_directory]() {
            const std::filesystem::path path_log_dir{log_directory};
            std::error_code error_directory;
            std::filesystem::create_directories(path_log_dir, error_directory);
            if (error_directory) {
                throw std::runtime_error("Unable to create log directory at " + path_log_dir.string());
            }

            const std::filesystem::path path_log_file = path_log_dir / (std::string{k_logger_name} + ".log");
            const auto sinks = make_sinks(path_log_file);
            shared_logger = std::make_shared<spdlog::logger>(k_logger_name, sinks.begin(), sinks.end());
            shared_logger->set_level(spdlog::level::info);
            shared_logger->flush_on(spdlog::level::warn);
            spdlog::register_logger(shared_logger);
            path_active_log_file = path_log_file;
        }
    );
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

std::filesystem::path log_file_path() {
    return path_active_log_file;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str_level) {
    const auto level = spdlog::level::from_str(str_level);
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && str_level != "off") {
        return std::nullopt;
    }
    return level;
}

void set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return;
    }
    const auto level = parse_log_level(str_level);
    if (!level) {
        shared_logger->warn("Unknown log level {}; defaulting to info", str_level);
        shared_logger->set_level(spdlog::level::info);
        return;
    }
    shared_logger->set_level(*level);
}

}  // namespace offline_sync
