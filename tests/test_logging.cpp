#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "offline_sync/logging.hpp"

using namespace offline_sync;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    offline_sync::test::ensure_logger_initialized();
    return true;
}();

std::string read_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}
}  // namespace

TEST_CASE("parse_log_level accepts spdlog names and rejects unknown ones") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("chatty").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());
}

TEST_CASE("Logger writes to a file named after the queue") {
    const std::filesystem::path path = log_file_path();
    REQUIRE(path.filename().string() == "offline_sync.log");
    REQUIRE(get_logger()->name() == "offline_sync");
}

TEST_CASE("Warnings reach the log file without an explicit flush") {
    const std::string marker = "delivery-failure-marker-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    get_logger()->error(R"({{"component":"sync","error":"{}"}})", marker);

    const std::string contents = read_file(log_file_path());
    REQUIRE(contents.find(marker) != std::string::npos);
    REQUIRE(contents.find(R"("logger":"offline_sync")") != std::string::npos);
}

TEST_CASE("set_log_level falls back to info on an unknown name") {
    const auto logger = get_logger();
    const auto previous = logger->level();

    set_log_level("chatty");
    REQUIRE(logger->level() == spdlog::level::info);
    set_log_level("error");
    REQUIRE(logger->level() == spdlog::level::err);

    logger->set_level(previous);
}
