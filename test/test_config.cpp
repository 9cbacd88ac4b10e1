#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "CLI/CLI.hpp"
#include "minidisc/base/config.h"
#include "minidisc/base/logger.h"

using namespace minidisc;

namespace {

std::string write_temp_file(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // namespace

TEST_CASE("Config - defaults", "[config]") {
    Config::instance().reset();
    const auto& config = Config::instance().get();

    REQUIRE(config.registry.discovery_port == kDefaultDiscoveryPort);
    REQUIRE(config.registry.retry_backoff_ms == 10000);
    REQUIRE(config.registry.leader_probe_interval_ms == 5000);
    REQUIRE(config.discovery.fetch_timeout_ms == 2000);
    REQUIRE(config.address_source.type == "tailscale");
    REQUIRE(config.address_source.tailscale_socket == "/var/run/tailscale/tailscaled.sock");
    REQUIRE(config.address_source.status_timeout_ms == 500);
    REQUIRE(Config::instance().validate());
}

TEST_CASE("Config - INI file", "[config][file]") {
    Config::instance().reset();
    auto path = write_temp_file("minidisc_test_config.ini",
        "# test config\n"
        "[log]\n"
        "level = debug\n"
        "\n"
        "[registry]\n"
        "discovery_port = 29004\n"
        "retry_backoff_ms = 500\n"
        "\n"
        "[discovery]\n"
        "fetch_timeout_ms = 750\n"
        "\n"
        "[address_source]\n"
        "type = static\n"
        "local_address = \"127.0.0.1\"\n"
        "peer_addresses = 127.0.0.2, 127.0.0.3\n");

    REQUIRE(Config::instance().load_from_file(path));
    const auto& config = Config::instance().get();

    REQUIRE(config.log.level == "debug");
    REQUIRE(config.registry.discovery_port == 29004);
    REQUIRE(config.discovery.discovery_port == 29004);
    REQUIRE(config.registry.retry_backoff_ms == 500);
    REQUIRE(config.discovery.fetch_timeout_ms == 750);
    REQUIRE(config.address_source.type == "static");
    REQUIRE(config.address_source.local_address == "127.0.0.1");
    REQUIRE(config.address_source.peer_addresses == std::vector<std::string>{"127.0.0.2", "127.0.0.3"});
    REQUIRE(Config::instance().get_config_file() == path);
    REQUIRE(Config::instance().validate());

    std::filesystem::remove(path);
}

TEST_CASE("Config - missing or invalid file", "[config][file]") {
    Config::instance().reset();
    REQUIRE_FALSE(Config::instance().load_from_file("/nonexistent/minidisc.ini"));

    auto path = write_temp_file("minidisc_bad_config.ini", "[registry]\ndiscovery_port = lots\n");
    REQUIRE_FALSE(Config::instance().load_from_file(path));
    std::filesystem::remove(path);
}

TEST_CASE("Config - environment variables", "[config][env]") {
    Config::instance().reset();
    setenv("MINIDISC_DISCOVERY_PORT", "29005", 1);
    setenv("MINIDISC_ADDRESS_SOURCE", "static", 1);
    setenv("MINIDISC_LOCAL_ADDRESS", "127.0.0.5", 1);
    setenv("MINIDISC_PEERS", "127.0.0.6,127.0.0.7", 1);

    REQUIRE(Config::instance().load_from_env());
    const auto& config = Config::instance().get();
    REQUIRE(config.registry.discovery_port == 29005);
    REQUIRE(config.discovery.discovery_port == 29005);
    REQUIRE(config.address_source.type == "static");
    REQUIRE(config.address_source.local_address == "127.0.0.5");
    REQUIRE(config.address_source.peer_addresses.size() == 2);

    unsetenv("MINIDISC_DISCOVERY_PORT");
    unsetenv("MINIDISC_ADDRESS_SOURCE");
    unsetenv("MINIDISC_LOCAL_ADDRESS");
    unsetenv("MINIDISC_PEERS");
}

TEST_CASE("Config - command line options", "[config][cli]") {
    Config::instance().reset();
    CLI::App app{"test"};
    Config::instance().register_options(app);

    app.parse("--discovery-port 29006 --address-source static --local-address 127.0.0.8 "
              "--peer 127.0.0.9 --peer 127.0.0.10 --log-level warning", false);
    REQUIRE(Config::instance().finalize_command_line());

    const auto& config = Config::instance().get();
    REQUIRE(config.registry.discovery_port == 29006);
    REQUIRE(config.discovery.discovery_port == 29006);
    REQUIRE(config.address_source.peer_addresses == std::vector<std::string>{"127.0.0.9", "127.0.0.10"});
    REQUIRE(config.log.level == "warning");
    REQUIRE(Config::instance().validate());
}

TEST_CASE("Config - validation", "[config]") {
    Config::instance().reset();
    auto& config = Config::instance().get();

    config.registry.discovery_port = 0;
    REQUIRE_FALSE(Config::instance().validate());

    Config::instance().reset();
    config.discovery.fetch_timeout_ms = 0;
    REQUIRE_FALSE(Config::instance().validate());

    Config::instance().reset();
    config.address_source.type = "static";
    REQUIRE_FALSE(Config::instance().validate());
}

TEST_CASE("Logger - level names", "[logger]") {
    REQUIRE(parse_log_level("debug") == LogLevel::debug);
    REQUIRE(parse_log_level("warn") == LogLevel::warning);
    REQUIRE(parse_log_level("error") == LogLevel::error);
    REQUIRE(parse_log_level("whatever") == LogLevel::info);
    REQUIRE(std::string(log_level_name(LogLevel::warning)) == "WARN");
}

TEST_CASE("Logger - file output", "[logger]") {
    auto path = (std::filesystem::temp_directory_path() / "minidisc_test.log").string();
    std::filesystem::remove(path);

    auto& logger = Logger::instance();
    logger.set_level(LogLevel::info);
    logger.set_file_output(path);
    logger.debug("hidden message");
    logger.info("visible message");
    logger.close_file_output();
    logger.set_output(LogOutput::Stderr);

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content.find("visible message") != std::string::npos);
    REQUIRE(content.find("hidden message") == std::string::npos);

    std::filesystem::remove(path);
}
