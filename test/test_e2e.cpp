#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include "minidisc/base/error_code.h"
#include "minidisc/discovery/address_source.h"
#include "minidisc/discovery/discovery_client.h"
#include "minidisc/registry/registry.h"
#include "test_support.h"

using namespace minidisc;
using namespace std::chrono_literals;

namespace {

constexpr uint16_t kPort = test::kTestDiscoveryPort + 4;

RegistryConfig registry_config() {
    RegistryConfig config;
    config.discovery_port = kPort;
    config.retry_backoff_ms = 200;
    config.leader_probe_interval_ms = 100;
    config.leader_probe_timeout_ms = 300;
    config.drain_timeout_ms = 500;
    return config;
}

DiscoveryConfig discovery_config() {
    DiscoveryConfig config;
    config.discovery_port = kPort;
    config.fetch_timeout_ms = 2000;
    return config;
}

std::shared_ptr<AddressSource> host(const std::string& local, std::vector<std::string> peers = {}) {
    return std::make_shared<StaticAddressSource>(local, std::move(peers));
}

} // namespace

TEST_CASE("E2E_TwoHosts - services on both hosts are discovered", "[e2e][list]") {
    auto foo_host = Registry::start(registry_config(), host("127.0.8.1"));
    auto bar_host = Registry::start(registry_config(), host("127.0.8.2"));
    REQUIRE(foo_host->wait_for_state({RegistryState::Leader}, 5s) == RegistryState::Leader);
    REQUIRE(bar_host->wait_for_state({RegistryState::Leader}, 5s) == RegistryState::Leader);

    foo_host->advertise_service(8001, "foo", {{"version", "1"}});
    bar_host->advertise_service(8002, "bar");

    DiscoveryClient client(host("127.0.8.1", {"127.0.8.2", "127.0.8.99"}), discovery_config());

    auto services = client.list_services();
    REQUIRE(services.size() == 2);
    REQUIRE(services[0] == Service{"foo", {{"version", "1"}}, AddrPort{"127.0.8.1", 8001}});
    REQUIRE(services[1] == Service{"bar", {}, AddrPort{"127.0.8.2", 8002}});

    REQUIRE(client.find_service("bar") == AddrPort{"127.0.8.2", 8002});
    REQUIRE(client.find_service("foo", {{"version", "1"}}) == AddrPort{"127.0.8.1", 8001});
    REQUIRE_THROWS_AS(client.find_service("foo", {{"version", "2"}}), MinidiscError);

    foo_host->unlist_service(8001);
    REQUIRE_THROWS_AS(client.find_service("foo"), MinidiscError);
}

TEST_CASE("E2E_Policy - consumer API reports policy failures", "[e2e][policy]") {
    auto registry = Registry::start(registry_config(), host("127.0.8.3"));
    REQUIRE(registry->local_address() == "127.0.8.3");

    registry->advertise_service(8080, "web");
    REQUIRE_THROWS_AS(registry->advertise_service(8080, "web"), MinidiscError);
    REQUIRE_THROWS_AS(registry->advertise_remote_service(AddrPort{"10.0.0.1", 80}, "x"), MinidiscError);
    REQUIRE_THROWS_AS(registry->unlist_service(9999), MinidiscError);

    registry->advertise_remote_service(AddrPort{"100.64.3.3", 80}, "printer");
    REQUIRE(registry->services().size() == 2);
    registry->unlist_remote_service(AddrPort{"100.64.3.3", 80});
    REQUIRE(registry->services().size() == 1);
}

TEST_CASE("E2E_Delegate - same-host registries share one leader", "[e2e][delegate]") {
    auto leader_log = std::make_shared<test::CapturingLogSink>();
    auto leader = Registry::start(registry_config(), host("127.0.8.4"), leader_log);
    REQUIRE(leader->wait_for_state({RegistryState::Leader}, 5s) == RegistryState::Leader);
    leader->advertise_service(7000, "primary");

    auto delegate = Registry::start(registry_config(), host("127.0.8.4"));
    REQUIRE(delegate->wait_for_state({RegistryState::DelegateServing}, 5s) == RegistryState::DelegateServing);
    delegate->advertise_service(7001, "secondary");

    DiscoveryClient client(host("127.0.8.4"), discovery_config());
    auto services = client.list_services();
    REQUIRE(services.size() == 2);
    REQUIRE(services[0].name == "primary");
    REQUIRE(services[1].name == "secondary");

    // The leader notices the dead delegate on its next query and drops it.
    delegate->stop();
    REQUIRE(delegate->state() == RegistryState::Stopped);

    services = client.list_services();
    REQUIRE(services.size() == 1);
    REQUIRE(services[0].name == "primary");
    REQUIRE(leader_log->contains(LogLevel::info, "is gone"));
}

TEST_CASE("E2E_Fatal - unusable address is reported upward", "[e2e][fatal]") {
    auto registry = Registry::start(registry_config(), host("192.0.2.1"));

    std::atomic<bool> fatal_seen{false};
    registry->set_on_fatal([&](const std::exception_ptr& error) {
        fatal_seen = error != nullptr;
    });

    try {
        registry->wait();
        FAIL("expected bind failure");
    } catch (const MinidiscError& e) {
        REQUIRE(e.code() == ErrorCode::BindFailed);
    }
    REQUIRE(fatal_seen.load());
    REQUIRE(registry->state() == RegistryState::Stopped);
}

TEST_CASE("E2E_AddressSource - start fails without a local address", "[e2e][fatal]") {
    auto source = std::make_shared<TailscaleAddressSource>("/nonexistent/tailscaled.sock", 100ms);
    REQUIRE_THROWS_AS(Registry::start(registry_config(), source), MinidiscError);
}
