#include <catch2/catch_test_macros.hpp>
#include <future>
#include "minidisc/net/http_client.h"
#include "minidisc/net/registry_client.h"
#include "minidisc/registry/directory.h"
#include "minidisc/registry/protocol_handler.h"
#include "test_support.h"

using namespace minidisc;
using namespace std::chrono_literals;

namespace {

constexpr const char* kHost = "127.0.5.1";

std::unique_ptr<RegistryServer> serve(RegistryProtocolHandler& handler, size_t worker_threads = 2) {
    auto server = RegistryServer::bind(kHost, 0, worker_threads);
    if (server) {
        server->start(handler.routes());
    }
    return server;
}

HttpResult post_delegate(const RegistryServer& server, const std::string& body) {
    return HttpClient::post(kHost, server.port(), "/add-delegate", body, 2000ms);
}

} // namespace

TEST_CASE("ProtocolHandler - ping", "[handler][ping]") {
    ServiceDirectory dir(kHost);
    RegistryProtocolHandler handler(dir, 500ms);
    auto server = serve(handler);
    REQUIRE(server != nullptr);

    auto response = HttpClient::get(kHost, server->port(), "/ping", 2000ms);
    REQUIRE(response.ok());
    REQUIRE(response.status_code == 200);
    REQUIRE(response.body.empty());
}

TEST_CASE("ProtocolHandler - routing errors", "[handler][routing]") {
    ServiceDirectory dir(kHost);
    RegistryProtocolHandler handler(dir, 500ms);
    auto server = serve(handler);
    REQUIRE(server != nullptr);
    uint16_t port = server->port();

    auto services = HttpClient::post(kHost, port, "/services", "{}", 2000ms);
    REQUIRE(services.status_code == 405);
    REQUIRE(services.headers.at("allow") == "GET");

    auto add = HttpClient::get(kHost, port, "/add-delegate", 2000ms);
    REQUIRE(add.status_code == 405);
    REQUIRE(add.headers.at("allow") == "POST");

    REQUIRE(HttpClient::request(kHost, port, "DELETE", "/ping", "", 2000ms).status_code == 405);
    REQUIRE(HttpClient::get(kHost, port, "/nope", 2000ms).status_code == 404);
}

TEST_CASE("ProtocolHandler - services lists the local directory", "[handler][services]") {
    ServiceDirectory dir(kHost);
    RegistryProtocolHandler handler(dir, 500ms);
    auto server = serve(handler);
    REQUIRE(server != nullptr);
    dir.advertise(AddrPort{kHost, 8080}, "web", {{"env", "prod"}});
    dir.advertise_remote(AddrPort{"100.64.1.2", 22}, "ssh");

    auto response = HttpClient::get(kHost, server->port(), "/services", 2000ms);
    REQUIRE(response.status_code == 200);
    REQUIRE(response.headers.at("content-type").rfind("application/json", 0) == 0);

    auto services = decode_services(response.body);
    REQUIRE(services.size() == 2);
    REQUIRE(services[0].name == "web");
    REQUIRE(services[0].labels.at("env") == "prod");
    REQUIRE(services[1].addr_port == AddrPort{"100.64.1.2", 22});
}

TEST_CASE("ProtocolHandler - add-delegate validation", "[handler][delegate]") {
    auto log = std::make_shared<test::CapturingLogSink>();
    ServiceDirectory dir(kHost);
    RegistryProtocolHandler handler(dir, 500ms, log);
    auto server = serve(handler);
    REQUIRE(server != nullptr);

    SECTION("malformed bodies are rejected") {
        REQUIRE(post_delegate(*server, "garbage").status_code == 400);
        REQUIRE(post_delegate(*server, "{}").status_code == 400);
        REQUIRE(post_delegate(*server, R"({"addrPort": 5})").status_code == 400);
        REQUIRE(post_delegate(*server, R"({"addrPort": "x:1"})").status_code == 400);
        REQUIRE(dir.delegates().empty());
        REQUIRE(log->contains(LogLevel::warning, "Malformed add-delegate request"));
    }

    SECTION("delegates from other hosts are forbidden") {
        REQUIRE(post_delegate(*server, R"({"addrPort": "127.0.5.2:40000"})").status_code == 403);
        REQUIRE(dir.delegates().empty());

        auto refused = RegistryClient::add_delegate(AddrPort{kHost, server->port()},
                                                    AddrPort{"127.0.5.2", 40000}, 2000ms);
        REQUIRE(refused.error == ErrorCode::RegistrationFailed);
    }

    SECTION("registration is idempotent") {
        auto body = R"({"addrPort": "127.0.5.1:40000"})";
        REQUIRE(post_delegate(*server, body).status_code == 200);
        REQUIRE(post_delegate(*server, body).status_code == 200);
        REQUIRE(dir.delegates().size() == 1);
        REQUIRE(dir.delegates()[0] == AddrPort{kHost, 40000});
    }
}

TEST_CASE("ProtocolHandler - delegate services are appended", "[handler][delegate]") {
    auto delegate = test::start_fake_peer(
        kHost, 0, 200, R"([{"name":"worker","labels":{"n":"1"},"addrPort":"127.0.5.1:9001"}])");
    REQUIRE(delegate != nullptr);

    ServiceDirectory dir(kHost);
    RegistryProtocolHandler handler(dir, 1000ms);
    auto server = serve(handler);
    REQUIRE(server != nullptr);
    dir.advertise(AddrPort{kHost, 8080}, "web");
    dir.add_delegate(AddrPort{kHost, delegate->port()});

    auto result = RegistryClient::get_services(AddrPort{kHost, server->port()}, 2000ms);
    REQUIRE(result.ok());
    REQUIRE(result.services.size() == 2);
    REQUIRE(result.services[0].name == "web");
    REQUIRE(result.services[1].name == "worker");
    REQUIRE(dir.delegates().size() == 1);

    server->shutdown(1000ms);
    delegate->shutdown(1000ms);
}

TEST_CASE("ProtocolHandler - unreachable delegate is evicted", "[handler][delegate][eviction]") {
    auto log = std::make_shared<test::CapturingLogSink>();
    ServiceDirectory dir(kHost);
    RegistryProtocolHandler handler(dir, 500ms, log);
    auto server = serve(handler);
    REQUIRE(server != nullptr);
    dir.advertise(AddrPort{kHost, 8080}, "web");

    // Nothing listens here.
    auto gone = RegistryServer::bind(kHost, 0, 1);
    REQUIRE(gone != nullptr);
    AddrPort dead{kHost, gone->port()};
    gone->shutdown(0ms);
    gone.reset();
    dir.add_delegate(dead);

    auto result = RegistryClient::get_services(AddrPort{kHost, server->port()}, 2000ms);
    REQUIRE(result.ok());
    REQUIRE(result.services.size() == 1);
    REQUIRE(dir.delegates().empty());
    REQUIRE(log->contains(LogLevel::info, "is gone"));
}

TEST_CASE("ProtocolHandler - misbehaving delegate is kept", "[handler][delegate]") {
    auto delegate = test::start_fake_peer(kHost, 0, 200, "{not json");
    REQUIRE(delegate != nullptr);

    auto log = std::make_shared<test::CapturingLogSink>();
    ServiceDirectory dir(kHost);
    RegistryProtocolHandler handler(dir, 1000ms, log);
    auto server = serve(handler);
    REQUIRE(server != nullptr);
    dir.add_delegate(AddrPort{kHost, delegate->port()});

    auto result = RegistryClient::get_services(AddrPort{kHost, server->port()}, 2000ms);
    REQUIRE(result.ok());
    REQUIRE(result.services.empty());
    REQUIRE(dir.delegates().size() == 1);
    REQUIRE(log->contains(LogLevel::warning, "Failed to fetch services from delegate"));

    server->shutdown(1000ms);
    delegate->shutdown(1000ms);
}

TEST_CASE("ProtocolHandler - a hung delegate does not starve other requests", "[handler][delegate][concurrency]") {
    // Accepts connections and never answers.
    auto hung = test::RawPeer::listen_tcp(kHost, 0, "");
    REQUIRE(hung != nullptr);

    ServiceDirectory dir(kHost);
    RegistryProtocolHandler handler(dir, 1500ms);
    auto server = serve(handler, 1);
    REQUIRE(server != nullptr);
    dir.add_delegate(AddrPort{kHost, hung->port()});
    uint16_t port = server->port();

    std::vector<std::future<ServicesResult>> listings;
    for (int i = 0; i < 3; ++i) {
        listings.push_back(std::async(std::launch::async, [port] {
            return RegistryClient::get_services(AddrPort{kHost, port}, 5000ms);
        }));
    }
    REQUIRE(test::eventually([&] { return hung->accepted() >= 1; }));

    // Answered while every listing still waits on the delegate.
    auto ping = RegistryClient::ping(AddrPort{kHost, port}, 300ms);
    REQUIRE(ping.ok());
    REQUIRE(server->active_requests() >= 1);

    for (auto& listing : listings) {
        auto result = listing.get();
        REQUIRE(result.ok());
        REQUIRE(result.services.empty());
    }
    REQUIRE(dir.delegates().empty());

    server->shutdown(1000ms);
}
