#include <catch2/catch_test_macros.hpp>
#include "minidisc/base/error_code.h"
#include "minidisc/registry/service.h"

using namespace minidisc;

TEST_CASE("Service JSON - wire format", "[service][json]") {
    Service s{"web", {{"env", "prod"}}, AddrPort{"100.64.0.1", 8080}};
    auto j = nlohmann::json::parse(encode_services({s}));

    REQUIRE(j.is_array());
    REQUIRE(j.size() == 1);
    REQUIRE(j[0]["name"] == "web");
    REQUIRE(j[0]["labels"]["env"] == "prod");
    REQUIRE(j[0]["addrPort"] == "100.64.0.1:8080");
}

TEST_CASE("Service JSON - empty list encodes as array", "[service][json]") {
    REQUIRE(encode_services({}) == "[]");
}

TEST_CASE("Service JSON - null or missing labels become empty", "[service][json]") {
    auto services = decode_services(
        R"([{"name":"a","labels":null,"addrPort":"100.64.0.1:1"},)"
        R"( {"name":"b","addrPort":"100.64.0.1:2"}])");

    REQUIRE(services.size() == 2);
    REQUIRE(services[0].labels.empty());
    REQUIRE(services[1].labels.empty());
    REQUIRE(services[1].addr_port.port == 2);
}

TEST_CASE("Service JSON - malformed input is a protocol error", "[service][json]") {
    auto require_protocol_error = [](const std::string& body) {
        try {
            decode_services(body);
            FAIL("expected MinidiscError for " << body);
        } catch (const MinidiscError& e) {
            REQUIRE(e.code() == ErrorCode::ProtocolError);
        }
    };

    require_protocol_error("not json");
    require_protocol_error(R"({"name":"a"})");
    require_protocol_error(R"([{"labels":{},"addrPort":"100.64.0.1:1"}])");
    require_protocol_error(R"([{"name":"a","addrPort":"somewhere"}])");
    require_protocol_error(R"([{"name":"a","addrPort":12}])");
    require_protocol_error(R"([{"name":"a","labels":{"k":1},"addrPort":"100.64.0.1:1"}])");
}

TEST_CASE("Service matching - labels are a superset of the filter", "[service][match]") {
    Service s{"db", {{"env", "prod"}, {"shard", "3"}}, AddrPort{"100.64.0.2", 5432}};

    REQUIRE(service_matches(s, "db", {}));
    REQUIRE(service_matches(s, "db", {{"env", "prod"}}));
    REQUIRE(service_matches(s, "db", {{"env", "prod"}, {"shard", "3"}}));

    REQUIRE_FALSE(service_matches(s, "web", {}));
    REQUIRE_FALSE(service_matches(s, "db", {{"env", "dev"}}));
    REQUIRE_FALSE(service_matches(s, "db", {{"region", "eu"}}));
    REQUIRE_FALSE(service_matches(s, "db", {{"env", "prod"}, {"shard", "3"}, {"x", "y"}}));
}

TEST_CASE("Service labels - formatting", "[service]") {
    REQUIRE(format_labels({}) == "{}");
    REQUIRE(format_labels({{"b", "2"}, {"a", "1"}}) == "{ a=1, b=2 }");
}
