#include "minidisc/net/registry_client.h"
#include "minidisc/net/http_client.h"
#include <nlohmann/json.hpp>

namespace minidisc {

namespace {

RegistryCallResult check_response(const HttpResult& http) {
    RegistryCallResult result;
    if (!http.ok()) {
        result.error = http.error;
        result.message = http.error_message;
    } else if (http.status_code != 200) {
        result.error = ErrorCode::HttpStatusError;
        result.message = "HTTP " + std::to_string(http.status_code);
        if (!http.body.empty()) {
            result.message += ": " + http.body;
        }
    }
    return result;
}

} // namespace

ServicesResult RegistryClient::get_services(const AddrPort& registry, std::chrono::milliseconds timeout) {
    ServicesResult result;
    HttpResult http = HttpClient::get(registry.address, registry.port, "/services", timeout);
    static_cast<RegistryCallResult&>(result) = check_response(http);
    if (!result.ok()) {
        return result;
    }

    try {
        result.services = decode_services(http.body);
    } catch (const MinidiscError& e) {
        result.error = e.code();
        result.message = e.what();
    }
    return result;
}

RegistryCallResult RegistryClient::add_delegate(const AddrPort& leader, const AddrPort& delegate,
                                                std::chrono::milliseconds timeout) {
    nlohmann::json body;
    body["addrPort"] = delegate.to_string();
    HttpResult http = HttpClient::post(leader.address, leader.port, "/add-delegate", body.dump(), timeout);
    RegistryCallResult result = check_response(http);
    if (result.error == ErrorCode::HttpStatusError) {
        result.error = ErrorCode::RegistrationFailed;
    }
    return result;
}

RegistryCallResult RegistryClient::ping(const AddrPort& registry, std::chrono::milliseconds timeout) {
    return check_response(HttpClient::get(registry.address, registry.port, "/ping", timeout));
}

} // namespace minidisc
