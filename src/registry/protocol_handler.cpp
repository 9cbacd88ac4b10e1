#include "minidisc/registry/protocol_handler.h"
#include "minidisc/base/error_code.h"
#include <nlohmann/json.hpp>
#include <future>

namespace minidisc {

using json = nlohmann::json;

namespace {

constexpr auto kFetchPollInterval = std::chrono::milliseconds(5);

elio::http::response error_response(int status, const std::string& message) {
    json error = {{"error", message}};
    return elio::http::response(elio::http::status(status), error.dump(),
                                elio::http::mime::application_json);
}

elio::http::response empty_ok() {
    elio::http::response response;
    response.set_status(elio::http::status::ok);
    return response;
}

elio::coro::task<elio::http::response> handle_ping() {
    co_return empty_ok();
}

} // namespace

RegistryProtocolHandler::RegistryProtocolHandler(ServiceDirectory& directory,
                                                 std::chrono::milliseconds delegate_fetch_timeout,
                                                 std::shared_ptr<LogSink> log)
    : directory_(directory),
      delegate_fetch_timeout_(delegate_fetch_timeout),
      log_(log ? std::move(log) : null_log_sink()) {}

std::vector<Route> RegistryProtocolHandler::routes() {
    std::vector<Route> routes;

    routes.push_back({elio::http::method::GET, "/services", [this](elio::http::context&) {
        return handle_services();
    }});

    routes.push_back({elio::http::method::POST, "/add-delegate", [this](elio::http::context& ctx) {
        auto body = ctx.req().body();
        return handle_add_delegate(std::string(body.begin(), body.end()));
    }});

    routes.push_back({elio::http::method::GET, "/ping", [](elio::http::context&) {
        return handle_ping();
    }});

    return routes;
}

elio::coro::task<elio::http::response> RegistryProtocolHandler::handle_services() {
    // Copy under the lock, fetch without it.
    ServiceDirectory::Snapshot snapshot = directory_.snapshot();
    std::vector<Service> services = std::move(snapshot.services);

    for (const auto& delegate : snapshot.delegates) {
        ServicesResult result = co_await fetch_delegate(delegate);
        if (result.ok()) {
            services.insert(services.end(),
                            std::make_move_iterator(result.services.begin()),
                            std::make_move_iterator(result.services.end()));
            continue;
        }

        if (is_connectivity_error(result.error)) {
            log_->info("Delegate {} is gone ({}), removing it", delegate.to_string(), result.message);
            directory_.remove_delegate(delegate);
        } else {
            log_->warning("Failed to fetch services from delegate {}: {}",
                          delegate.to_string(), result.message);
        }
    }

    std::string body;
    try {
        body = encode_services(services);
    } catch (const json::exception& e) {
        log_->error("Failed to encode services: {}", e.what());
        co_return error_response(500, "Internal Server Error");
    }
    co_return elio::http::response(elio::http::status::ok, body, elio::http::mime::application_json);
}

// The blocking client runs on its own thread; the worker is free while the
// delegate answers or times out.
elio::coro::task<ServicesResult> RegistryProtocolHandler::fetch_delegate(AddrPort delegate) {
    auto timeout = delegate_fetch_timeout_;
    auto pending = std::async(std::launch::async, [delegate, timeout] {
        return RegistryClient::get_services(delegate, timeout);
    });
    while (pending.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        co_await elio::time::sleep_for(kFetchPollInterval);
    }
    co_return pending.get();
}

elio::coro::task<elio::http::response> RegistryProtocolHandler::handle_add_delegate(std::string body) {
    std::optional<AddrPort> delegate;
    try {
        json request = json::parse(body);
        if (request.is_object() && request.contains("addrPort") && request["addrPort"].is_string()) {
            delegate = AddrPort::parse(request["addrPort"].get<std::string>());
        }
    } catch (const json::exception& e) {
        log_->warning("Malformed add-delegate request: {}", e.what());
        co_return error_response(400, "Malformed request body");
    }

    if (!delegate) {
        log_->warning("Malformed add-delegate request: missing or invalid addrPort");
        co_return error_response(400, "Malformed request body");
    }

    if (delegate->address != directory_.local_address()) {
        log_->warning("Rejecting delegate {}: not on this host", delegate->to_string());
        co_return error_response(403, "Delegate must be on the same host");
    }

    if (directory_.add_delegate(*delegate)) {
        log_->info("Registered delegate {}", delegate->to_string());
    }
    co_return empty_ok();
}

} // namespace minidisc
