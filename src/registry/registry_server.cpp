#include "minidisc/registry/registry_server.h"
#include "minidisc/net/http_client.h"
#include <elio/net/tcp.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

namespace minidisc {

namespace {

constexpr auto kListenExitTimeout = std::chrono::seconds(1);
constexpr auto kWakeTimeout = std::chrono::milliseconds(200);
constexpr auto kStartupTimeout = std::chrono::seconds(1);
constexpr auto kStartupPollInterval = std::chrono::milliseconds(10);

// Counts requests that are inside a route handler. Shared with the route
// wrappers so a handler frame never points at a dead server.
struct RequestTracker {
    std::shared_ptr<LogSink> log;
    std::mutex mutex;
    std::condition_variable cv;
    size_t active = 0;

    void enter() {
        std::lock_guard<std::mutex> lock(mutex);
        ++active;
    }

    void leave() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            --active;
        }
        cv.notify_all();
    }
};

struct TrackerScope {
    std::shared_ptr<RequestTracker> tracker;
    ~TrackerScope() { tracker->leave(); }
};

elio::http::response json_error(int status, const std::string& message) {
    nlohmann::json error = {{"error", message}};
    return elio::http::response(elio::http::status(status), error.dump(),
                                elio::http::mime::application_json);
}

elio::coro::task<elio::http::response> run_tracked(std::shared_ptr<RequestTracker> tracker,
                                                   RouteHandler handler,
                                                   elio::http::context& ctx) {
    tracker->enter();
    TrackerScope scope{tracker};
    std::string path(ctx.req().path());

    try {
        co_return co_await handler(ctx);
    } catch (const std::exception& e) {
        tracker->log->error("Error handling {}: {}", path, e.what());
    }
    co_return json_error(500, "Internal Server Error");
}

elio::coro::task<elio::http::response> method_not_allowed(std::string allow) {
    auto response = json_error(405, "Method Not Allowed");
    response.set_header("Allow", allow);
    co_return response;
}

elio::coro::task<elio::http::response> not_found(elio::http::context&) {
    co_return json_error(404, "Not Found");
}

} // anonymous namespace

struct RegistryServer::Impl {
    std::string address;
    uint16_t port = 0;
    size_t worker_threads = 2;
    std::shared_ptr<LogSink> log;

    // Holds the port from bind() until the HTTP server takes it over.
    std::optional<elio::net::tcp_listener> reservation;
    std::unique_ptr<elio::http::server> http_server;
    std::shared_ptr<elio::runtime::scheduler> scheduler;
    std::shared_ptr<RequestTracker> tracker;

    std::atomic<bool> started{false};
    std::atomic<bool> stopping{false};
    std::atomic<bool> stopped{false};
    std::atomic<bool> failed{false};

    mutable std::mutex state_mutex;
    std::condition_variable state_cv;
    bool listen_exited = false;

    elio::http::router build_router(std::vector<Route> routes) {
        elio::http::router r;
        std::map<std::string, std::string> allowed;

        for (auto& route : routes) {
            auto wrapped = [tracker = tracker, handler = std::move(route.handler)](elio::http::context& ctx) {
                return run_tracked(tracker, handler, ctx);
            };
            std::string& allow = allowed[route.path];
            if (route.method == elio::http::method::GET) {
                r.get(route.path, std::move(wrapped));
                allow += allow.empty() ? "GET" : ", GET";
            } else if (route.method == elio::http::method::POST) {
                r.post(route.path, std::move(wrapped));
                allow += allow.empty() ? "POST" : ", POST";
            } else {
                log->warning("Ignoring route {} {}: only GET and POST are served",
                             std::string(elio::http::method_to_string(route.method)), route.path);
            }
        }

        for (const auto& [path, allow] : allowed) {
            auto reject = [allow = allow](elio::http::context&) { return method_not_allowed(allow); };
            if (allow.find("GET") == std::string::npos) {
                r.get(path, reject);
            }
            if (allow.find("POST") == std::string::npos) {
                r.post(path, reject);
            }
            r.put(path, reject);
            r.del(path, reject);
        }
        return r;
    }

    elio::coro::task<void> serve(elio::net::socket_address bind_addr, elio::net::tcp_options opts) {
        log->debug("Registry server accepting on {}:{}", address, port);
        co_await http_server->listen(bind_addr, opts);

        {
            std::lock_guard<std::mutex> lock(state_mutex);
            listen_exited = true;
        }
        if (!stopping.load()) {
            log->error("Registry server on {}:{} stopped listening", address, port);
            failed = true;
        }
        state_cv.notify_all();
        log->debug("Registry server on {}:{} stopped accepting", address, port);
    }

    // Waits until the HTTP server answers on the port or gives up on it.
    void wait_until_listening() {
        auto deadline = std::chrono::steady_clock::now() + kStartupTimeout;
        while (std::chrono::steady_clock::now() < deadline) {
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                if (listen_exited) {
                    return;
                }
            }
            if (HttpClient::get(address, port, "/", kWakeTimeout).ok()) {
                return;
            }
            std::this_thread::sleep_for(kStartupPollInterval);
        }
        log->warning("Registry server on {}:{} is not answering yet", address, port);
    }

    // elio's server looks at its stop flag between connections; a throwaway
    // connection gets a pending accept to notice it.
    void wake_acceptor() {
        HttpResult wake = HttpClient::get(address, port, "/ping", kWakeTimeout);
        if (!wake.ok()) {
            log->debug("Wake-up connection to {}:{}: {}", address, port, wake.error_message);
        }
    }
};

RegistryServer::RegistryServer(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

RegistryServer::~RegistryServer() {
    shutdown(std::chrono::milliseconds(0));
}

std::unique_ptr<RegistryServer> RegistryServer::bind(const std::string& address,
                                                     uint16_t port,
                                                     size_t worker_threads,
                                                     std::shared_ptr<LogSink> log) {
    if (!log) {
        log = null_log_sink();
    }

    elio::net::tcp_options opts;
    opts.reuse_addr = true;

    auto listener = elio::net::tcp_listener::bind(elio::net::ipv4_address(address, port), opts);
    if (!listener) {
        log->debug("Cannot bind {}:{}: {}", address, port, std::strerror(errno));
        return nullptr;
    }

    auto impl = std::make_unique<Impl>();
    impl->address = address;
    impl->reservation = std::move(*listener);
    impl->port = impl->reservation->local_address().port();
    impl->worker_threads = worker_threads == 0 ? 1 : worker_threads;
    impl->log = log;
    impl->tracker = std::make_shared<RequestTracker>();
    impl->tracker->log = std::move(log);

    return std::unique_ptr<RegistryServer>(new RegistryServer(std::move(impl)));
}

void RegistryServer::start(std::vector<Route> routes) {
    if (impl_->started.exchange(true)) {
        impl_->log->warning("Registry server on port {} already started", impl_->port);
        return;
    }

    // A client hanging up mid-response must not take the process down.
    static std::once_flag ignore_sigpipe;
    std::call_once(ignore_sigpipe, [] { std::signal(SIGPIPE, SIG_IGN); });

    impl_->http_server = std::make_unique<elio::http::server>(impl_->build_router(std::move(routes)));
    impl_->http_server->set_not_found_handler(not_found);

    impl_->scheduler = std::make_shared<elio::runtime::scheduler>(impl_->worker_threads);
    impl_->scheduler->start();

    elio::net::tcp_options opts;
    opts.reuse_addr = true;
    opts.no_delay = true;
    opts.backlog = 64;

    // The HTTP server binds its own listener; hand the reserved port over.
    impl_->reservation->close();
    impl_->reservation = std::nullopt;

    auto serve = impl_->serve(elio::net::socket_address(impl_->address, impl_->port), opts);
    impl_->scheduler->spawn(serve.release());
    impl_->wait_until_listening();

    impl_->log->info("Registry server listening on {}:{}", impl_->address, impl_->port);
}

void RegistryServer::shutdown(std::chrono::milliseconds drain_timeout) {
    if (impl_->stopped.exchange(true)) {
        return;
    }
    impl_->stopping = true;

    if (impl_->started.load()) {
        impl_->http_server->stop();

        bool listening = false;
        {
            std::lock_guard<std::mutex> lock(impl_->state_mutex);
            listening = !impl_->listen_exited;
        }
        if (listening) {
            impl_->wake_acceptor();
        }

        {
            auto& tracker = *impl_->tracker;
            std::unique_lock<std::mutex> lock(tracker.mutex);
            bool drained = tracker.cv.wait_for(lock, drain_timeout, [&tracker] {
                return tracker.active == 0;
            });
            if (!drained) {
                impl_->log->warning("Registry server on port {} shutting down with {} request(s) in flight",
                                    impl_->port, tracker.active);
            }
        }

        {
            std::unique_lock<std::mutex> lock(impl_->state_mutex);
            impl_->state_cv.wait_for(lock, kListenExitTimeout, [this] {
                return impl_->listen_exited;
            });
        }
        impl_->scheduler->shutdown();
        impl_->scheduler.reset();
        impl_->http_server.reset();
    }

    if (impl_->reservation) {
        impl_->reservation->close();
        impl_->reservation = std::nullopt;
    }

    impl_->state_cv.notify_all();
    impl_->log->debug("Registry server on port {} stopped", impl_->port);
}

bool RegistryServer::wait_for_exit(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(impl_->state_mutex);
    return impl_->state_cv.wait_for(lock, timeout, [this] {
        return impl_->listen_exited || impl_->stopped.load();
    });
}

bool RegistryServer::failed() const {
    return impl_->failed.load();
}

bool RegistryServer::is_running() const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->started.load() && !impl_->listen_exited && !impl_->stopped.load();
}

uint16_t RegistryServer::port() const {
    return impl_->port;
}

const std::string& RegistryServer::address() const {
    return impl_->address;
}

size_t RegistryServer::active_requests() const {
    std::lock_guard<std::mutex> lock(impl_->tracker->mutex);
    return impl_->tracker->active;
}

} // namespace minidisc
