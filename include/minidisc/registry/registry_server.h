#ifndef MINIDISC_REGISTRY_REGISTRY_SERVER_H
#define MINIDISC_REGISTRY_REGISTRY_SERVER_H

#include "minidisc/base/logger.h"
#include <elio/elio.hpp>
#include <elio/http/http.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace minidisc {

using RouteHandler = std::function<elio::coro::task<elio::http::response>(elio::http::context&)>;

struct Route {
    elio::http::method method;
    std::string path;
    RouteHandler handler;
};

// HTTP server for the registry protocol, built on elio::http::server.
// Requests to a known path with a method no route accepts get 405 with an
// Allow header; unknown paths get 404.
class RegistryServer {
public:
    ~RegistryServer();

    RegistryServer(const RegistryServer&) = delete;
    RegistryServer& operator=(const RegistryServer&) = delete;

    // Binds address:port (port 0 picks a free port). Returns nullptr if the
    // port cannot be bound. The port stays reserved until shutdown(), so a
    // successful bind of the discovery port is what makes a registry the
    // leader.
    static std::unique_ptr<RegistryServer> bind(const std::string& address,
                                                uint16_t port,
                                                size_t worker_threads = 2,
                                                std::shared_ptr<LogSink> log = null_log_sink());

    // Starts serving the given routes on a private elio scheduler.
    void start(std::vector<Route> routes);

    // Stops accepting, waits up to drain_timeout for in-flight requests,
    // then releases the listening socket. Idle keep-alive connections do
    // not hold up the drain. Idempotent.
    void shutdown(std::chrono::milliseconds drain_timeout);

    // Blocks until the server has stopped serving or timeout elapses.
    // Returns true if the server is no longer serving.
    bool wait_for_exit(std::chrono::milliseconds timeout);

    // True if serving ended on a socket error rather than shutdown().
    bool failed() const;

    bool is_running() const;
    uint16_t port() const;
    const std::string& address() const;

    // Requests currently inside a route handler.
    size_t active_requests() const;

private:
    struct Impl;
    explicit RegistryServer(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace minidisc

#endif // MINIDISC_REGISTRY_REGISTRY_SERVER_H
