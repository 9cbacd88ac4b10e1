#ifndef MINIDISC_REGISTRY_REGISTRY_H
#define MINIDISC_REGISTRY_REGISTRY_H

#include "minidisc/base/address.h"
#include "minidisc/base/config.h"
#include "minidisc/base/logger.h"
#include "minidisc/registry/election.h"
#include "minidisc/registry/service.h"
#include <chrono>
#include <exception>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace minidisc {

class AddressSource;

// A process's participation in discovery: the services it advertises, and
// the leader/delegate server that makes them visible to the network.
//
//   auto registry = Registry::start(config, make_address_source(...));
//   registry->advertise_service(8080, "web", {{"env", "prod"}});
class Registry {
public:
    using FatalCallback = std::function<void(const std::exception_ptr&)>;

    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Captures the local address from address_source and starts the
    // election on a background thread. Throws MinidiscError if the local
    // address cannot be determined.
    static std::unique_ptr<Registry> start(const RegistryConfig& config,
                                           std::shared_ptr<AddressSource> address_source,
                                           std::shared_ptr<LogSink> log = null_log_sink());

    // Advertises a service listening on this host at port.
    void advertise_service(uint16_t port, const std::string& name, const Labels& labels = {});

    // Advertises a service on another private-network host.
    void advertise_remote_service(const AddrPort& addr_port, const std::string& name,
                                  const Labels& labels = {});

    void unlist_service(uint16_t port);
    void unlist_remote_service(const AddrPort& addr_port);

    std::vector<Service> services() const;
    const std::string& local_address() const;

    RegistryState state() const;
    uint16_t serving_port() const;

    // Blocks until the registry reaches one of the given states or timeout
    // elapses. Returns the state it ended in.
    RegistryState wait_for_state(std::initializer_list<RegistryState> states,
                                 std::chrono::milliseconds timeout) const;

    // Called from the election thread if discovery cannot run at all.
    void set_on_fatal(FatalCallback callback);
    void set_on_state_change(ElectionController::StateCallback callback);

    // Stops the election and releases the listening port.
    void stop();

    // Joins the election thread. Rethrows the error that ended it, if any.
    void wait();

private:
    struct Impl;
    explicit Registry(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace minidisc

#endif // MINIDISC_REGISTRY_REGISTRY_H
