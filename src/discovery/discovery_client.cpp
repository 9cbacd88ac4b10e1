#include "minidisc/discovery/discovery_client.h"
#include "minidisc/base/error_code.h"
#include "minidisc/discovery/address_source.h"
#include "minidisc/net/registry_client.h"
#include <future>

namespace minidisc {

DiscoveryClient::DiscoveryClient(std::shared_ptr<AddressSource> address_source,
                                 const DiscoveryConfig& config,
                                 std::shared_ptr<LogSink> log)
    : address_source_(std::move(address_source)),
      config_(config),
      log_(log ? std::move(log) : null_log_sink()) {
    if (!address_source_) {
        throw MinidiscError(ErrorCode::InvalidArgument, "DiscoveryClient needs an address source");
    }
}

std::vector<Service> DiscoveryClient::fetch(const std::string& address) {
    const AddrPort registry{address, config_.discovery_port};
    ServicesResult result = RegistryClient::get_services(
        registry, std::chrono::milliseconds(config_.fetch_timeout_ms));

    if (!result.ok()) {
        if (is_connectivity_error(result.error)) {
            log_->debug("No registry at {}: {}", registry.to_string(), result.message);
        } else {
            log_->warning("Bad reply from registry at {}: {}", registry.to_string(), result.message);
        }
        return {};
    }
    return std::move(result.services);
}

std::vector<Service> DiscoveryClient::list_services() {
    std::vector<std::string> addresses = address_source_->online_addresses();

    // One fetch per host, joined in enumeration order.
    std::vector<std::future<std::vector<Service>>> fetches;
    fetches.reserve(addresses.size());
    for (const auto& address : addresses) {
        fetches.push_back(std::async(std::launch::async, [this, address] { return fetch(address); }));
    }

    std::vector<Service> services;
    for (auto& f : fetches) {
        std::vector<Service> part = f.get();
        services.insert(services.end(),
                        std::make_move_iterator(part.begin()),
                        std::make_move_iterator(part.end()));
    }
    return services;
}

AddrPort DiscoveryClient::find_service(const std::string& name, const Labels& label_filter) {
    for (const auto& service : list_services()) {
        if (service_matches(service, name, label_filter)) {
            return service.addr_port;
        }
    }
    throw MinidiscError(ErrorCode::NoMatch,
                        "No service named '" + name + "' with labels " + format_labels(label_filter));
}

} // namespace minidisc
