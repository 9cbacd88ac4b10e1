#ifndef MINIDISC_DISCOVERY_DISCOVERY_CLIENT_H
#define MINIDISC_DISCOVERY_DISCOVERY_CLIENT_H

#include "minidisc/base/address.h"
#include "minidisc/base/config.h"
#include "minidisc/base/logger.h"
#include "minidisc/registry/service.h"
#include <memory>
#include <string>
#include <vector>

namespace minidisc {

class AddressSource;

// Finds services by asking the registry on every online host.
class DiscoveryClient {
public:
    DiscoveryClient(std::shared_ptr<AddressSource> address_source,
                    const DiscoveryConfig& config = {},
                    std::shared_ptr<LogSink> log = null_log_sink());

    // Queries all online hosts concurrently. Results are concatenated in
    // address enumeration order (local host first), whatever order the
    // replies arrive in. Hosts that do not answer, or answer garbage, are
    // skipped. Throws only if the address source fails.
    std::vector<Service> list_services();

    // First service, in list_services() order, named name whose labels
    // include every entry of label_filter. Throws MinidiscError(NoMatch).
    AddrPort find_service(const std::string& name, const Labels& label_filter = {});

private:
    std::vector<Service> fetch(const std::string& address);

    std::shared_ptr<AddressSource> address_source_;
    DiscoveryConfig config_;
    std::shared_ptr<LogSink> log_;
};

} // namespace minidisc

#endif // MINIDISC_DISCOVERY_DISCOVERY_CLIENT_H
