#ifndef MINIDISC_REGISTRY_DIRECTORY_H
#define MINIDISC_REGISTRY_DIRECTORY_H

#include "minidisc/base/address.h"
#include "minidisc/base/logger.h"
#include "minidisc/registry/service.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace minidisc {

// In-memory list of the services this registry advertises, plus (when the
// registry leads) the same-host delegates whose services it also reports.
// All methods are thread-safe.
class ServiceDirectory {
public:
    struct Snapshot {
        std::vector<Service> services;
        std::vector<AddrPort> delegates;
    };

    explicit ServiceDirectory(std::string local_address,
                              std::shared_ptr<LogSink> log = null_log_sink());

    const std::string& local_address() const { return local_address_; }

    // Throws MinidiscError(DuplicateAddress) if addr_port is already listed.
    void advertise(const AddrPort& addr_port, const std::string& name, const Labels& labels = {});

    // As advertise(), for services that cannot run a registry themselves.
    // Throws MinidiscError(NonMemberAddress) for addresses outside the
    // private network.
    void advertise_remote(const AddrPort& addr_port, const std::string& name, const Labels& labels = {});

    // Removes the local service at port. Throws MinidiscError(NotFound).
    void unlist(uint16_t port);

    // Removes a service listed with advertise_remote(). Throws MinidiscError(NotFound).
    void unlist_remote(const AddrPort& addr_port);

    std::vector<Service> services() const;
    std::vector<AddrPort> delegates() const;
    Snapshot snapshot() const;

    // Delegate bookkeeping, used by the protocol handler only.
    // add_delegate returns false for an already known delegate and throws
    // MinidiscError(InvalidArgument) if the address is not local_address().
    bool add_delegate(const AddrPort& delegate);
    bool remove_delegate(const AddrPort& delegate);

private:
    void add_service(const AddrPort& addr_port, const std::string& name, const Labels& labels);

    const std::string local_address_;
    std::shared_ptr<LogSink> log_;

    mutable std::mutex mutex_;
    std::vector<Service> local_services_;
    std::vector<AddrPort> delegates_;
};

} // namespace minidisc

#endif // MINIDISC_REGISTRY_DIRECTORY_H
