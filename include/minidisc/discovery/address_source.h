#ifndef MINIDISC_DISCOVERY_ADDRESS_SOURCE_H
#define MINIDISC_DISCOVERY_ADDRESS_SOURCE_H

#include "minidisc/base/config.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace minidisc {

struct PeerStatus {
    std::string address;
    bool online = false;
};

// Reduced view of the private network: who we are and who else is there.
struct NetworkStatus {
    std::string local_address;
    std::vector<PeerStatus> peers;
};

// Enumerates the hosts of the private network.
class AddressSource {
public:
    virtual ~AddressSource() = default;

    // Throws MinidiscError(AddressSourceError) if the network state cannot
    // be determined.
    virtual NetworkStatus status() = 0;

    // Local address first, then online peers in status order.
    std::vector<std::string> online_addresses();
};

// Queries tailscaled's local API over its unix socket.
class TailscaleAddressSource : public AddressSource {
public:
    explicit TailscaleAddressSource(std::string socket_path,
                                    std::chrono::milliseconds timeout = std::chrono::milliseconds(500));

    NetworkStatus status() override;

    // Parses a /localapi/v0/status document. Throws MinidiscError(AddressSourceError).
    static NetworkStatus parse_status(const std::string& body);

private:
    std::string socket_path_;
    std::chrono::milliseconds timeout_;
};

// Fixed address list; every peer is reported online.
class StaticAddressSource : public AddressSource {
public:
    StaticAddressSource(std::string local_address, std::vector<std::string> peers = {});

    NetworkStatus status() override;

private:
    NetworkStatus status_;
};

// Throws MinidiscError(InvalidArgument) for an unknown source type or a
// static source without a valid local address.
std::shared_ptr<AddressSource> make_address_source(const AddressSourceConfig& config);

} // namespace minidisc

#endif // MINIDISC_DISCOVERY_ADDRESS_SOURCE_H
