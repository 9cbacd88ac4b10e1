#ifndef MINIDISC_BASE_ADDRESS_H
#define MINIDISC_BASE_ADDRESS_H

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace minidisc {

// An IPv4 address plus TCP port, e.g. "100.101.102.103:28004".
struct AddrPort {
    std::string address;
    uint16_t port = 0;

    // Parses "a.b.c.d:port". Returns nullopt for anything else.
    static std::optional<AddrPort> parse(const std::string& text);

    std::string to_string() const;

    bool operator==(const AddrPort& other) const {
        return address == other.address && port == other.port;
    }
    bool operator!=(const AddrPort& other) const { return !(*this == other); }
    bool operator<(const AddrPort& other) const {
        return std::tie(address, port) < std::tie(other.address, other.port);
    }
};

bool is_valid_ipv4(const std::string& address);

// True if the address lies in the private network's range, 100.64.0.0/10.
bool is_member_address(const std::string& address);

} // namespace minidisc

#endif // MINIDISC_BASE_ADDRESS_H
