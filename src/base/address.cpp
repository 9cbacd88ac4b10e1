#include "minidisc/base/address.h"
#include <arpa/inet.h>
#include <cctype>
#include <netinet/in.h>

namespace minidisc {

namespace {

constexpr uint32_t kMemberNetwork = 0x64400000;  // 100.64.0.0
constexpr uint32_t kMemberMask = 0xFFC00000;     // /10

} // anonymous namespace

std::optional<AddrPort> AddrPort::parse(const std::string& text) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }

    std::string address = text.substr(0, colon);
    std::string port_str = text.substr(colon + 1);
    if (!is_valid_ipv4(address) || port_str.size() > 5) {
        return std::nullopt;
    }

    uint32_t port = 0;
    for (char c : port_str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        port = port * 10 + static_cast<uint32_t>(c - '0');
    }
    if (port > 65535) {
        return std::nullopt;
    }

    return AddrPort{address, static_cast<uint16_t>(port)};
}

std::string AddrPort::to_string() const {
    return address + ":" + std::to_string(port);
}

bool is_valid_ipv4(const std::string& address) {
    in_addr addr{};
    return inet_pton(AF_INET, address.c_str(), &addr) == 1;
}

bool is_member_address(const std::string& address) {
    in_addr addr{};
    if (inet_pton(AF_INET, address.c_str(), &addr) != 1) {
        return false;
    }
    return (ntohl(addr.s_addr) & kMemberMask) == kMemberNetwork;
}

} // namespace minidisc
