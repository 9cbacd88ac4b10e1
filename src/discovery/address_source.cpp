#include "minidisc/discovery/address_source.h"
#include "minidisc/base/address.h"
#include "minidisc/base/error_code.h"
#include "minidisc/net/http_client.h"
#include <nlohmann/json.hpp>

namespace minidisc {

// Peers are listed in the order tailscaled reports them.
using ordered_json = nlohmann::ordered_json;

namespace {

constexpr const char* kTailscaleHost = "local-tailscaled.sock";
constexpr const char* kTailscaleStatusPath = "/localapi/v0/status";

// Tailscale lists IPv4 and IPv6 addresses; discovery only uses IPv4.
std::string first_ipv4(const ordered_json& ips) {
    if (!ips.is_array()) {
        return {};
    }
    for (const auto& ip : ips) {
        if (ip.is_string() && is_valid_ipv4(ip.get<std::string>())) {
            return ip.get<std::string>();
        }
    }
    return {};
}

} // namespace

std::vector<std::string> AddressSource::online_addresses() {
    NetworkStatus net = status();
    std::vector<std::string> addresses;
    addresses.reserve(net.peers.size() + 1);
    addresses.push_back(net.local_address);
    for (const auto& peer : net.peers) {
        if (peer.online) {
            addresses.push_back(peer.address);
        }
    }
    return addresses;
}

TailscaleAddressSource::TailscaleAddressSource(std::string socket_path, std::chrono::milliseconds timeout)
    : socket_path_(std::move(socket_path)), timeout_(timeout) {}

NetworkStatus TailscaleAddressSource::status() {
    HttpResult http = HttpClient::request_unix(socket_path_, kTailscaleHost, "GET",
                                               kTailscaleStatusPath, timeout_);
    if (!http.ok()) {
        throw MinidiscError(ErrorCode::AddressSourceError,
                            "Cannot reach tailscaled at " + socket_path_ + ": " + http.error_message);
    }
    if (http.status_code != 200) {
        throw MinidiscError(ErrorCode::AddressSourceError,
                            "tailscaled status returned HTTP " + std::to_string(http.status_code));
    }
    return parse_status(http.body);
}

NetworkStatus TailscaleAddressSource::parse_status(const std::string& body) {
    NetworkStatus result;
    try {
        ordered_json doc = ordered_json::parse(body);
        result.local_address = first_ipv4(doc.value("TailscaleIPs", ordered_json::array()));
        if (result.local_address.empty()) {
            throw MinidiscError(ErrorCode::AddressSourceError, "No local IPv4 Tailscale address found");
        }

        auto peers = doc.find("Peer");
        if (peers != doc.end() && peers->is_object()) {
            for (const auto& peer : *peers) {
                std::string address = first_ipv4(peer.value("TailscaleIPs", ordered_json::array()));
                if (address.empty()) {
                    continue;
                }
                result.peers.push_back(PeerStatus{address, peer.value("Online", false)});
            }
        }
    } catch (const ordered_json::exception& e) {
        throw MinidiscError(ErrorCode::AddressSourceError,
                            std::string("Malformed tailscaled status: ") + e.what());
    }
    return result;
}

StaticAddressSource::StaticAddressSource(std::string local_address, std::vector<std::string> peers) {
    status_.local_address = std::move(local_address);
    for (auto& peer : peers) {
        status_.peers.push_back(PeerStatus{std::move(peer), true});
    }
}

NetworkStatus StaticAddressSource::status() {
    return status_;
}

std::shared_ptr<AddressSource> make_address_source(const AddressSourceConfig& config) {
    if (config.type == "tailscale") {
        return std::make_shared<TailscaleAddressSource>(
            config.tailscale_socket, std::chrono::milliseconds(config.status_timeout_ms));
    }
    if (config.type == "static") {
        if (!is_valid_ipv4(config.local_address)) {
            throw MinidiscError(ErrorCode::InvalidArgument,
                                "Static address source needs a valid local address, got '" +
                                    config.local_address + "'");
        }
        for (const auto& peer : config.peer_addresses) {
            if (!is_valid_ipv4(peer)) {
                throw MinidiscError(ErrorCode::InvalidArgument, "Invalid peer address '" + peer + "'");
            }
        }
        return std::make_shared<StaticAddressSource>(config.local_address, config.peer_addresses);
    }
    throw MinidiscError(ErrorCode::InvalidArgument, "Unknown address source type '" + config.type + "'");
}

} // namespace minidisc
