#ifndef MINIDISC_REGISTRY_SERVICE_H
#define MINIDISC_REGISTRY_SERVICE_H

#include "minidisc/base/address.h"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace minidisc {

using Labels = std::map<std::string, std::string>;

// A network service advertised on the private network.
struct Service {
    std::string name;
    Labels labels;
    AddrPort addr_port;

    bool operator==(const Service& other) const {
        return name == other.name && labels == other.labels && addr_port == other.addr_port;
    }
    bool operator!=(const Service& other) const { return !(*this == other); }
};

// Wire format: {"name": "...", "labels": {...}, "addrPort": "a.b.c.d:p"}.
// A null or missing "labels" decodes to an empty map.
void to_json(nlohmann::json& j, const AddrPort& ap);
void from_json(const nlohmann::json& j, AddrPort& ap);
void to_json(nlohmann::json& j, const Service& service);
void from_json(const nlohmann::json& j, Service& service);

// Throws nlohmann::json::exception if the data cannot be encoded.
std::string encode_services(const std::vector<Service>& services);

// Throws MinidiscError(ProtocolError) on malformed input.
std::vector<Service> decode_services(const std::string& body);

// True iff the name matches and every filter label is present on the
// service with an equal value. Extra service labels are ignored.
bool service_matches(const Service& service, const std::string& name, const Labels& label_filter);

// "{}" or "{ a=1, b=2 }" with keys sorted.
std::string format_labels(const Labels& labels);

} // namespace minidisc

#endif // MINIDISC_REGISTRY_SERVICE_H
