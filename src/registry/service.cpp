#include "minidisc/registry/service.h"
#include "minidisc/base/error_code.h"

using json = nlohmann::json;

namespace minidisc {

void to_json(json& j, const AddrPort& ap) {
    j = ap.to_string();
}

void from_json(const json& j, AddrPort& ap) {
    auto parsed = AddrPort::parse(j.get<std::string>());
    if (!parsed) {
        throw MinidiscError(ErrorCode::ProtocolError, "Invalid address: " + j.dump());
    }
    ap = *parsed;
}

void to_json(json& j, const Service& service) {
    j = json{
        {"name", service.name},
        {"labels", service.labels},
        {"addrPort", service.addr_port}
    };
}

void from_json(const json& j, Service& service) {
    service.name = j.at("name").get<std::string>();
    service.labels.clear();
    if (j.contains("labels") && !j.at("labels").is_null()) {
        service.labels = j.at("labels").get<Labels>();
    }
    service.addr_port = j.at("addrPort").get<AddrPort>();
}

std::string encode_services(const std::vector<Service>& services) {
    json j = json::array();
    for (const auto& service : services) {
        j.push_back(service);
    }
    return j.dump();
}

std::vector<Service> decode_services(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_array()) {
            throw MinidiscError(ErrorCode::ProtocolError, "Expected a JSON array of services");
        }
        return j.get<std::vector<Service>>();
    } catch (const json::exception& e) {
        throw MinidiscError(ErrorCode::ProtocolError, e.what());
    }
}

bool service_matches(const Service& service, const std::string& name, const Labels& label_filter) {
    if (service.name != name) {
        return false;
    }
    for (const auto& [key, value] : label_filter) {
        auto it = service.labels.find(key);
        if (it == service.labels.end() || it->second != value) {
            return false;
        }
    }
    return true;
}

std::string format_labels(const Labels& labels) {
    if (labels.empty()) {
        return "{}";
    }
    std::string out = "{ ";
    bool first = true;
    for (const auto& [key, value] : labels) {
        if (!first) {
            out += ", ";
        }
        out += key + "=" + value;
        first = false;
    }
    out += " }";
    return out;
}

} // namespace minidisc
