#include "minidisc/registry/directory.h"
#include "minidisc/base/error_code.h"
#include <algorithm>

namespace minidisc {

ServiceDirectory::ServiceDirectory(std::string local_address, std::shared_ptr<LogSink> log)
    : local_address_(std::move(local_address)),
      log_(log ? std::move(log) : null_log_sink()) {}

void ServiceDirectory::advertise(const AddrPort& addr_port, const std::string& name, const Labels& labels) {
    add_service(addr_port, name, labels);
}

void ServiceDirectory::advertise_remote(const AddrPort& addr_port, const std::string& name, const Labels& labels) {
    if (!is_member_address(addr_port.address)) {
        throw MinidiscError(ErrorCode::NonMemberAddress, addr_port.to_string());
    }
    add_service(addr_port, name, labels);
}

void ServiceDirectory::add_service(const AddrPort& addr_port, const std::string& name, const Labels& labels) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& service : local_services_) {
            if (service.addr_port == addr_port) {
                throw MinidiscError(ErrorCode::DuplicateAddress,
                                    "Address " + addr_port.to_string() + " already registered");
            }
        }
        local_services_.push_back(Service{name, labels, addr_port});
    }
    log_->info("Advertising new service. Name: {}, labels: {}, address: {}",
               name, format_labels(labels), addr_port.to_string());
}

void ServiceDirectory::unlist(uint16_t port) {
    unlist_remote(AddrPort{local_address_, port});
}

void ServiceDirectory::unlist_remote(const AddrPort& addr_port) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(local_services_.begin(), local_services_.end(),
                               [&](const Service& s) { return s.addr_port == addr_port; });
        if (it == local_services_.end()) {
            throw MinidiscError(ErrorCode::NotFound, "No service at " + addr_port.to_string());
        }
        local_services_.erase(it);
    }
    log_->info("Unlisted service at {}", addr_port.to_string());
}

std::vector<Service> ServiceDirectory::services() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_services_;
}

std::vector<AddrPort> ServiceDirectory::delegates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delegates_;
}

ServiceDirectory::Snapshot ServiceDirectory::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Snapshot{local_services_, delegates_};
}

bool ServiceDirectory::add_delegate(const AddrPort& delegate) {
    if (delegate.address != local_address_) {
        throw MinidiscError(ErrorCode::InvalidArgument,
                            "Delegate " + delegate.to_string() + " is not on this host");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(delegates_.begin(), delegates_.end(), delegate) != delegates_.end()) {
        return false;
    }
    delegates_.push_back(delegate);
    return true;
}

bool ServiceDirectory::remove_delegate(const AddrPort& delegate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::remove(delegates_.begin(), delegates_.end(), delegate);
    if (it == delegates_.end()) {
        return false;
    }
    delegates_.erase(it, delegates_.end());
    return true;
}

} // namespace minidisc
