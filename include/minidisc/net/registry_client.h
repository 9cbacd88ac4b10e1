#ifndef MINIDISC_NET_REGISTRY_CLIENT_H
#define MINIDISC_NET_REGISTRY_CLIENT_H

#include "minidisc/base/address.h"
#include "minidisc/base/error_code.h"
#include "minidisc/registry/service.h"
#include <chrono>
#include <string>
#include <vector>

namespace minidisc {

struct RegistryCallResult {
    ErrorCode error = ErrorCode::Success;
    std::string message;

    bool ok() const { return error == ErrorCode::Success; }
};

struct ServicesResult : RegistryCallResult {
    std::vector<Service> services;
};

// Typed client for the registry wire protocol:
//   GET  /services      -> JSON array of services
//   POST /add-delegate  <- {"addrPort": "a.b.c.d:p"}
//   GET  /ping
// Any status other than 200 is reported as HttpStatusError, except that a
// leader refusing add_delegate is RegistrationFailed.
class RegistryClient {
public:
    static ServicesResult get_services(const AddrPort& registry, std::chrono::milliseconds timeout);

    static RegistryCallResult add_delegate(const AddrPort& leader, const AddrPort& delegate,
                                           std::chrono::milliseconds timeout);

    static RegistryCallResult ping(const AddrPort& registry, std::chrono::milliseconds timeout);
};

} // namespace minidisc

#endif // MINIDISC_NET_REGISTRY_CLIENT_H
