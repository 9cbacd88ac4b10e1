#ifndef MINIDISC_REGISTRY_PROTOCOL_HANDLER_H
#define MINIDISC_REGISTRY_PROTOCOL_HANDLER_H

#include "minidisc/base/logger.h"
#include "minidisc/net/registry_client.h"
#include "minidisc/registry/directory.h"
#include "minidisc/registry/registry_server.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace minidisc {

// Answers the registry wire protocol on behalf of one ServiceDirectory:
//   GET  /services      local services followed by each delegate's services
//   POST /add-delegate  register a same-host delegate
//   GET  /ping          liveness
// Handlers run concurrently on the server's workers. Must outlive every
// server started with routes().
class RegistryProtocolHandler {
public:
    RegistryProtocolHandler(ServiceDirectory& directory,
                            std::chrono::milliseconds delegate_fetch_timeout,
                            std::shared_ptr<LogSink> log = null_log_sink());

    std::vector<Route> routes();

private:
    elio::coro::task<elio::http::response> handle_services();
    elio::coro::task<elio::http::response> handle_add_delegate(std::string body);
    elio::coro::task<ServicesResult> fetch_delegate(AddrPort delegate);

    ServiceDirectory& directory_;
    std::chrono::milliseconds delegate_fetch_timeout_;
    std::shared_ptr<LogSink> log_;
};

} // namespace minidisc

#endif // MINIDISC_REGISTRY_PROTOCOL_HANDLER_H
