#ifndef MINIDISC_NET_HTTP_CLIENT_H
#define MINIDISC_NET_HTTP_CLIENT_H

#include "minidisc/base/error_code.h"
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace minidisc {

struct HttpResult {
    // ConnectionFailed / Timeout: nobody answered.
    // ProtocolError: something answered, but not with HTTP we understand.
    ErrorCode error = ErrorCode::Success;
    std::string error_message;
    int status_code = 0;
    std::unordered_map<std::string, std::string> headers;  // lower-case names
    std::string body;

    bool ok() const { return error == ErrorCode::Success; }
};

// Simple synchronous HTTP/1.1 client using POSIX sockets. Every call opens a
// fresh connection and is bounded by the given timeout end to end. Bodies
// framed by Content-Length, chunked encoding or connection close are read.
class HttpClient {
public:
    static HttpResult request(const std::string& host,
                              uint16_t port,
                              const std::string& method,
                              const std::string& path,
                              const std::string& body,
                              std::chrono::milliseconds timeout);

    // Same over a unix domain socket; host_header is sent as "Host".
    static HttpResult request_unix(const std::string& socket_path,
                                   const std::string& host_header,
                                   const std::string& method,
                                   const std::string& path,
                                   std::chrono::milliseconds timeout);

    static HttpResult get(const std::string& host, uint16_t port, const std::string& path,
                          std::chrono::milliseconds timeout) {
        return request(host, port, "GET", path, "", timeout);
    }

    static HttpResult post(const std::string& host, uint16_t port, const std::string& path,
                           const std::string& body, std::chrono::milliseconds timeout) {
        return request(host, port, "POST", path, body, timeout);
    }
};

} // namespace minidisc

#endif // MINIDISC_NET_HTTP_CLIENT_H
