#include "minidisc/net/http_client.h"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <optional>
#include <sstream>
#include <unordered_map>

// Socket includes
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace minidisc {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kMaxResponseSize = 4 * 1024 * 1024;

HttpResult failure(ErrorCode code, const std::string& message) {
    HttpResult result;
    result.error = code;
    result.error_message = message;
    return result;
}

// Owns a socket descriptor for the lifetime of one request.
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Waits for fd to become ready for `events`. Returns Success, Timeout or
// ConnectionFailed.
ErrorCode wait_ready(int fd, short events, Clock::time_point deadline) {
    while (true) {
        int left = remaining_ms(deadline);
        if (left == 0) {
            return ErrorCode::Timeout;
        }
        pollfd pfd{fd, events, 0};
        int rc = poll(&pfd, 1, left);
        if (rc > 0) {
            return ErrorCode::Success;
        }
        if (rc == 0) {
            return ErrorCode::Timeout;
        }
        if (errno != EINTR) {
            return ErrorCode::ConnectionFailed;
        }
    }
}

HttpResult connect_with_deadline(int fd, const sockaddr* addr, socklen_t len,
                                 Clock::time_point deadline) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return failure(ErrorCode::ConnectionFailed, "Failed to configure socket");
    }

    if (connect(fd, addr, len) < 0) {
        if (errno != EINPROGRESS) {
            return failure(ErrorCode::ConnectionFailed, std::string("Failed to connect: ") + strerror(errno));
        }
        auto ready = wait_ready(fd, POLLOUT, deadline);
        if (ready != ErrorCode::Success) {
            return failure(ready, "Connect did not complete");
        }
        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len);
        if (so_error != 0) {
            return failure(ErrorCode::ConnectionFailed, std::string("Failed to connect: ") + strerror(so_error));
        }
    }
    return HttpResult{};
}

HttpResult send_all(int fd, const std::string& data, Clock::time_point deadline) {
    size_t sent_total = 0;
    while (sent_total < data.size()) {
        ssize_t sent = send(fd, data.data() + sent_total, data.size() - sent_total, MSG_NOSIGNAL);
        if (sent > 0) {
            sent_total += static_cast<size_t>(sent);
            continue;
        }
        if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            auto ready = wait_ready(fd, POLLOUT, deadline);
            if (ready != ErrorCode::Success) {
                return failure(ready, "Failed to send request");
            }
            continue;
        }
        return failure(ErrorCode::ConnectionFailed, std::string("Failed to send request: ") + strerror(errno));
    }
    return HttpResult{};
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

struct ResponseHead {
    int status_code = 0;
    std::unordered_map<std::string, std::string> headers;  // lower-case keys
};

bool parse_head(const std::string& head, ResponseHead& out) {
    std::istringstream lines(head);
    std::string status_line;
    std::getline(lines, status_line);
    if (status_line.rfind("HTTP/", 0) != 0) {
        return false;
    }
    size_t pos = status_line.find(' ');
    if (pos == std::string::npos) {
        return false;
    }
    try {
        out.status_code = std::stoi(status_line.substr(pos + 1));
    } catch (const std::exception&) {
        return false;
    }

    std::string line;
    while (std::getline(lines, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        out.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

enum class BodyState { Incomplete, Complete, Error };

// Decodes a whole chunked body from data. Chunk extensions and trailers are
// skipped.
BodyState decode_chunked(const std::string& data, size_t pos, std::string& out) {
    out.clear();
    while (true) {
        auto line_end = data.find("\r\n", pos);
        if (line_end == std::string::npos) {
            return BodyState::Incomplete;
        }
        std::string size_line = data.substr(pos, line_end - pos);
        auto ext = size_line.find(';');
        if (ext != std::string::npos) {
            size_line.resize(ext);
        }
        size_line = trim(size_line);

        size_t chunk_size = 0;
        try {
            size_t parsed = 0;
            chunk_size = std::stoul(size_line, &parsed, 16);
            if (parsed != size_line.size()) {
                return BodyState::Error;
            }
        } catch (const std::exception&) {
            return BodyState::Error;
        }
        pos = line_end + 2;

        if (chunk_size == 0) {
            while (true) {
                auto trailer_end = data.find("\r\n", pos);
                if (trailer_end == std::string::npos) {
                    return BodyState::Incomplete;
                }
                if (trailer_end == pos) {
                    return BodyState::Complete;
                }
                pos = trailer_end + 2;
            }
        }

        if (chunk_size > kMaxResponseSize || data.size() < pos + chunk_size + 2) {
            return chunk_size > kMaxResponseSize ? BodyState::Error : BodyState::Incomplete;
        }
        if (data.compare(pos + chunk_size, 2, "\r\n") != 0) {
            return BodyState::Error;
        }
        out.append(data, pos, chunk_size);
        pos += chunk_size + 2;
    }
}

// Reads one response. The body is framed by Transfer-Encoding: chunked,
// Content-Length, or the peer closing the connection, in that order.
HttpResult read_response(int fd, Clock::time_point deadline) {
    std::string response;
    char buffer[16384];

    bool head_done = false;
    size_t body_offset = 0;
    ResponseHead head;
    bool chunked = false;
    std::optional<size_t> content_length;
    std::string body;
    BodyState state = BodyState::Incomplete;

    while (state == BodyState::Incomplete) {
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                auto ready = wait_ready(fd, POLLIN, deadline);
                if (ready != ErrorCode::Success) {
                    return failure(ready, "No response");
                }
                continue;
            }
            return failure(ErrorCode::ConnectionFailed, std::string("Failed to read response: ") + strerror(errno));
        }

        if (n == 0) {
            if (response.empty()) {
                return failure(ErrorCode::ConnectionFailed, "Connection closed without response");
            }
            if (!head_done) {
                return failure(ErrorCode::ProtocolError, "Invalid response");
            }
            if (chunked || content_length) {
                return failure(ErrorCode::ProtocolError, "Response body truncated");
            }
            body = response.substr(body_offset);
            break;
        }

        response.append(buffer, static_cast<size_t>(n));
        if (response.size() > kMaxResponseSize) {
            return failure(ErrorCode::ProtocolError, "Response too large");
        }

        if (!head_done) {
            auto header_end = response.find("\r\n\r\n");
            if (header_end == std::string::npos) {
                continue;
            }
            if (!parse_head(response.substr(0, header_end), head)) {
                return failure(ErrorCode::ProtocolError, "Invalid status line");
            }
            head_done = true;
            body_offset = header_end + 4;

            auto te = head.headers.find("transfer-encoding");
            chunked = te != head.headers.end() && to_lower(te->second).find("chunked") != std::string::npos;
            auto cl = head.headers.find("content-length");
            if (!chunked && cl != head.headers.end()) {
                try {
                    content_length = std::stoul(cl->second);
                } catch (const std::exception&) {
                    return failure(ErrorCode::ProtocolError, "Invalid Content-Length");
                }
            }
        }

        if (chunked) {
            // The last chunk and the trailer section end with an empty line.
            if (response.size() >= 4 && response.compare(response.size() - 4, 4, "\r\n\r\n") == 0) {
                state = decode_chunked(response, body_offset, body);
                if (state == BodyState::Error) {
                    return failure(ErrorCode::ProtocolError, "Malformed chunked body");
                }
            }
        } else if (content_length && response.size() - body_offset >= *content_length) {
            body = response.substr(body_offset, *content_length);
            state = BodyState::Complete;
        }
    }

    HttpResult result;
    result.status_code = head.status_code;
    result.headers = std::move(head.headers);
    result.body = std::move(body);
    return result;
}

std::string build_request(const std::string& host_header, const std::string& method,
                          const std::string& path, const std::string& body) {
    std::ostringstream request;
    request << method << " " << path << " HTTP/1.1\r\n";
    request << "Host: " << host_header << "\r\n";
    if (!body.empty() || method == "POST") {
        request << "Content-Type: application/json\r\n";
        request << "Content-Length: " << body.size() << "\r\n";
    }
    request << "Connection: close\r\n";
    request << "\r\n";
    request << body;
    return request.str();
}

HttpResult exchange(int fd, const sockaddr* addr, socklen_t len, const std::string& request,
                    Clock::time_point deadline) {
    auto connected = connect_with_deadline(fd, addr, len, deadline);
    if (!connected.ok()) {
        return connected;
    }
    auto sent = send_all(fd, request, deadline);
    if (!sent.ok()) {
        return sent;
    }
    return read_response(fd, deadline);
}

} // anonymous namespace

HttpResult HttpClient::request(const std::string& host,
                               uint16_t port,
                               const std::string& method,
                               const std::string& path,
                               const std::string& body,
                               std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;

    sockaddr_in serv_addr{};
    serv_addr.sin_family = AF_INET;
    serv_addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &serv_addr.sin_addr) != 1) {
        return failure(ErrorCode::InvalidArgument, "Not an IPv4 address: " + host);
    }

    SocketGuard sock(socket(AF_INET, SOCK_STREAM, 0));
    if (sock.get() < 0) {
        return failure(ErrorCode::ConnectionFailed, "Failed to create socket");
    }
    int one = 1;
    setsockopt(sock.get(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    std::string host_header = host + ":" + std::to_string(port);
    return exchange(sock.get(), reinterpret_cast<const sockaddr*>(&serv_addr), sizeof(serv_addr),
                    build_request(host_header, method, path, body), deadline);
}

HttpResult HttpClient::request_unix(const std::string& socket_path,
                                    const std::string& host_header,
                                    const std::string& method,
                                    const std::string& path,
                                    std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;

    sockaddr_un serv_addr{};
    serv_addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(serv_addr.sun_path)) {
        return failure(ErrorCode::InvalidArgument, "Socket path too long: " + socket_path);
    }
    std::memcpy(serv_addr.sun_path, socket_path.c_str(), socket_path.size() + 1);

    SocketGuard sock(socket(AF_UNIX, SOCK_STREAM, 0));
    if (sock.get() < 0) {
        return failure(ErrorCode::ConnectionFailed, "Failed to create socket");
    }

    return exchange(sock.get(), reinterpret_cast<const sockaddr*>(&serv_addr), sizeof(serv_addr),
                    build_request(host_header, method, path, ""), deadline);
}

} // namespace minidisc
