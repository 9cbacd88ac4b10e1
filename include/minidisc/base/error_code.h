#ifndef MINIDISC_BASE_ERROR_CODE_H
#define MINIDISC_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace minidisc {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    NotFound = 1002,
    InternalError = 1003,

    // Directory policy errors (2000-2999)
    DuplicateAddress = 2001,
    NonMemberAddress = 2002,
    NoMatch = 2003,

    // Network errors (3000-3999)
    ConnectionFailed = 3001,
    Timeout = 3002,
    ProtocolError = 3003,
    HttpStatusError = 3004,

    // Environment errors (4000-4999)
    AddressSourceError = 4001,
    BindFailed = 4002,
    RegistrationFailed = 4003
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

// Connectivity errors mean "peer is not there"; everything else that is not
// Success means the peer answered with something we could not use.
bool is_connectivity_error(ErrorCode code);

class MinidiscError : public std::exception {
public:
    MinidiscError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace minidisc

namespace std {
template <>
struct is_error_code_enum<minidisc::ErrorCode> : true_type {};
} // namespace std

#endif // MINIDISC_BASE_ERROR_CODE_H
