#include "minidisc/base/error_code.h"

namespace minidisc {

namespace {

class MinidiscCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "minidisc";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const MinidiscCategory& get_category() {
    static MinidiscCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::DuplicateAddress: return "Duplicate address";
        case ErrorCode::NonMemberAddress: return "Non-member address";
        case ErrorCode::NoMatch: return "No matching service found";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::HttpStatusError: return "Unexpected HTTP status";
        case ErrorCode::AddressSourceError: return "Address source error";
        case ErrorCode::BindFailed: return "Bind failed";
        case ErrorCode::RegistrationFailed: return "Registration failed";
        default: return "Unknown error";
    }
}

bool is_connectivity_error(ErrorCode code) {
    return code == ErrorCode::ConnectionFailed || code == ErrorCode::Timeout;
}

MinidiscError::MinidiscError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* MinidiscError::what() const noexcept {
    return message_.c_str();
}

} // namespace minidisc
