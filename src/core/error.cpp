#include <fleetcam/core/error.hpp>
#include <unordered_map>

namespace fleetcam::core {

namespace {
    // Map untuk error messages
    const std::unordered_map<ErrorCode, const char*> ERROR_MESSAGES = {
        // System errors
        {ErrorCode::Success, "Success"},
        {ErrorCode::Unknown, "Unknown error"},
        {ErrorCode::InvalidArgument, "Invalid argument"},
        {ErrorCode::InvalidState, "Invalid state"},
        {ErrorCode::NotSupported, "Not supported"},
        {ErrorCode::Cancelled, "Operation cancelled"},

        // Network errors
        {ErrorCode::NetworkError, "Network error"},
        {ErrorCode::ConnectionFailed, "Connection failed"},
        {ErrorCode::ConnectionClosed, "Connection closed"},
        {ErrorCode::ConnectionTimeout, "Connection timeout"},
        {ErrorCode::InvalidAddress, "Invalid address"},

        // Negotiation / transport errors
        {ErrorCode::NegotiationRejected, "Negotiation rejected"},
        {ErrorCode::MalformedAnswer, "Malformed session answer"},
        {ErrorCode::TransportError, "Transport error"},

        // API errors
        {ErrorCode::ResourceNotFound, "Resource not found"},

        // Resource errors
        {ErrorCode::FileNotFound, "File not found"},
        {ErrorCode::FileAccessDenied, "File access denied"},
        {ErrorCode::InvalidData, "Invalid data"}
    };

    // Map untuk error conditions
    const std::unordered_map<ErrorCode, std::errc> ERROR_CONDITIONS = {
        {ErrorCode::InvalidArgument, std::errc::invalid_argument},
        {ErrorCode::NotSupported, std::errc::not_supported},
        {ErrorCode::Cancelled, std::errc::operation_canceled},
        {ErrorCode::NetworkError, std::errc::network_unreachable},
        {ErrorCode::ConnectionFailed, std::errc::connection_refused},
        {ErrorCode::ConnectionClosed, std::errc::connection_reset},
        {ErrorCode::ConnectionTimeout, std::errc::timed_out},
        {ErrorCode::InvalidAddress, std::errc::address_not_available},
        {ErrorCode::FileNotFound, std::errc::no_such_file_or_directory},
        {ErrorCode::FileAccessDenied, std::errc::permission_denied},
        {ErrorCode::InvalidData, std::errc::invalid_argument}
    };
}

std::string ErrorCategory::message(int ev) const {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_MESSAGES.find(code);
    return it != ERROR_MESSAGES.end() ? it->second : "Unknown error";
}

std::error_condition ErrorCategory::default_error_condition(int ev) const noexcept {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_CONDITIONS.find(code);
    return it != ERROR_CONDITIONS.end() ? std::make_error_condition(it->second)
                                        : std::error_condition(ev, *this);
}

} // namespace fleetcam::core
