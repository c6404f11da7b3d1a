#include <liveview/core/error.hpp>
#include <liveview/core/logger.hpp>
#include <unordered_map>

namespace liveview::core {

namespace {
    const std::unordered_map<ErrorCode, const char*> ERROR_MESSAGES = {
        // System errors
        {ErrorCode::Success, "Success"},
        {ErrorCode::Unknown, "Unknown error"},
        {ErrorCode::InvalidArgument, "Invalid argument"},
        {ErrorCode::InvalidState, "Invalid state"},
        {ErrorCode::NotSupported, "Not supported"},

        // Session errors
        {ErrorCode::InvalidTarget, "Invalid target"},
        {ErrorCode::RequestRejected, "Request rejected"},
        {ErrorCode::RequestTimeout, "Request timeout"},
        {ErrorCode::ConnectionTimeout, "Connection timeout"},
        {ErrorCode::ConnectionLost, "Connection lost"},
        {ErrorCode::NegotiationError, "Negotiation error"},

        // Signaling errors
        {ErrorCode::SignalingError, "Signaling error"},
        {ErrorCode::InvalidMessage, "Invalid message"},

        // Resource errors
        {ErrorCode::FileNotFound, "File not found"},
        {ErrorCode::FileAccessDenied, "File access denied"},
        {ErrorCode::ResourceNotFound, "Resource not found"},
        {ErrorCode::InvalidData, "Invalid data"}
    };

    // Map untuk error conditions
    const std::unordered_map<ErrorCode, std::error_condition> ERROR_CONDITIONS = {
        {ErrorCode::InvalidArgument, std::errc::invalid_argument},
        {ErrorCode::InvalidTarget, std::errc::invalid_argument},
        {ErrorCode::RequestRejected, std::errc::connection_refused},
        {ErrorCode::RequestTimeout, std::errc::timed_out},
        {ErrorCode::ConnectionTimeout, std::errc::timed_out},
        {ErrorCode::ConnectionLost, std::errc::connection_reset},
        {ErrorCode::NotSupported, std::errc::not_supported},
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
    return it != ERROR_CONDITIONS.end() ? it->second : std::error_condition(ev, *this);
}

Error::Error(ErrorCode code, std::string_view message, const std::source_location& location)
    : std::runtime_error(std::string(message))
    , code_(code)
    , location_(location) {
    Logger::debug("[{}] {} at {}:{}",
        ErrorCategory::instance().message(static_cast<int>(code)),
        message,
        location.file_name(),
        location.line());
}

} // namespace liveview::core
