#ifndef WSPLUS_ERROR_HPP
#define WSPLUS_ERROR_HPP

#include <string>
#include <tl/expected.hpp>

namespace wsplus {

enum class ErrorCode {
    ConnectionFailed,
    MessageSendFailed,
    ReconnectionFailed,
    Timeout,
    QueueFull,
    DuplicateMessage,
    NotConnected,
    Disposed
};

struct Error {
    ErrorCode code;
    std::string message;
};

// Fallible operations return the value or an Error, never throw for
// steady-state conditions such as a full queue.
template<typename T>
using Result = tl::expected<T, Error>;

inline tl::unexpected<Error> make_error(ErrorCode code, std::string message) {
    return tl::unexpected<Error>(Error{code, std::move(message)});
}

inline tl::unexpected<Error> connection_failed(const std::string& reason) {
    return make_error(ErrorCode::ConnectionFailed, "Connection failed: " + reason);
}

inline tl::unexpected<Error> message_send_failed(const std::string& reason) {
    return make_error(ErrorCode::MessageSendFailed, "Failed to send message: " + reason);
}

inline tl::unexpected<Error> reconnection_failed(const std::string& reason) {
    return make_error(ErrorCode::ReconnectionFailed, "Reconnection failed: " + reason);
}

inline tl::unexpected<Error> timed_out(const std::string& operation) {
    return make_error(ErrorCode::Timeout, operation + " timed out");
}

const char* to_string(ErrorCode code);

} // namespace wsplus

#endif // WSPLUS_ERROR_HPP
