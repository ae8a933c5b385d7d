#ifndef WSPLUS_CONNECTION_STATE_HPP
#define WSPLUS_CONNECTION_STATE_HPP

#include <cstdint>

namespace wsplus {

enum class ConnectionState : std::uint8_t {
    Initial,
    Connecting,
    Connected,
    Closing,
    Closed,
    Failed,
    Reconnecting,
    Suspended
};

// Connected, or on the way there.
constexpr bool is_active(ConnectionState s) {
    return s == ConnectionState::Connecting ||
           s == ConnectionState::Connected ||
           s == ConnectionState::Reconnecting;
}

constexpr bool is_terminal_failure(ConnectionState s) {
    return s == ConnectionState::Closed || s == ConnectionState::Failed;
}

constexpr bool can_send(ConnectionState s) {
    return s == ConnectionState::Connected;
}

const char* to_string(ConnectionState s);

} // namespace wsplus

#endif // WSPLUS_CONNECTION_STATE_HPP
