#include "connection_state.hpp"

namespace wsplus {

const char* to_string(ConnectionState s) {
    switch( s ) {
        case ConnectionState::Initial:      return "Initial";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Closing:      return "Closing";
        case ConnectionState::Closed:       return "Closed";
        case ConnectionState::Failed:       return "Failed";
        case ConnectionState::Reconnecting: return "Reconnecting";
        case ConnectionState::Suspended:    return "Suspended";
    }
    return "Unknown";
}

} // namespace wsplus
