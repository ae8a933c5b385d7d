#include "error.hpp"

namespace wsplus {

const char* to_string(ErrorCode code) {
    switch( code ) {
        case ErrorCode::ConnectionFailed:   return "ConnectionFailed";
        case ErrorCode::MessageSendFailed:  return "MessageSendFailed";
        case ErrorCode::ReconnectionFailed: return "ReconnectionFailed";
        case ErrorCode::Timeout:            return "Timeout";
        case ErrorCode::QueueFull:          return "QueueFull";
        case ErrorCode::DuplicateMessage:   return "DuplicateMessage";
        case ErrorCode::NotConnected:       return "NotConnected";
        case ErrorCode::Disposed:           return "Disposed";
    }
    return "Unknown";
}

} // namespace wsplus
