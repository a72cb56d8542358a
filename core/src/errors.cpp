#include "toolgate/errors.h"

namespace toolgate {

const char* connection_error_kind_name(ConnectionError::Kind k) {
    switch (k) {
        case ConnectionError::Kind::ALREADY_CONNECTED:     return "ALREADY_CONNECTED";
        case ConnectionError::Kind::BUDGET_EXHAUSTED:      return "BUDGET_EXHAUSTED";
        case ConnectionError::Kind::UNSUPPORTED_TRANSPORT: return "UNSUPPORTED_TRANSPORT";
        case ConnectionError::Kind::SPAWN_FAILED:          return "SPAWN_FAILED";
        case ConnectionError::Kind::HANDSHAKE_FAILED:      return "HANDSHAKE_FAILED";
        case ConnectionError::Kind::TIMEOUT:               return "TIMEOUT";
        case ConnectionError::Kind::CLOSED:                return "CLOSED";
        case ConnectionError::Kind::NOT_CONNECTED:         return "NOT_CONNECTED";
        case ConnectionError::Kind::CALL_FAILED:           return "CALL_FAILED";
        case ConnectionError::Kind::CLOSE_FAILED:          return "CLOSE_FAILED";
    }
    return "UNKNOWN";
}

} // namespace toolgate
