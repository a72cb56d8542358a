#include "toolgate/descriptor.h"

namespace toolgate {

const char* transport_kind_name(TransportKind k) {
    switch (k) {
        case TransportKind::STDIO: return "stdio";
        case TransportKind::HTTP:  return "http";
        case TransportKind::SSE:   return "sse";
    }
    return "stdio";
}

} // namespace toolgate
