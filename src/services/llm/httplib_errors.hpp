#pragma once
#include "services/llm/http_transport.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

namespace vigil::services::llm {

// Connection-level httplib errors (refused, unreachable, connect timeout,
// TLS handshake) are Connect; everything else is Other
TransportError classify_httplib_error(httplib::Error error);

} // namespace vigil::services::llm
