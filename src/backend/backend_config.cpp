#include <lazymcp/backend/backend_config.hpp>

namespace lazymcp {

const char* TransportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http:  return "http";
    }
    return "unknown";
}

std::optional<TransportKind> ParseTransportKind(std::string_view text) {
    if (text == "stdio") return TransportKind::Stdio;
    // "streamable-http" is the name MCP client configs commonly use.
    if (text == "http" || text == "streamable-http") return TransportKind::Http;
    return std::nullopt;
}

} // namespace lazymcp
