#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connectivity Probe
// ═══════════════════════════════════════════════════════════════════════════
// One-shot "test this configuration" flow: connect, initialize, tools/list,
// tear down. Nothing is cached and a stdio child never outlives the call.

#include "mcplink/protocol/mcp_types.hpp"
#include "mcplink/session/session.hpp"

namespace mcplink {

/// Never throws and never returns an error: every failure is folded into
/// CheckResult::error with `ok == false`.
[[nodiscard]] CheckResult check_server(
    const TransportConfig& config,
    const HttpClientFactory& http_factory = make_http_client
);

}  // namespace mcplink
