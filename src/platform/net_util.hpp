#pragma once

// Cross-platform name resolution helpers.

#include <string>

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// True if the host name resolves to at least one address.
// Uses the system resolver, so the answer reflects the active VPN's DNS.
bool resolve_host(const std::string& host);

} // namespace platform
