#pragma once

#include <cstdint>
#include <string>

namespace mangashelf {

// Parse "host:port" (host may be empty for all interfaces).
// Returns false on invalid format or a port outside 1..65535.
bool parse_host_port(const std::string& addr, std::string& host, uint16_t& port);

} // namespace mangashelf
