#include "util/listen_address.hpp"

#include <cstdlib>

namespace mangashelf {

bool parse_host_port(const std::string& addr, std::string& host, uint16_t& port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos) return false;

    std::string port_str = addr.substr(colon + 1);
    if (port_str.empty()) return false;

    char* end = nullptr;
    long val = std::strtol(port_str.c_str(), &end, 10);
    if (*end != '\0' || val <= 0 || val > 65535) return false;

    host = addr.substr(0, colon);
    if (host.empty()) host = "0.0.0.0";
    port = static_cast<uint16_t>(val);
    return true;
}

} // namespace mangashelf
