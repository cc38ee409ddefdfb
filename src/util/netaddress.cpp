#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/ip/address.hpp>

namespace meshwalk {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  // error_code overload: make_address never throws here
  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }

  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ip.to_v6());
    return v4.to_string();
  }

  return ip.to_string();
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

std::string FormatHostPort(const std::string& host, uint16_t port) {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port) {
  if (host_port.empty()) {
    return false;
  }

  std::string host;
  std::string port_str;

  if (host_port[0] == '[') {
    size_t bracket_end = host_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false; // Missing closing bracket or empty brackets
    }
    if (bracket_end + 1 >= host_port.size() || host_port[bracket_end + 1] != ':') {
      return false; // Missing :port
    }
    host = host_port.substr(1, bracket_end - 1);
    port_str = host_port.substr(bracket_end + 2);

    // Brackets are only for IPv6 literals
    auto normalized = ValidateAndNormalizeIP(host);
    if (!normalized) {
      return false;
    }
    host = *normalized;
  } else {
    size_t colon = host_port.find(':');
    if (colon == std::string::npos || colon == 0) {
      return false;
    }
    if (host_port.find(':', colon + 1) != std::string::npos) {
      return false; // IPv6 without brackets
    }
    host = host_port.substr(0, colon);
    port_str = host_port.substr(colon + 1);

    if (auto normalized = ValidateAndNormalizeIP(host)) {
      host = *normalized;
    }
  }

  auto port = SafeParsePort(port_str);
  if (!port) {
    return false;
  }

  out_host = host;
  out_port = *port;
  return true;
}

} // namespace util
} // namespace meshwalk
