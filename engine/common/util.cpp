#include "util.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>

namespace docgate {
namespace engine {
namespace common {

uint16_t ToPort(int64_t value) {
  if (value < 0 || value > 65535) {
    throw ValidationError("Port out of range: " + std::to_string(value));
  }
  return static_cast<uint16_t>(value);
}

ParsedUrl ParseHttpUrl(const std::string& url) {
  ParsedUrl result;
  result.path = "/";

  // Find protocol separator "://"
  size_t protocol_end = url.find("://");
  if (protocol_end == std::string::npos) {
    throw ValidationError("URL has no scheme: '" + url + "'");
  }

  result.scheme = url.substr(0, protocol_end);
  std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (result.scheme == "https") {
    result.port = "443";
  } else if (result.scheme == "http") {
    result.port = "80";
  } else {
    throw ValidationError("Unsupported URL scheme '" + result.scheme + "' in '" + url + "'");
  }

  // Get everything after protocol
  std::string rest = url.substr(protocol_end + 3);

  // First slash separates host:port from path
  size_t slash = rest.find('/');
  std::string host_port = rest.substr(0, slash);
  if (slash != std::string::npos) {
    result.path = rest.substr(slash);
  }

  size_t colon = host_port.find(':');
  if (colon != std::string::npos) {
    result.host = host_port.substr(0, colon);
    std::string port = host_port.substr(colon + 1);
    if (!port.empty()) {
      result.port = port;
    }
  } else {
    result.host = host_port;
  }

  if (result.host.empty()) {
    throw ValidationError("URL has no host: '" + url + "'");
  }
  if (result.port.size() > 5 ||
      !std::all_of(result.port.begin(), result.port.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    throw ValidationError("URL has a non-numeric port: '" + url + "'");
  }
  ToPort(std::stol(result.port));

  return result;
}

std::chrono::milliseconds ParseTimeUnit(const std::string& name) {
  std::string unit = name;
  std::transform(unit.begin(), unit.end(), unit.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (!unit.empty() && unit.back() == 's') {
    unit.pop_back();
  }

  if (unit == "millisecond") {
    return std::chrono::milliseconds(1);
  } else if (unit == "second") {
    return std::chrono::seconds(1);
  } else if (unit == "minute") {
    return std::chrono::minutes(1);
  } else if (unit == "hour") {
    return std::chrono::hours(1);
  } else if (unit == "day") {
    return std::chrono::hours(24);
  }
  throw ValidationError("Unknown time unit: '" + name + "'");
}

}  // namespace common
}  // namespace engine
}  // namespace docgate
