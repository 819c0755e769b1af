#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace docgate {
namespace engine {
namespace common {

// Parsed HTTP URL components
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;

  bool IsSecure() const { return scheme == "https"; }
};

// TCP port from a configured number. Throws ValidationError outside 0..65535.
uint16_t ToPort(int64_t value);

// Parse an absolute HTTP URL (http:// or https://) into its components
// Example: "https://ismp.crpt.ru/api/v3/lk/documents/create"
//   -> scheme="https", host="ismp.crpt.ru", port="443", path="/api/v3/lk/documents/create"
//
// A missing port defaults to 443 for https and 80 for http, a missing path to "/".
// Throws ValidationError for any other scheme, an empty host or a bad port.
ParsedUrl ParseHttpUrl(const std::string& url);

// Length of one unit named in configuration: "milliseconds", "seconds",
// "minutes", "hours" or "days" (singular forms accepted, case-insensitive).
// Throws ValidationError for an unknown name.
std::chrono::milliseconds ParseTimeUnit(const std::string& name);

}  // namespace common
}  // namespace engine
}  // namespace docgate
