#pragma once

#include <chrono>
#include <map>
#include <string>

namespace docgate {

struct HttpRequest {
  std::string url;                              ///< Absolute http:// or https:// URL
  std::map<std::string, std::string> headers;
  std::string body;
};

struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;

  bool IsSuccess() const { return status_code >= 200 && status_code < 300; }
};

/**
 * @brief Blocking HTTP POST used by SubmissionClient
 *
 * Implementations throw on failure (connection, timeout, malformed
 * response). A response with any status code is a success at this layer.
 * Must be safe to call from several threads at once.
 */
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Post(const HttpRequest& request) = 0;
};

/**
 * @brief HttpTransport over Boost.Beast
 *
 * One connection per request: resolve, connect, TLS handshake (https only,
 * with SNI), write, read, graceful shutdown. Name lookup and connect are
 * each bounded by connect_timeout; write and read by request_timeout.
 */
class BeastHttpTransport : public HttpTransport {
 public:
  struct Options {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds request_timeout{30000};
    bool verify_tls = true;
    std::string user_agent = "docgate/1.0";
  };

  BeastHttpTransport() = default;
  explicit BeastHttpTransport(const Options& options) : options_(options) {}
  ~BeastHttpTransport() override = default;

  // Non-copyable
  BeastHttpTransport(const BeastHttpTransport&) = delete;
  BeastHttpTransport& operator=(const BeastHttpTransport&) = delete;

  HttpResponse Post(const HttpRequest& request) override;

  const Options& GetOptions() const { return options_; }

 private:
  Options options_;
};

}  // namespace docgate
