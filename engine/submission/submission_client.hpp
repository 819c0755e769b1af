#pragma once

#include "engine/submission/document.hpp"
#include "engine/submission/http_transport.hpp"
#include "engine/throttle/cancellation_token.hpp"
#include "engine/throttle/throttled_gate.hpp"

#include <memory>
#include <string>

namespace docgate {

namespace engine {
namespace common {
class ConfigManager;
}  // namespace common
}  // namespace engine

/**
 * @brief Throttled client for the document-creation endpoint
 *
 * Every call serializes the document, waits for an admission from the
 * client's ThrottledGate, POSTs it with a Signature header and reports
 * completion to the gate once the call finished, successfully or not.
 * Thread-safe: one instance is meant to be shared by all callers so they
 * share one rate budget.
 */
class SubmissionClient {
 public:
  static constexpr const char* kDefaultEndpointUrl = "https://ismp.crpt.ru/api/v3/lk/documents/create";

  /**
   * @throws ValidationError for a null transport, an endpoint that is not an
   *         absolute http(s) URL, or an invalid throttle config
   */
  SubmissionClient(const ThrottleConfig& throttle,
                   std::shared_ptr<HttpTransport> transport,
                   std::string endpoint_url = kDefaultEndpointUrl);

  // Non-copyable
  SubmissionClient(const SubmissionClient&) = delete;
  SubmissionClient& operator=(const SubmissionClient&) = delete;

  /**
   * @brief Submit a document and return the response body
   *
   * @param document Document to create
   * @param signature Detached signature sent in the "Signature" header
   * @param token Cancels the wait for an admission
   * @throws ValidationError empty signature
   * @throws SerializationError document cannot be encoded (no admission used)
   * @throws InterruptedWait token cancelled while waiting (no admission used)
   * @throws TransportError the POST failed; the admission still counts
   */
  std::string CreateDocument(const Document& document,
                             const std::string& signature,
                             const CancellationToken& token = CancellationToken());

  const ThrottledGate& GetGate() const { return gate_; }
  const std::string& GetEndpointUrl() const { return endpoint_url_; }

  /**
   * @brief Build a client from "submission.*" and "throttle.*" keys
   *
   * Uses BeastHttpTransport unless a transport is supplied.
   */
  static std::unique_ptr<SubmissionClient> FromConfig(const engine::common::ConfigManager& config,
                                                      std::shared_ptr<HttpTransport> transport = nullptr);

 private:
  std::shared_ptr<HttpTransport> transport_;
  std::string endpoint_url_;
  ThrottledGate gate_;
};

}  // namespace docgate
