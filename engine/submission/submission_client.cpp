#include "submission_client.hpp"
#include "document_json_converter.hpp"
#include "engine/common/config_manager.hpp"
#include "engine/common/errors.hpp"
#include "engine/common/util.hpp"

#include <spdlog/spdlog.h>
#include <exception>

namespace docgate {

namespace {

std::shared_ptr<HttpTransport> RequireTransport(std::shared_ptr<HttpTransport> transport) {
  if (!transport) {
    throw ValidationError("HTTP transport must not be null");
  }
  return transport;
}

std::string RequireEndpoint(std::string endpoint_url) {
  engine::common::ParseHttpUrl(endpoint_url);
  return endpoint_url;
}

}  // namespace

SubmissionClient::SubmissionClient(const ThrottleConfig& throttle,
                                   std::shared_ptr<HttpTransport> transport,
                                   std::string endpoint_url)
    : transport_(RequireTransport(std::move(transport))),
      endpoint_url_(RequireEndpoint(std::move(endpoint_url))),
      gate_(throttle) {
  SPDLOG_INFO("SubmissionClient: endpoint={}, throttle={}", endpoint_url_, throttle.ToString());
}

std::string SubmissionClient::CreateDocument(const Document& document,
                                             const std::string& signature,
                                             const CancellationToken& token) {
  if (signature.empty()) {
    throw ValidationError("Signature must not be empty");
  }

  HttpRequest request;
  request.url = endpoint_url_;
  request.headers["Content-Type"] = "application/json";
  request.headers["Signature"] = signature;
  request.body = DocumentJsonConverter::ToJson(document);

  gate_.Acquire(token);
  ScopedAdmission admission(gate_);

  HttpResponse response;
  try {
    response = transport_->Post(request);
  } catch (const std::exception& e) {
    SPDLOG_ERROR("SubmissionClient: request for document '{}' failed: {}", document.doc_id, e.what());
    std::throw_with_nested(TransportError("Request to " + endpoint_url_ + " failed"));
  }

  if (!response.IsSuccess()) {
    SPDLOG_WARN("SubmissionClient: document '{}' answered with HTTP {}: {}",
                document.doc_id, response.status_code, response.body);
  } else {
    SPDLOG_DEBUG("SubmissionClient: document '{}' accepted ({} bytes)", document.doc_id, response.body.size());
  }
  return response.body;
}

std::unique_ptr<SubmissionClient> SubmissionClient::FromConfig(const engine::common::ConfigManager& config,
                                                               std::shared_ptr<HttpTransport> transport) {
  if (!transport) {
    BeastHttpTransport::Options options;
    options.connect_timeout = config.GetMilliseconds("submission.connect_timeout_ms", options.connect_timeout);
    options.request_timeout = config.GetMilliseconds("submission.request_timeout_ms", options.request_timeout);
    options.verify_tls = config.GetBool("submission.verify_tls", options.verify_tls);
    transport = std::make_shared<BeastHttpTransport>(options);
  }

  return std::make_unique<SubmissionClient>(ThrottleConfig::FromConfig(config),
                                            std::move(transport),
                                            config.GetString("submission.endpoint_url", kDefaultEndpointUrl));
}

}  // namespace docgate
