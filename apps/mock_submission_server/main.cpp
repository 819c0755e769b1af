#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <string>

#include "engine/common/application_kernel.hpp"
#include "engine/common/util.hpp"
#include "engine/mock/mock_submission_server.hpp"

using namespace docgate::engine::common;

class MockSubmissionServerApp : public ApplicationKernel {
 public:
  MockSubmissionServerApp() {
    SetAppName("mock_submission_server");
  }

 protected:
  void OnStart() override {
    std::string address = GetConfig().GetString("server.address", "127.0.0.1");
    // Throws ValidationError for an out-of-range port, which fails start-up
    uint16_t port = ToPort(GetConfig().GetInt("server.port", 8080));
    std::string path = GetConfig().GetString("server.path", "/api/v3/lk/documents/create");
    auto delay = GetConfig().GetMilliseconds("server.response_delay_ms", std::chrono::milliseconds(0));

    server_ = std::make_unique<docgate::MockSubmissionServer>(path);
    server_->SetResponseDelay(delay);
    if (!server_->Start(address, port)) {
      SPDLOG_ERROR("Mock submission server could not start on {}:{}", address, port);
      RequestStop(1);
      return;
    }

    SPDLOG_INFO("Mock submission endpoint: http://{}:{}{}", address, server_->GetPort(), path);
  }

  void OnStop() override {
    if (server_) {
      SPDLOG_INFO("Received {} documents", server_->GetReceivedCount());
      server_->Stop();
    }
  }

 private:
  std::unique_ptr<docgate::MockSubmissionServer> server_;
};

int main(int argc, char** argv) {
  MockSubmissionServerApp app;
  return app.Run(argc, argv);
}
