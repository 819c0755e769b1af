#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/common/config_manager.hpp"
#include "engine/common/errors.hpp"
#include "engine/submission/submission_client.hpp"

using namespace docgate;
using namespace std::chrono_literals;

namespace {

// Records every request and answers with a canned response
class FakeTransport : public HttpTransport {
 public:
  HttpResponse Post(const HttpRequest& request) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
    }
    if (fail_) {
      throw std::runtime_error("connection refused");
    }
    HttpResponse response;
    response.status_code = status_code_;
    response.body = body_;
    return response;
  }

  std::vector<HttpRequest> GetRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  void SetFailing(bool fail) { fail_ = fail; }
  void SetResponse(int status_code, const std::string& body) {
    status_code_ = status_code;
    body_ = body;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<HttpRequest> requests_;
  std::atomic<bool> fail_{false};
  int status_code_ = 200;
  std::string body_ = R"({"value":"created"})";
};

}  // namespace

class SubmissionClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    transport_ = std::make_shared<FakeTransport>();
    document_.doc_id = "doc-0001";
    document_.doc_type = "LP_INTRODUCE_GOODS";
    document_.import_request = true;
  }

  std::unique_ptr<SubmissionClient> MakeClient(std::chrono::milliseconds period, int limit) {
    ThrottleConfig throttle;
    throttle.period = period;
    throttle.limit = limit;
    return std::make_unique<SubmissionClient>(throttle, transport_, "http://127.0.0.1:8080/api/v3/lk/documents/create");
  }

  std::shared_ptr<FakeTransport> transport_;
  Document document_;
};

TEST_F(SubmissionClientTest, Construction_Validation) {
  ThrottleConfig throttle;
  EXPECT_THROW(SubmissionClient(throttle, nullptr), ValidationError);
  EXPECT_THROW(SubmissionClient(throttle, transport_, "ftp://example.com/create"), ValidationError);
  EXPECT_THROW(SubmissionClient(throttle, transport_, "not a url"), ValidationError);

  throttle.limit = 0;
  EXPECT_THROW(SubmissionClient(throttle, transport_), ValidationError);
}

TEST_F(SubmissionClientTest, DefaultEndpoint) {
  SubmissionClient client(ThrottleConfig(), transport_);
  EXPECT_EQ(client.GetEndpointUrl(), "https://ismp.crpt.ru/api/v3/lk/documents/create");
}

TEST_F(SubmissionClientTest, CreateDocument_SendsJsonWithSignature) {
  auto client = MakeClient(60000ms, 10);
  std::string result = client->CreateDocument(document_, "c2lnbmF0dXJl");
  EXPECT_EQ(result, R"({"value":"created"})");

  auto requests = transport_->GetRequests();
  ASSERT_EQ(requests.size(), 1u);
  const auto& request = requests[0];
  EXPECT_EQ(request.url, "http://127.0.0.1:8080/api/v3/lk/documents/create");
  EXPECT_EQ(request.headers.at("Content-Type"), "application/json");
  EXPECT_EQ(request.headers.at("Signature"), "c2lnbmF0dXJl");

  auto body = nlohmann::json::parse(request.body);
  EXPECT_EQ(body["doc_id"], "doc-0001");
  EXPECT_EQ(body["importRequest"], true);
  EXPECT_TRUE(body["description"].is_null());

  auto snapshot = client->GetGate().GetSnapshot();
  EXPECT_EQ(snapshot.count, 1);
  EXPECT_EQ(snapshot.in_flight, 0);
}

TEST_F(SubmissionClientTest, CreateDocument_NonSuccessStatusReturnsBody) {
  auto client = MakeClient(60000ms, 10);
  transport_->SetResponse(400, R"({"error_message":"bad document"})");

  EXPECT_EQ(client->CreateDocument(document_, "sig"), R"({"error_message":"bad document"})");
  EXPECT_EQ(client->GetGate().GetSnapshot().count, 1);
}

TEST_F(SubmissionClientTest, CreateDocument_EmptySignatureThrows) {
  auto client = MakeClient(60000ms, 10);
  EXPECT_THROW(client->CreateDocument(document_, ""), ValidationError);
  EXPECT_TRUE(transport_->GetRequests().empty());
  EXPECT_EQ(client->GetGate().Remaining(), 10);
}

TEST_F(SubmissionClientTest, CreateDocument_SerializationFailureConsumesNothing) {
  auto client = MakeClient(60000ms, 10);
  document_.reg_number = std::string("\xc3\x28", 2);

  EXPECT_THROW(client->CreateDocument(document_, "sig"), SerializationError);
  EXPECT_TRUE(transport_->GetRequests().empty());
  auto snapshot = client->GetGate().GetSnapshot();
  EXPECT_EQ(snapshot.count, 0);
  EXPECT_EQ(snapshot.in_flight, 0);
}

TEST_F(SubmissionClientTest, CreateDocument_TransportFailureStillCounts) {
  auto client = MakeClient(60000ms, 10);
  transport_->SetFailing(true);

  try {
    client->CreateDocument(document_, "sig");
    FAIL() << "Expected TransportError";
  } catch (const TransportError& e) {
    EXPECT_EQ(DescribeException(e),
              "Request to http://127.0.0.1:8080/api/v3/lk/documents/create failed: connection refused");
  }

  auto snapshot = client->GetGate().GetSnapshot();
  EXPECT_EQ(snapshot.count, 1);
  EXPECT_EQ(snapshot.in_flight, 0);
}

TEST_F(SubmissionClientTest, CreateDocument_ThrottlesCalls) {
  auto start = std::chrono::steady_clock::now();
  auto client = MakeClient(500ms, 2);

  client->CreateDocument(document_, "sig");
  client->CreateDocument(document_, "sig");
  client->CreateDocument(document_, "sig");  // Waits for the next window

  EXPECT_GE(std::chrono::steady_clock::now() - start, 500ms);
  EXPECT_EQ(transport_->GetRequests().size(), 3u);
  EXPECT_EQ(client->GetGate().GetSnapshot().count, 1);
}

TEST_F(SubmissionClientTest, CreateDocument_ConcurrentCallersShareBudget) {
  auto client = MakeClient(60000ms, 4);
  CancellationSource cancel;
  std::atomic<int> succeeded{0};
  std::atomic<int> interrupted{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&]() {
      try {
        client->CreateDocument(document_, "sig", cancel.GetToken());
        succeeded++;
      } catch (const InterruptedWait&) {
        interrupted++;
      }
    });
  }

  // Wait until the budget is spent, then give up on the rest
  auto deadline = std::chrono::steady_clock::now() + 5s;
  while (succeeded.load() < 4 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  std::this_thread::sleep_for(50ms);
  cancel.Cancel();
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(succeeded.load(), 4);
  EXPECT_EQ(interrupted.load(), 2);
  EXPECT_EQ(transport_->GetRequests().size(), 4u);
  EXPECT_EQ(client->GetGate().GetSnapshot().count, 4);
}

TEST_F(SubmissionClientTest, CreateDocument_CancelledTokenSendsNothing) {
  auto client = MakeClient(60000ms, 10);
  CancellationSource cancel;
  cancel.Cancel();

  EXPECT_THROW(client->CreateDocument(document_, "sig", cancel.GetToken()), InterruptedWait);
  EXPECT_TRUE(transport_->GetRequests().empty());
}

TEST_F(SubmissionClientTest, FromConfig_UsesSuppliedTransport) {
  engine::common::ConfigManager config;
  ASSERT_TRUE(config.LoadFromString(R"({
    "submission": {"endpoint_url": "http://localhost:9000/create"},
    "throttle": {"time_unit": "seconds", "request_limit": 3}
  })"));

  auto client = SubmissionClient::FromConfig(config, transport_);
  EXPECT_EQ(client->GetEndpointUrl(), "http://localhost:9000/create");
  EXPECT_EQ(client->GetGate().GetConfig().limit, 3);
  EXPECT_EQ(client->GetGate().GetConfig().period, 1000ms);

  client->CreateDocument(document_, "sig");
  ASSERT_EQ(transport_->GetRequests().size(), 1u);
  EXPECT_EQ(transport_->GetRequests()[0].url, "http://localhost:9000/create");
}

TEST_F(SubmissionClientTest, FromConfig_DefaultsToBeastTransport) {
  engine::common::ConfigManager config;
  ASSERT_TRUE(config.LoadFromString("{}"));

  auto client = SubmissionClient::FromConfig(config);
  EXPECT_EQ(client->GetEndpointUrl(), SubmissionClient::kDefaultEndpointUrl);
  EXPECT_EQ(client->GetGate().GetConfig().limit, 100);
}
