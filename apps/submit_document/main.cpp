#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "engine/common/application_kernel.hpp"
#include "engine/common/errors.hpp"
#include "engine/submission/document_json_converter.hpp"
#include "engine/submission/submission_client.hpp"
#include "engine/throttle/cancellation_token.hpp"

using namespace docgate::engine::common;

// Submits one document file --copies times from --workers threads that all
// share a single SubmissionClient, and therefore one throttle budget.
class SubmitDocumentApp : public ApplicationKernel {
 public:
  SubmitDocumentApp() {
    SetAppName("submit_document");
  }

 protected:
  void AddCommandLineOptions(CLI::App& app) override {
    app.add_option("--document", document_file_, "JSON document to submit")
       ->required()
       ->check(CLI::ExistingFile);
    app.add_option("--signature", signature_, "Signature header value")->required();
    app.add_option("--copies", copies_, "Number of submissions")->check(CLI::PositiveNumber);
    app.add_option("--workers", workers_, "Concurrent submitting threads")->check(CLI::PositiveNumber);
  }

  void OnInitialize() override {
    std::ifstream file(document_file_);
    if (!file.is_open()) {
      throw docgate::ValidationError("Cannot open document file " + document_file_);
    }
    std::stringstream contents;
    contents << file.rdbuf();
    document_ = docgate::DocumentJsonConverter::FromJson(contents.str());

    client_ = docgate::SubmissionClient::FromConfig(GetConfig());
    SPDLOG_INFO("Loaded document '{}' (type {}, {} products) from {}",
                document_.doc_id, document_.doc_type, document_.products.size(), document_file_);
  }

  void OnStart() override {
    SPDLOG_INFO("Submitting {} copies from {} workers", copies_, workers_);
    active_workers_ = workers_;
    for (int i = 0; i < workers_; ++i) {
      worker_threads_.emplace_back(&SubmitDocumentApp::WorkerLoop, this, i);
    }
  }

  void OnStop() override {
    cancel_.Cancel();
    for (auto& worker : worker_threads_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    SPDLOG_INFO("Submitted {} of {} documents, {} failed", succeeded_.load(), copies_, failed_.load());
  }

 private:
  std::string document_file_;
  std::string signature_;
  int copies_ = 1;
  int workers_ = 1;

  docgate::Document document_;
  std::unique_ptr<docgate::SubmissionClient> client_;
  docgate::CancellationSource cancel_;

  std::vector<std::thread> worker_threads_;
  std::atomic<int> next_copy_{0};
  std::atomic<int> active_workers_{0};
  std::atomic<int> succeeded_{0};
  std::atomic<int> failed_{0};

  void WorkerLoop(int worker_id) {
    while (true) {
      int copy = next_copy_.fetch_add(1);
      if (copy >= copies_) {
        break;
      }

      try {
        std::string response = client_->CreateDocument(document_, signature_, cancel_.GetToken());
        succeeded_++;
        SPDLOG_INFO("[worker {}] copy {}: {}", worker_id, copy + 1, response);
      } catch (const docgate::InterruptedWait&) {
        SPDLOG_INFO("[worker {}] cancelled before copy {}", worker_id, copy + 1);
        break;
      } catch (const docgate::Error& e) {
        failed_++;
        SPDLOG_ERROR("[worker {}] copy {} failed: {}", worker_id, copy + 1, docgate::DescribeException(e));
      }

      auto snapshot = client_->GetGate().GetSnapshot();
      SPDLOG_DEBUG("[worker {}] gate: completed={}, in_flight={}, remaining={}",
                   worker_id, snapshot.count, snapshot.in_flight, client_->GetGate().Remaining());
    }

    if (--active_workers_ == 0) {
      RequestStop(failed_.load() > 0 ? 1 : 0);
    }
  }
};

int main(int argc, char** argv) {
  SubmitDocumentApp app;
  return app.Run(argc, argv);
}
