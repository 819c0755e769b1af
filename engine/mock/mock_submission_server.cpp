#include "mock_submission_server.hpp"

#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace docgate {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

// A client that connects and never finishes its request is dropped after this
constexpr auto kSessionTimeout = std::chrono::seconds(30);

}  // namespace

//=== MockSubmissionSession ===

MockSubmissionSession::MockSubmissionSession(tcp::socket socket, MockSubmissionServer* server)
    : delay_timer_(socket.get_executor()),
      stream_(std::move(socket)),
      server_(server) {}

void MockSubmissionSession::Run() {
  stream_.expires_after(kSessionTimeout);
  http::async_read(stream_, buffer_, req_,
      beast::bind_front_handler(&MockSubmissionSession::OnRead, shared_from_this()));
}

void MockSubmissionSession::Close() {
  delay_timer_.cancel();
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
  stream_.close();
}

void MockSubmissionSession::OnRead(beast::error_code ec, std::size_t /* bytes_transferred */) {
  if (ec) {
    if (ec != net::error::operation_aborted && ec != http::error::end_of_stream) {
      SPDLOG_WARN("MockSubmissionServer: read error: {}", ec.message());
    }
    return;
  }

  resp_.version(req_.version());
  resp_.keep_alive(false);
  server_->HandleRequest(req_, resp_);

  auto delay = server_->GetResponseDelay();
  if (delay.count() > 0) {
    delay_timer_.expires_after(delay);
    delay_timer_.async_wait(
        beast::bind_front_handler(&MockSubmissionSession::OnDelay, shared_from_this()));
    return;
  }
  DoWrite();
}

void MockSubmissionSession::OnDelay(beast::error_code ec) {
  if (ec) {
    return;  // Closed while delaying
  }
  DoWrite();
}

void MockSubmissionSession::DoWrite() {
  stream_.expires_after(kSessionTimeout);
  http::async_write(stream_, resp_,
      beast::bind_front_handler(&MockSubmissionSession::OnWrite, shared_from_this()));
}

void MockSubmissionSession::OnWrite(beast::error_code ec, std::size_t /* bytes_transferred */) {
  if (ec) {
    if (ec != net::error::operation_aborted) {
      SPDLOG_WARN("MockSubmissionServer: write error: {}", ec.message());
    }
    return;
  }
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  if (ec) {
    SPDLOG_DEBUG("MockSubmissionServer: shutdown warning: {}", ec.message());
  }
}

//=== MockSubmissionServer ===

MockSubmissionServer::MockSubmissionServer(std::string path) : path_(std::move(path)) {}

MockSubmissionServer::~MockSubmissionServer() {
  Stop();
}

bool MockSubmissionServer::Start(const std::string& address, uint16_t port) {
  if (running_.exchange(true)) {
    return false;  // Already running
  }

  try {
    ioc_ = std::make_unique<net::io_context>(1);
    auto endpoint = tcp::endpoint(net::ip::make_address(address), port);
    acceptor_ = std::make_unique<tcp::acceptor>(*ioc_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(net::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(net::socket_base::max_listen_connections);
    bound_port_ = acceptor_->local_endpoint().port();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("MockSubmissionServer: failed to listen on {}:{}: {}", address, port, e.what());
    acceptor_.reset();
    ioc_.reset();
    running_ = false;
    return false;
  }

  SPDLOG_INFO("MockSubmissionServer: listening on {}:{}{}", address, bound_port_.load(), path_);

  StartAccept();
  server_thread_ = std::thread([this]() {
    try {
      ioc_->run();
    } catch (const std::exception& e) {
      SPDLOG_ERROR("MockSubmissionServer: io_context error: {}", e.what());
    }
  });
  return true;
}

void MockSubmissionServer::Stop() {
  if (!running_.exchange(false)) {
    return;  // Not running
  }

  // Close the acceptor and every connection on the io thread, then let run() drain
  net::post(*ioc_, [this]() {
    boost::system::error_code ec;
    acceptor_->cancel(ec);
    acceptor_->close(ec);
    CloseSessions();
  });
  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  acceptor_.reset();
  ioc_.reset();
  bound_port_ = 0;
  SPDLOG_INFO("MockSubmissionServer: stopped");
}

size_t MockSubmissionServer::GetReceivedCount() const {
  std::lock_guard<std::mutex> lock(received_mutex_);
  return received_bodies_.size();
}

std::vector<std::string> MockSubmissionServer::GetReceivedBodies() const {
  std::lock_guard<std::mutex> lock(received_mutex_);
  return received_bodies_;
}

void MockSubmissionServer::StartAccept() {
  acceptor_->async_accept([this](boost::system::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec == net::error::operation_aborted) {
        SPDLOG_DEBUG("MockSubmissionServer: accept cancelled");
      } else {
        SPDLOG_ERROR("MockSubmissionServer: accept error: {}", ec.message());
      }
      return;
    }

    // Forget finished sessions
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const std::weak_ptr<MockSubmissionSession>& session) {
                                     return session.expired();
                                   }),
                    sessions_.end());

    auto session = std::make_shared<MockSubmissionSession>(std::move(socket), this);
    sessions_.push_back(session);
    session->Run();

    if (running_.load()) {
      StartAccept();
    }
  });
}

void MockSubmissionServer::CloseSessions() {
  for (auto& weak_session : sessions_) {
    if (auto session = weak_session.lock()) {
      session->Close();
    }
  }
  sessions_.clear();
}

void MockSubmissionServer::HandleRequest(const HttpRequest& req, HttpResponse& resp) {
  std::string target = std::string(req.target());

  if (req.method() == http::verb::post && target == path_) {
    HandleSubmit(req, resp);
  } else if (req.method() == http::verb::get && target == "/health") {
    HandleHealth(resp);
  } else {
    HandleNotFound(resp);
  }
}

void MockSubmissionServer::HandleSubmit(const HttpRequest& req, HttpResponse& resp) {
  std::string content_type = std::string(req[http::field::content_type]);
  if (content_type.compare(0, 16, "application/json") != 0) {
    WriteError(resp, http::status::bad_request, "Content-Type must be application/json");
    return;
  }

  if (req["Signature"].empty()) {
    WriteError(resp, http::status::unauthorized, "Signature header is required");
    return;
  }

  nlohmann::json document = nlohmann::json::parse(req.body(), nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    WriteError(resp, http::status::bad_request, "Body must be a JSON object");
    return;
  }

  uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(received_mutex_);
    received_bodies_.push_back(req.body());
    id = next_document_id_++;
  }
  SPDLOG_DEBUG("MockSubmissionServer: accepted document #{} (doc_type={})", id,
               document.value("doc_type", std::string()));

  nlohmann::json result_json;
  result_json["value"] = "mock-" + std::to_string(id);
  resp.result(http::status::ok);
  resp.set(http::field::content_type, "application/json");
  resp.body() = result_json.dump();
  resp.prepare_payload();
}

void MockSubmissionServer::HandleHealth(HttpResponse& resp) {
  resp.result(http::status::ok);
  resp.set(http::field::content_type, "application/json");
  nlohmann::json health_json;
  health_json["status"] = "ok";
  resp.body() = health_json.dump();
  resp.prepare_payload();
}

void MockSubmissionServer::HandleNotFound(HttpResponse& resp) {
  WriteError(resp, http::status::not_found, "Not found");
}

void MockSubmissionServer::WriteError(HttpResponse& resp, http::status status, const std::string& message) {
  resp.result(status);
  resp.set(http::field::content_type, "application/json");
  nlohmann::json error_json;
  error_json["error_message"] = message;
  resp.body() = error_json.dump();
  resp.prepare_payload();
}

}  // namespace docgate
