#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace docgate {

class MockSubmissionServer;

// One HTTP exchange on an accepted connection: read, answer (optionally
// delayed), half-close. Runs on the server's io_context.
class MockSubmissionSession : public std::enable_shared_from_this<MockSubmissionSession> {
 public:
  MockSubmissionSession(boost::asio::ip::tcp::socket socket, MockSubmissionServer* server);

  void Run();

  // Abort pending I/O and the response delay
  void Close();

 private:
  boost::asio::steady_timer delay_timer_;  // Built from the socket before it moves into stream_
  boost::beast::tcp_stream stream_;
  MockSubmissionServer* server_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  boost::beast::http::response<boost::beast::http::string_body> resp_;

  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void OnDelay(boost::beast::error_code ec);
  void DoWrite();
  void OnWrite(boost::beast::error_code ec, std::size_t bytes_transferred);
};

/**
 * @brief Local stand-in for the document-creation endpoint
 *
 * Plain HTTP server. POST <path> checks the Content-Type and Signature
 * headers and that the body is a JSON object, then answers
 * 200 {"value": "<generated id>"}; malformed requests get 400 and a missing
 * signature 401, both with {"error_message": "..."}. GET /health answers
 * {"status":"ok"}. Every accepted document body is recorded.
 *
 * All connections are served on one io_context thread. Stop() closes the
 * listener and every open connection, so it never waits on a silent client.
 */
class MockSubmissionServer {
 public:
  using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
  using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

  explicit MockSubmissionServer(std::string path = "/api/v3/lk/documents/create");
  ~MockSubmissionServer();

  // Non-copyable
  MockSubmissionServer(const MockSubmissionServer&) = delete;
  MockSubmissionServer& operator=(const MockSubmissionServer&) = delete;

  // Bind and start serving. Port 0 picks an ephemeral port (see GetPort()).
  bool Start(const std::string& address, uint16_t port);

  void Stop();

  bool IsRunning() const { return running_.load(); }

  // Port actually bound; 0 before Start()
  uint16_t GetPort() const { return bound_port_.load(); }

  const std::string& GetPath() const { return path_; }

  // Delay before every answer, to simulate a slow endpoint
  void SetResponseDelay(std::chrono::milliseconds delay) { response_delay_ms_ = delay.count(); }
  std::chrono::milliseconds GetResponseDelay() const { return std::chrono::milliseconds(response_delay_ms_.load()); }

  size_t GetReceivedCount() const;
  std::vector<std::string> GetReceivedBodies() const;

  // Route one request (exposed for in-process tests)
  void HandleRequest(const HttpRequest& req, HttpResponse& resp);

 private:
  std::string path_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> bound_port_{0};
  std::atomic<int64_t> response_delay_ms_{0};

  std::unique_ptr<boost::asio::io_context> ioc_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::thread server_thread_;

  // Open connections; only touched on the io_context thread
  std::vector<std::weak_ptr<MockSubmissionSession>> sessions_;

  mutable std::mutex received_mutex_;
  std::vector<std::string> received_bodies_;
  uint64_t next_document_id_ = 1;

  void StartAccept();
  void CloseSessions();
  void HandleSubmit(const HttpRequest& req, HttpResponse& resp);
  void HandleHealth(HttpResponse& resp);
  void HandleNotFound(HttpResponse& resp);
  void WriteError(HttpResponse& resp, boost::beast::http::status status, const std::string& message);
};

}  // namespace docgate
