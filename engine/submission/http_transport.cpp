#include "http_transport.hpp"
#include "engine/common/util.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <spdlog/spdlog.h>

#include <future>
#include <memory>
#include <thread>

namespace docgate {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

// Run one asynchronous step to completion on ioc. The tcp_stream expiry set
// by the caller bounds it; a timeout surfaces as beast::error::timeout.
template <typename Initiate>
void RunStep(net::io_context& ioc, const char* step, Initiate&& initiate) {
  beast::error_code result = net::error::would_block;
  initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
  ioc.restart();
  ioc.run();
  if (result) {
    throw boost::system::system_error(result, step);
  }
}

// Blocking name lookup bounded by timeout. getaddrinfo cannot be interrupted,
// so the lookup runs on a detached thread that owns everything it touches; a
// late result is dropped.
tcp::resolver::results_type ResolveWithTimeout(const std::string& host,
                                               const std::string& port,
                                               std::chrono::milliseconds timeout) {
  auto result = std::make_shared<std::promise<tcp::resolver::results_type>>();
  auto future = result->get_future();
  std::thread([host, port, result]() {
    try {
      net::io_context ioc;
      tcp::resolver resolver(ioc);
      result->set_value(resolver.resolve(host, port));
    } catch (const std::exception&) {
      result->set_exception(std::current_exception());
    }
  }).detach();

  if (future.wait_for(timeout) != std::future_status::ready) {
    throw boost::system::system_error(beast::error::timeout, "resolve " + host);
  }
  return future.get();
}

http::request<http::string_body> BuildRequest(const HttpRequest& request,
                                              const engine::common::ParsedUrl& url,
                                              const std::string& user_agent) {
  http::request<http::string_body> req{http::verb::post, url.path, 11};
  bool default_port = (url.IsSecure() && url.port == "443") || (!url.IsSecure() && url.port == "80");
  req.set(http::field::host, default_port ? url.host : url.host + ":" + url.port);
  req.set(http::field::user_agent, user_agent.empty() ? BOOST_BEAST_VERSION_STRING : user_agent);
  for (const auto& header : request.headers) {
    req.set(header.first, header.second);
  }
  req.body() = request.body;
  req.prepare_payload();
  return req;
}

template <typename Stream>
HttpResponse Exchange(net::io_context& ioc,
                      Stream& stream,
                      const http::request<http::string_body>& req,
                      std::chrono::milliseconds request_timeout) {
  beast::get_lowest_layer(stream).expires_after(request_timeout);
  RunStep(ioc, "write", [&](auto handler) { http::async_write(stream, req, std::move(handler)); });

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  RunStep(ioc, "read", [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); });

  HttpResponse response;
  response.status_code = static_cast<int>(res.result_int());
  response.body = res.body();
  for (const auto& field : res) {
    response.headers[std::string(field.name_string())] = std::string(field.value());
  }
  return response;
}

}  // namespace

HttpResponse BeastHttpTransport::Post(const HttpRequest& request) {
  engine::common::ParsedUrl url = engine::common::ParseHttpUrl(request.url);
  auto req = BuildRequest(request, url, options_.user_agent);

  tcp::resolver::results_type endpoints = ResolveWithTimeout(url.host, url.port, options_.connect_timeout);

  net::io_context ioc;

  if (!url.IsSecure()) {
    beast::tcp_stream stream(ioc);
    stream.expires_after(options_.connect_timeout);
    RunStep(ioc, "connect", [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); });

    HttpResponse response = Exchange(ioc, stream, req, options_.request_timeout);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
      SPDLOG_DEBUG("BeastHttpTransport: shutdown warning for {}: {}", url.host, ec.message());
    }
    return response;
  }

  ssl::context ctx(ssl::context::tlsv12_client);
  ctx.set_default_verify_paths();
  if (options_.verify_tls) {
    ctx.set_verify_mode(ssl::verify_peer);
    ctx.set_verify_callback(ssl::host_name_verification(url.host));
  } else {
    ctx.set_verify_mode(ssl::verify_none);
  }

  ssl::stream<beast::tcp_stream> stream(ioc, ctx);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
    beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
    throw boost::system::system_error(ec, "SNI");
  }

  beast::get_lowest_layer(stream).expires_after(options_.connect_timeout);
  RunStep(ioc, "connect", [&](auto handler) {
    beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
  });
  RunStep(ioc, "handshake", [&](auto handler) {
    stream.async_handshake(ssl::stream_base::client, std::move(handler));
  });

  HttpResponse response = Exchange(ioc, stream, req, options_.request_timeout);

  // Graceful shutdown; "stream truncated" and "not connected" are harmless
  beast::get_lowest_layer(stream).expires_after(options_.connect_timeout);
  beast::error_code shutdown_ec;
  stream.async_shutdown([&shutdown_ec](beast::error_code ec) { shutdown_ec = ec; });
  ioc.restart();
  ioc.run();
  if (shutdown_ec && shutdown_ec != net::ssl::error::stream_truncated &&
      shutdown_ec != beast::errc::not_connected) {
    SPDLOG_DEBUG("BeastHttpTransport: shutdown warning for {}: {}", url.host, shutdown_ec.message());
  }
  return response;
}

}  // namespace docgate
