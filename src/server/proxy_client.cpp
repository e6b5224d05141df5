#include "proxy_client.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <unordered_set>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

std::optional<ProxyTarget> ProxyTarget::parse(const std::string &url) {
  const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    return std::nullopt;
  }

  std::string rest = url.substr(scheme.size());
  std::string authority = rest;
  std::string path;
  size_t slash = rest.find('/');
  if (slash != std::string::npos) {
    authority = rest.substr(0, slash);
    path = rest.substr(slash);
  }
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  if (authority.empty()) {
    return std::nullopt;
  }

  ProxyTarget target;
  target.base_path = path;
  size_t colon = authority.rfind(':');
  if (colon != std::string::npos) {
    target.host = authority.substr(0, colon);
    target.port = authority.substr(colon + 1);
  } else {
    target.host = authority;
    target.port = "80";
  }
  if (target.host.empty() || target.port.empty()) {
    return std::nullopt;
  }
  return target;
}

Response ProxyClient::forward(const ProxyTarget &target,
                              const Request &req) const {
  static const std::unordered_set<std::string> hop_by_hop = {
      "connection", "keep-alive",        "proxy-connection", "transfer-encoding",
      "upgrade",    "content-length",    "te",               "trailer",
      "host",       "proxy-authenticate", "proxy-authorization"};

  http::request<http::string_body> upstream_req;
  upstream_req.method_string(req.method);
  upstream_req.target(target.base_path + req.target);
  upstream_req.version(11);
  for (const auto &[key, value] : req.headers) {
    if (!hop_by_hop.count(to_lower(key))) {
      upstream_req.set(key, value);
    }
  }
  upstream_req.set(http::field::host, target.host + ":" + target.port);
  upstream_req.set(http::field::connection, "close");
  upstream_req.body() = req.body;
  upstream_req.prepare_payload();

  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(64 * 1024 * 1024);
  beast::error_code result;

  // tcp_stream deadlines only apply to async operations. One deadline
  // covers connect, write and read together.
  resolver.async_resolve(
      target.host, target.port,
      [&](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
          result = ec;
          return;
        }
        stream.expires_after(timeout_);
        stream.async_connect(results, [&](beast::error_code ec,
                                          const tcp::endpoint &) {
          if (ec) {
            result = ec;
            return;
          }
          http::async_write(
              stream, upstream_req, [&](beast::error_code ec, std::size_t) {
                if (ec) {
                  result = ec;
                  return;
                }
                http::async_read(stream, buffer, parser,
                                 [&](beast::error_code ec, std::size_t) {
                                   result = ec;
                                 });
              });
        });
      });
  ioc.run();

  if (result == beast::error::timeout) {
    throw ProxyTimeout("No answer from " + target.host + ":" + target.port +
                       " within " + std::to_string(timeout_.count()) + "ms");
  }
  if (result) {
    throw beast::system_error(result);
  }

  auto &upstream_res = parser.get();

  Response res;
  res.status = static_cast<int>(upstream_res.result_int());
  res.body = std::move(upstream_res.body());
  for (const auto &field : upstream_res) {
    std::string key(field.name_string());
    if (!hop_by_hop.count(to_lower(key))) {
      res.headers[key] = std::string(field.value());
    }
  }

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);

  return res;
}
