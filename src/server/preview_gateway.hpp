#pragma once

#include "core/preview_registry.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace net = boost::asio;
using tcp = net::ip::tcp;

// Single port in front of the registry. WebSocket upgrades become
// broadcast channels ("?project=<id>" scopes one, none means the catalogue);
// plain requests go to the JSON control API under /projects.
class PreviewGateway {
public:
  using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
  using HttpResponse =
      boost::beast::http::response<boost::beast::http::string_body>;

  struct Options {
    std::string host = "127.0.0.1";
    // Zero picks a free port.
    int port = 3001;
  };

  PreviewGateway(PreviewRegistry &registry, Options options);
  ~PreviewGateway();

  PreviewGateway(const PreviewGateway &) = delete;
  PreviewGateway &operator=(const PreviewGateway &) = delete;

  // Binds before returning and points the registry's live-reload script at
  // this gateway. Throws StartupError when the port cannot be bound.
  int start();
  void stop();

  int port() const { return port_.load(); }
  std::string ws_url() const;
  std::string http_url() const;

  HttpResponse handle_control(const HttpRequest &req);

  // Called by channel sessions.
  void track(const std::shared_ptr<Channel> &channel);
  void release(const std::shared_ptr<Channel> &channel);
  std::size_t session_count() const;

  PreviewRegistry &registry() { return registry_; }

private:
  void do_accept();
  std::string public_host() const;

  PreviewRegistry &registry_;
  Options options_;

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<int> port_{0};

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Channel>> channels_;
};
