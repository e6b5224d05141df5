#pragma once

#include "server/http.hpp"
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

struct ProxyTarget {
  std::string host;
  std::string port;
  // Prepended to the forwarded path, no trailing slash.
  std::string base_path;

  // Only plain http:// targets are supported.
  static std::optional<ProxyTarget> parse(const std::string &url);
};

// The target accepted nothing or answered nothing within the timeout.
class ProxyTimeout : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Forwards a request to a proxy rule target over a fresh connection.
class ProxyClient {
public:
  explicit ProxyClient(std::chrono::milliseconds timeout) : timeout_(timeout) {}

  // Throws ProxyTimeout when the whole exchange takes longer than the
  // timeout, boost::system::system_error when the target cannot be reached
  // or answers garbage.
  Response forward(const ProxyTarget &target, const Request &req) const;

private:
  std::chrono::milliseconds timeout_;
};
