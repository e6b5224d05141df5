#pragma once

#include <cctype>
#include <sstream>
#include <string>
#include <unordered_map>

struct Request {
  std::string method;
  std::string target;
  std::string path;
  std::string query;
  std::string version;
  std::unordered_map<std::string, std::string> headers;
  std::string body;

  // Header lookup ignoring case, "" when absent.
  std::string header(const std::string &name) const;
};

struct Response {
  int status = 200;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
  bool head_only = false;

  void set_content(const std::string &content, const std::string &type) {
    body = content;
    headers["Content-Type"] = type;
  }

  std::string to_http() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << get_status_text(status) << "\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n";

    for (const auto &[key, value] : headers) {
      oss << key << ": " << value << "\r\n";
    }

    oss << "\r\n";
    if (!head_only) {
      oss << body;
    }
    return oss.str();
  }

  static std::string get_status_text(int code) {
    switch (code) {
    case 200:
      return "OK";
    case 201:
      return "Created";
    case 202:
      return "Accepted";
    case 204:
      return "No Content";
    case 301:
      return "Moved Permanently";
    case 302:
      return "Found";
    case 304:
      return "Not Modified";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 500:
      return "Internal Server Error";
    case 502:
      return "Bad Gateway";
    case 503:
      return "Service Unavailable";
    case 504:
      return "Gateway Timeout";
    default:
      return "Unknown";
    }
  }
};

// Parses the request line and headers of a raw HTTP/1.x request. The body
// is whatever follows the blank line.
Request parse_request(const std::string &raw);

// %XX decoding of a URL path. Returns false on a malformed escape.
bool url_decode(const std::string &in, std::string &out);

// Percent-encodes everything but unreserved characters, for query values.
std::string url_encode(const std::string &in);

std::string get_mime_type(const std::string &path);

std::string to_lower(std::string value);
