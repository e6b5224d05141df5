#include "http.hpp"
#include <algorithm>

static bool ends_with(const std::string &str, const std::string &suffix) {
  if (suffix.size() > str.size())
    return false;
  return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static void strip_cr(std::string &line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::string Request::header(const std::string &name) const {
  std::string wanted = to_lower(name);
  for (const auto &[key, value] : headers) {
    if (to_lower(key) == wanted) {
      return value;
    }
  }
  return "";
}

Request parse_request(const std::string &raw) {
  Request req;

  size_t header_end = raw.find("\r\n\r\n");
  std::string head =
      header_end == std::string::npos ? raw : raw.substr(0, header_end);
  if (header_end != std::string::npos) {
    req.body = raw.substr(header_end + 4);
  }

  std::istringstream iss(head);
  std::string line;

  if (std::getline(iss, line)) {
    strip_cr(line);
    std::istringstream line_stream(line);
    line_stream >> req.method >> req.target >> req.version;
  }

  while (std::getline(iss, line)) {
    strip_cr(line);
    if (line.empty()) {
      break;
    }
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
      std::string key = line.substr(0, colon);
      std::string value = line.substr(colon + 1);
      size_t first = value.find_first_not_of(" \t");
      value = first == std::string::npos ? "" : value.substr(first);
      req.headers[key] = value;
    }
  }

  size_t query_pos = req.target.find('?');
  if (query_pos != std::string::npos) {
    req.path = req.target.substr(0, query_pos);
    req.query = req.target.substr(query_pos + 1);
  } else {
    req.path = req.target;
  }

  return req;
}

bool url_decode(const std::string &in, std::string &out) {
  out.clear();
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '%') {
      if (i + 3 > in.size()) {
        return false;
      }
      int value = 0;
      std::istringstream is(in.substr(i + 1, 2));
      if (!(is >> std::hex >> value) ||
          !std::isxdigit(static_cast<unsigned char>(in[i + 1])) ||
          !std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
        return false;
      }
      out += static_cast<char>(value);
      i += 2;
    } else {
      out += in[i];
    }
  }
  return true;
}

std::string url_encode(const std::string &in) {
  static const char *hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(in.size());
  for (unsigned char c : in) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += hex[c >> 4];
      out += hex[c & 0x0F];
    }
  }
  return out;
}

std::string get_mime_type(const std::string &path) {
  if (ends_with(path, ".html") || ends_with(path, ".htm"))
    return "text/html";
  if (ends_with(path, ".css"))
    return "text/css";
  if (ends_with(path, ".js") || ends_with(path, ".mjs"))
    return "application/javascript";
  if (ends_with(path, ".json") || ends_with(path, ".map"))
    return "application/json";
  if (ends_with(path, ".png"))
    return "image/png";
  if (ends_with(path, ".jpg") || ends_with(path, ".jpeg"))
    return "image/jpeg";
  if (ends_with(path, ".gif"))
    return "image/gif";
  if (ends_with(path, ".webp"))
    return "image/webp";
  if (ends_with(path, ".svg"))
    return "image/svg+xml";
  if (ends_with(path, ".ico"))
    return "image/x-icon";
  if (ends_with(path, ".woff"))
    return "font/woff";
  if (ends_with(path, ".woff2"))
    return "font/woff2";
  if (ends_with(path, ".ttf"))
    return "font/ttf";
  if (ends_with(path, ".wasm"))
    return "application/wasm";
  if (ends_with(path, ".pdf"))
    return "application/pdf";
  if (ends_with(path, ".xml"))
    return "application/xml";
  if (ends_with(path, ".txt") || ends_with(path, ".md"))
    return "text/plain";
  return "application/octet-stream";
}
