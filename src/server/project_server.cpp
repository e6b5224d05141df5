#include "project_server.hpp"
#include "core/errors.hpp"
#include "livereload.js.h"
#include "utils/log.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <netinet/in.h>
#include <regex>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
constexpr std::size_t kMaxBodyBytes = 8 * 1024 * 1024;

bool starts_with(const std::string &str, const std::string &prefix) {
  if (prefix.size() > str.size())
    return false;
  return str.compare(0, prefix.size(), prefix) == 0;
}

std::optional<std::string> read_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  return std::string((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
}

} // namespace

ProjectServer::ProjectServer(const AccessPolicy &policy, Options options)
    : policy_(policy), options_(std::move(options)),
      proxy_client_(options_.proxy_timeout) {}

ProjectServer::~ProjectServer() { stop(); }

ProjectServer::Binding ProjectServer::start(const Project &project) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (binding_) {
    return *binding_;
  }

  std::error_code ec;
  fs::path root = fs::canonical(project.root, ec);
  if (ec) {
    throw ConfigurationError("Project root not found: " + project.root.string());
  }

  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd == -1) {
    if (errno == EMFILE || errno == ENFILE || errno == ENOBUFS) {
      throw ResourceExhaustion(std::string("Failed to create socket: ") +
                               std::strerror(errno));
    }
    throw PreviewError(std::string("Failed to create socket: ") +
                       std::strerror(errno));
  }

  int opt = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    log_warn(std::string("Failed to set SO_REUSEADDR: ") + std::strerror(errno));
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(0);
  if (::inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) != 1) {
    ::close(fd);
    throw ConfigurationError("Invalid listen address: " + options_.host);
  }

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(fd);
    if (err == EADDRINUSE || err == EADDRNOTAVAIL || err == ENOBUFS) {
      throw ResourceExhaustion("No free port on " + options_.host + ": " +
                               std::strerror(err));
    }
    throw PreviewError("Bind failed on " + options_.host + ": " +
                       std::strerror(err));
  }

  if (::listen(fd, 64) < 0) {
    int err = errno;
    ::close(fd);
    throw PreviewError(std::string("Listen failed: ") + std::strerror(err));
  }

  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) < 0) {
    int err = errno;
    ::close(fd);
    throw PreviewError(std::string("getsockname failed: ") + std::strerror(err));
  }
  int port = ntohs(addr.sin_port);

  project_id_ = project.id;
  root_ = root;
  entry_document_ = project.entry_document;
  proxy_rules_ = project.proxy_rules;
  {
    std::lock_guard<std::mutex> decisions_lock(decisions_mutex_);
    decisions_.clear();
  }

  binding_ = Binding{port, "http://" + options_.host + ":" +
                               std::to_string(port) + "/"};
  server_fd_ = fd;
  running_ = true;
  accept_thread_ = std::thread([this, fd]() { accept_loop(fd); });

  return *binding_;
}

void ProjectServer::stop() {
  int fd = -1;
  std::thread thread;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!binding_) {
      return;
    }
    running_ = false;
    fd = server_fd_;
    server_fd_ = -1;
    thread = std::move(accept_thread_);
    binding_.reset();
  }

  // shutdown() wakes the blocked accept(), the descriptor is closed once
  // the loop is gone.
  if (fd != -1) {
    ::shutdown(fd, SHUT_RDWR);
  }
  if (thread.joinable()) {
    thread.join();
  }
  if (fd != -1) {
    ::close(fd);
  }
}

std::optional<ProjectServer::Binding> ProjectServer::binding() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return binding_;
}

void ProjectServer::update_proxy_rules(std::vector<ProxyRule> rules) {
  std::lock_guard<std::mutex> lock(mutex_);
  proxy_rules_ = std::move(rules);
}

void ProjectServer::accept_loop(int listen_fd) {
  while (running_.load()) {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept4(listen_fd, reinterpret_cast<sockaddr *>(&client_addr),
                  &client_len, SOCK_CLOEXEC);

    if (client_fd < 0) {
      int err = errno;
      if (!running_.load() || err == EINVAL || err == EBADF) {
        break;
      }
      if (err == EINTR || err == ECONNABORTED) {
        continue;
      }
      log_error("[" + project_id_ + "] Accept failed: " + std::strerror(err));
      if (err == EMFILE || err == ENFILE) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
      continue;
    }

    timeval tv{};
    tv.tv_sec = 5;
    ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    try {
      handle_client(client_fd);
    } catch (const std::exception &e) {
      log_error("[" + project_id_ + "] Request failed: " + e.what());
    }
    ::close(client_fd);
  }
}

bool ProjectServer::read_request(int client_fd, std::string &raw) {
  char buffer[8192];
  size_t header_end = std::string::npos;

  while (header_end == std::string::npos) {
    ssize_t bytes = ::recv(client_fd, buffer, sizeof(buffer), 0);
    if (bytes <= 0) {
      return false;
    }
    raw.append(buffer, static_cast<size_t>(bytes));
    header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos && raw.size() > kMaxHeaderBytes) {
      return false;
    }
  }

  Request head = parse_request(raw.substr(0, header_end + 4));
  std::string length_header = head.header("Content-Length");
  if (length_header.empty()) {
    return true;
  }

  size_t content_length = 0;
  try {
    content_length = std::stoul(length_header);
  } catch (const std::exception &) {
    return false;
  }
  if (content_length > kMaxBodyBytes) {
    return false;
  }

  while (raw.size() - (header_end + 4) < content_length) {
    ssize_t bytes = ::recv(client_fd, buffer, sizeof(buffer), 0);
    if (bytes <= 0) {
      return false;
    }
    raw.append(buffer, static_cast<size_t>(bytes));
  }
  return true;
}

void ProjectServer::handle_client(int client_fd) {
  std::string raw;
  Response res;
  Request req;

  if (read_request(client_fd, raw)) {
    req = parse_request(raw);
    res = handle(req);
  } else {
    res.status = 400;
    res.set_content("Bad Request", "text/plain");
  }

  if (!options_.quiet && !req.method.empty()) {
    log_request(project_id_, req.method, req.path, res.status, res.body.size());
  }

  std::string response = res.to_http();
  size_t sent = 0;
  while (sent < response.size()) {
    ssize_t n = ::send(client_fd, response.data() + sent, response.size() - sent,
                       MSG_NOSIGNAL);
    if (n <= 0) {
      break;
    }
    sent += static_cast<size_t>(n);
  }
}

Response ProjectServer::handle(const Request &req) {
  Response res;
  res.head_only = req.method == "HEAD";

  try {
    if (try_proxy(req, res)) {
      return res;
    }

    if (req.method != "GET" && req.method != "HEAD") {
      res.status = 405;
      res.headers["Allow"] = "GET, HEAD";
      res.set_content("Method Not Allowed", "text/plain");
      return res;
    }

    if (req.path == kLivereloadPath && options_.inject_livereload &&
        !options_.livereload_url.empty()) {
      serve_livereload_script(res);
      return res;
    }

    std::string decoded;
    if (!url_decode(req.path, decoded) ||
        decoded.find('\0') != std::string::npos) {
      res.status = 400;
      res.set_content("Bad Request", "text/plain");
      return res;
    }

    if (serve_static(decoded, res)) {
      return res;
    }

    // Client side routes: /app/settings has no file behind it.
    if (fs::path(decoded).extension().empty() && serve_entry_document(res)) {
      return res;
    }

    res.status = 404;
    res.set_content("<h1>404 - Page Not Found</h1>", "text/html");
  } catch (const ServeError &e) {
    if (!options_.quiet) {
      log_warn("[" + project_id_ + "] " + e.what());
    }
    res.status = 403;
    res.set_content("<h1>403 - Forbidden</h1>", "text/html");
  }

  return res;
}

bool ProjectServer::try_proxy(const Request &req, Response &res) {
  std::optional<ProxyRule> rule;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &candidate : proxy_rules_) {
      if (starts_with(req.path, candidate.prefix)) {
        rule = candidate;
        break;
      }
    }
  }

  if (!rule) {
    return false;
  }

  auto target = ProxyTarget::parse(rule->target);
  if (!target) {
    res.status = 502;
    res.set_content("Unsupported proxy target: " + rule->target, "text/plain");
    return true;
  }

  try {
    bool head_only = res.head_only;
    res = proxy_client_.forward(*target, req);
    res.head_only = head_only;
  } catch (const ProxyTimeout &e) {
    if (!options_.quiet) {
      log_warn("[" + project_id_ + "] Proxy " + rule->target + ": " + e.what());
    }
    res = Response{};
    res.status = 504;
    res.set_content("Gateway Timeout: " + rule->target + " did not answer",
                    "text/plain");
  } catch (const std::exception &e) {
    if (!options_.quiet) {
      log_warn("[" + project_id_ + "] Proxy " + rule->target + " failed: " +
               e.what());
    }
    res = Response{};
    res.status = 502;
    res.set_content("Bad Gateway: " + rule->target + " is unreachable",
                    "text/plain");
  }
  return true;
}

bool ProjectServer::serve_static(const std::string &decoded_path,
                                 Response &res) {
  auto file = resolve(decoded_path);
  if (!file) {
    return false;
  }

  auto content = read_file(*file);
  if (!content) {
    return false;
  }

  std::string type = get_mime_type(file->string());
  if (type == "text/html") {
    *content = inject_livereload(*content);
  }

  res.status = 200;
  res.set_content(*content, type);
  res.headers["Cache-Control"] = "no-cache";
  return true;
}

bool ProjectServer::serve_entry_document(Response &res) {
  if (entry_document_.empty()) {
    return false;
  }
  return serve_static("/" + entry_document_, res);
}

void ProjectServer::serve_livereload_script(Response &res) {
  std::string script(reinterpret_cast<const char *>(assets_livereload_js),
                     assets_livereload_js_len);

  script = std::regex_replace(
      script, std::regex(R"(\{\{\s*livereload_ws_url\s*\}\})"),
      options_.livereload_url + "?project=" + url_encode(project_id_));
  res.set_content(script, "text/javascript");
  res.headers["Cache-Control"] = "no-cache";
}

std::optional<fs::path> ProjectServer::resolve(const std::string &decoded_path) {
  fs::path relative = fs::path(decoded_path).relative_path().lexically_normal();
  if (!relative.empty() && *relative.begin() == "..") {
    throw ServeError("Path escapes project root: " + decoded_path);
  }

  fs::path candidate =
      (relative.empty() || relative == ".") ? root_ : root_ / relative;

  std::error_code ec;
  if (fs::is_directory(candidate, ec)) {
    candidate /= "index.html";
  }
  if (!fs::is_regular_file(candidate, ec)) {
    return std::nullopt;
  }

  fs::path real = fs::canonical(candidate, ec);
  if (ec) {
    return std::nullopt;
  }

  if (!PathAccessPolicy::is_within(real, root_)) {
    throw ServeError("Path leaves project root through a link: " + decoded_path);
  }
  if (!permitted(real)) {
    throw ServeError("Access denied: " + decoded_path);
  }
  return real;
}

bool ProjectServer::permitted(const fs::path &file) {
  std::lock_guard<std::mutex> lock(decisions_mutex_);
  auto it = decisions_.find(file.string());
  if (it != decisions_.end()) {
    return it->second;
  }

  ++permission_checks_;
  bool allowed = policy_.can_access(file, AccessOperation::Read);
  decisions_[file.string()] = allowed;
  return allowed;
}

std::string ProjectServer::inject_livereload(const std::string &html) const {
  if (!options_.inject_livereload || options_.livereload_url.empty()) {
    return html;
  }

  std::string dev_script = std::string("\n<script defer src=\"") +
                           kLivereloadPath + "\"></script>\n";

  size_t head_close = html.find("</head>");
  if (head_close != std::string::npos) {
    return html.substr(0, head_close) + dev_script + html.substr(head_close);
  }
  return html + dev_script;
}
