#pragma once

#include "core/access_policy.hpp"
#include "core/project.hpp"
#include "server/http.hpp"
#include "server/proxy_client.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// Per-project HTTP endpoint on an ephemeral port. Proxy rules are tried in
// order, then static files under the root, then the entry document for
// extension-less paths.
class ProjectServer {
public:
  struct Options {
    std::string host = "127.0.0.1";
    std::chrono::milliseconds proxy_timeout{10000};
    bool inject_livereload = true;
    // ws:// endpoint of the channel gateway; no injection when empty.
    std::string livereload_url;
    bool quiet = false;
  };

  struct Binding {
    int port = 0;
    std::string base_url;
  };

  static constexpr const char *kLivereloadPath = "/__hotpreview/livereload.js";

  ProjectServer(const AccessPolicy &policy, Options options);
  ~ProjectServer();

  ProjectServer(const ProjectServer &) = delete;
  ProjectServer &operator=(const ProjectServer &) = delete;

  // Idempotent. Throws ResourceExhaustion when no port can be bound.
  Binding start(const Project &project);
  void stop();

  bool running() const { return running_.load(); }
  std::optional<Binding> binding() const;

  void update_proxy_rules(std::vector<ProxyRule> rules);

  Response handle(const Request &req);

  // How often the access policy was consulted; decisions are cached.
  std::size_t permission_checks() const { return permission_checks_.load(); }

private:
  void accept_loop(int listen_fd);
  void handle_client(int client_fd);
  bool read_request(int client_fd, std::string &raw);

  bool try_proxy(const Request &req, Response &res);
  bool serve_static(const std::string &decoded_path, Response &res);
  bool serve_entry_document(Response &res);
  void serve_livereload_script(Response &res);

  // Maps a decoded URL path onto the root. Throws ServeError when the path
  // escapes the root or the policy denies it.
  std::optional<std::filesystem::path> resolve(const std::string &decoded_path);
  bool permitted(const std::filesystem::path &file);
  std::string inject_livereload(const std::string &html) const;

  const AccessPolicy &policy_;
  Options options_;
  ProxyClient proxy_client_;

  std::string project_id_;
  std::filesystem::path root_;
  std::string entry_document_;

  mutable std::mutex mutex_;
  std::vector<ProxyRule> proxy_rules_;
  std::optional<Binding> binding_;

  std::mutex decisions_mutex_;
  std::unordered_map<std::string, bool> decisions_;
  std::atomic<std::size_t> permission_checks_{0};

  int server_fd_ = -1;
  std::atomic<bool> running_{false};
  std::thread accept_thread_;
};
