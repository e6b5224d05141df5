#include "preview_gateway.hpp"
#include "core/errors.hpp"
#include "server/http.hpp"
#include "server/messages.hpp"
#include "utils/log.hpp"
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using json = nlohmann::json;

namespace {

constexpr std::size_t kMaxControlBody = 1024 * 1024;

std::string query_param(const std::string &target, const std::string &name) {
  size_t question = target.find('?');
  if (question == std::string::npos) {
    return "";
  }

  std::string query = target.substr(question + 1);
  size_t pos = 0;
  while (pos <= query.size()) {
    size_t amp = query.find('&', pos);
    std::string pair = query.substr(
        pos, amp == std::string::npos ? std::string::npos : amp - pos);
    size_t eq = pair.find('=');
    if (pair.substr(0, eq) == name) {
      std::string value;
      if (eq != std::string::npos && url_decode(pair.substr(eq + 1), value)) {
        return value;
      }
      return "";
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return "";
}

PreviewGateway::HttpResponse json_response(const PreviewGateway::HttpRequest &req,
                                           http::status status,
                                           const json &body) {
  PreviewGateway::HttpResponse res{status, req.version()};
  res.set(http::field::server, "hotpreview");
  res.set(http::field::content_type, "application/json");
  res.set(http::field::cache_control, "no-cache");
  res.keep_alive(false);
  if (!body.is_null()) {
    res.body() = body.dump();
  }
  res.prepare_payload();
  return res;
}

PreviewGateway::HttpResponse error_response(const PreviewGateway::HttpRequest &req,
                                            http::status status,
                                            const std::string &message,
                                            bool retryable = false) {
  json body = {{"error", message}};
  if (retryable) {
    body["retryable"] = true;
  }
  return json_response(req, status, body);
}

// Pushes one channel's mailbox to a WebSocket client, one write at a time.
class ChannelSession : public std::enable_shared_from_this<ChannelSession> {
public:
  ChannelSession(beast::tcp_stream &&stream, std::shared_ptr<Channel> channel,
                 PreviewGateway &gateway)
      : ws_(std::move(stream)), channel_(std::move(channel)),
        gateway_(gateway) {}

  void run(PreviewGateway::HttpRequest req) {
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(
        websocket::stream_base::decorator([](websocket::response_type &res) {
          res.set(http::field::server, "hotpreview");
        }));

    ws_.async_accept(req, beast::bind_front_handler(&ChannelSession::on_accept,
                                                    shared_from_this()));
  }

private:
  std::string scope() const {
    return channel_->project_id() ? *channel_->project_id() : "catalogue";
  }

  void on_accept(beast::error_code ec) {
    if (ec) {
      log_error("WebSocket accept error: " + ec.message());
      finish();
      return;
    }

    accepted_ = true;
    log_event(termcolor::bright_green, "🔌 WebSocket",
              "Client joined " + scope() + " (total: " +
                  std::to_string(gateway_.session_count()) + ")");

    std::weak_ptr<ChannelSession> weak = shared_from_this();
    auto executor = ws_.get_executor();
    channel_->set_notifier([weak, executor]() {
      net::post(executor, [weak]() {
        if (auto self = weak.lock()) {
          self->pump();
        }
      });
    });

    do_read();
  }

  void do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&ChannelSession::on_read,
                                                      shared_from_this()));
  }

  // Client messages carry nothing the server acts on.
  void on_read(beast::error_code ec, std::size_t) {
    if (ec) {
      if (ec != websocket::error::closed &&
          ec != net::error::operation_aborted) {
        log_warn("WebSocket read error on " + scope() + ": " + ec.message());
      }
      finish();
      return;
    }

    buffer_.consume(buffer_.size());
    do_read();
  }

  void pump() {
    if (writing_ || closing_ || finished_) {
      return;
    }

    auto message = channel_->pop();
    if (message) {
      writing_ = true;
      current_ = std::move(*message);
      ws_.text(true);
      ws_.async_write(net::buffer(current_),
                      beast::bind_front_handler(&ChannelSession::on_write,
                                                shared_from_this()));
      return;
    }

    if (channel_->closed()) {
      closing_ = true;
      ws_.async_close(websocket::close_code::going_away,
                      beast::bind_front_handler(&ChannelSession::on_close,
                                                shared_from_this()));
    }
  }

  void on_write(beast::error_code ec, std::size_t) {
    writing_ = false;
    if (ec) {
      log_warn("WebSocket write error on " + scope() + ": " + ec.message());
      finish();
      return;
    }
    pump();
  }

  void on_close(beast::error_code ec) {
    if (ec && ec != net::error::operation_aborted) {
      log_warn("WebSocket close error on " + scope() + ": " + ec.message());
    }
    finish();
  }

  void finish() {
    if (finished_) {
      return;
    }
    finished_ = true;

    channel_->set_notifier({});
    gateway_.registry().hub().unsubscribe(channel_);
    gateway_.release(channel_);

    if (accepted_) {
      log_event(termcolor::bright_blue, "🔌 WebSocket",
                "Client left " + scope() + " (total: " +
                    std::to_string(gateway_.session_count()) + ")");
    }
  }

  websocket::stream<beast::tcp_stream> ws_;
  std::shared_ptr<Channel> channel_;
  PreviewGateway &gateway_;
  beast::flat_buffer buffer_;
  std::string current_;
  bool accepted_ = false;
  bool writing_ = false;
  bool closing_ = false;
  bool finished_ = false;
};

// Reads the first request of a connection and either upgrades it or
// answers it from the control API.
class GatewayConnection
    : public std::enable_shared_from_this<GatewayConnection> {
public:
  GatewayConnection(tcp::socket socket, PreviewGateway &gateway)
      : stream_(std::move(socket)), gateway_(gateway) {}

  void run() {
    parser_.emplace();
    parser_->body_limit(kMaxControlBody);
    stream_.expires_after(std::chrono::seconds(30));
    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&GatewayConnection::on_read,
                                               shared_from_this()));
  }

private:
  void on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      return;
    }
    if (ec == http::error::body_limit) {
      PreviewGateway::HttpRequest req;
      send(error_response(req, http::status::payload_too_large,
                          "Request body too large"));
      return;
    }
    if (ec) {
      return;
    }

    PreviewGateway::HttpRequest req = parser_->release();

    if (websocket::is_upgrade(req)) {
      upgrade(std::move(req));
      return;
    }

    send(gateway_.handle_control(req));
  }

  void upgrade(PreviewGateway::HttpRequest req) {
    std::string project = query_param(std::string(req.target()), "project");
    std::optional<std::string> project_id;
    if (!project.empty()) {
      project_id = project;
    }

    auto &registry = gateway_.registry();
    Message greeting = ProjectsList{};
    std::shared_ptr<Channel> channel;
    try {
      if (project_id) {
        auto session = registry.get(*project_id);
        if (!session) {
          throw NotFoundError("Unknown project: " + *project_id);
        }
        greeting = ProjectState{ProjectSummary::from_session(*session)};
      } else {
        ProjectsList list;
        for (const auto &session : registry.list()) {
          list.projects.push_back(ProjectSummary::from_session(session));
        }
        greeting = std::move(list);
      }
      channel = registry.hub().subscribe(registry.hub().next_channel_id(),
                                         project_id);
    } catch (const NotFoundError &e) {
      send(error_response(req, http::status::not_found, e.what()));
      return;
    } catch (const ResourceExhaustion &e) {
      log_warn(std::string("Refused WebSocket client: ") + e.what());
      send(error_response(req, http::status::service_unavailable, e.what(),
                          true));
      return;
    }

    channel->push(serialize(greeting));
    gateway_.track(channel);

    std::make_shared<ChannelSession>(std::move(stream_), channel, gateway_)
        ->run(std::move(req));
  }

  void send(PreviewGateway::HttpResponse res) {
    auto response =
        std::make_shared<PreviewGateway::HttpResponse>(std::move(res));
    http::async_write(stream_, *response,
                      [self = shared_from_this(),
                       response](beast::error_code, std::size_t) {
                        beast::error_code ignored;
                        self->stream_.socket().shutdown(
                            tcp::socket::shutdown_send, ignored);
                      });
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  PreviewGateway &gateway_;
};

} // namespace

PreviewGateway::PreviewGateway(PreviewRegistry &registry, Options options)
    : registry_(registry), options_(std::move(options)), acceptor_(ioc_) {}

PreviewGateway::~PreviewGateway() { stop(); }

int PreviewGateway::start() {
  if (running_.load()) {
    return port_.load();
  }

  try {
    auto address = net::ip::make_address(options_.host);
    tcp::endpoint endpoint{address, static_cast<unsigned short>(options_.port)};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    port_ = acceptor_.local_endpoint().port();
  } catch (const boost::system::system_error &e) {
    beast::error_code ignored;
    acceptor_.close(ignored);
    throw StartupError("Cannot bind gateway on " + options_.host + ":" +
                       std::to_string(options_.port) + ": " + e.what());
  }

  running_ = true;
  registry_.set_livereload_endpoint(ws_url());

  do_accept();
  thread_ = std::thread([this]() {
    try {
      ioc_.run();
    } catch (const std::exception &e) {
      log_error(std::string("Gateway error: ") + e.what());
    }
  });

  log_ok("Gateway listening on " + http_url());
  return port_.load();
}

void PreviewGateway::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  std::unordered_map<std::string, std::shared_ptr<Channel>> channels;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    channels.swap(channels_);
  }
  if (!channels.empty()) {
    log_event(termcolor::bright_blue, "→", "Closing " +
                                               std::to_string(channels.size()) +
                                               " active WebSocket connections");
  }
  for (auto &[id, channel] : channels) {
    channel->set_notifier({});
    registry_.hub().unsubscribe(channel);
  }

  ioc_.stop();
  if (thread_.joinable()) {
    thread_.join();
  }
  beast::error_code ignored;
  acceptor_.close(ignored);

  log_ok("Gateway stopped");
}

std::string PreviewGateway::public_host() const {
  if (options_.host == "0.0.0.0" || options_.host.empty()) {
    return "localhost";
  }
  return options_.host;
}

std::string PreviewGateway::ws_url() const {
  return "ws://" + public_host() + ":" + std::to_string(port_.load()) + "/";
}

std::string PreviewGateway::http_url() const {
  return "http://" + public_host() + ":" + std::to_string(port_.load());
}

void PreviewGateway::do_accept() {
  acceptor_.async_accept(
      net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
        if (!ec) {
          std::make_shared<GatewayConnection>(std::move(socket), *this)->run();
        } else if (ec != net::error::operation_aborted) {
          log_error("Gateway accept error: " + ec.message());
        }

        if (running_.load() && acceptor_.is_open()) {
          do_accept();
        }
      });
}

void PreviewGateway::track(const std::shared_ptr<Channel> &channel) {
  std::lock_guard<std::mutex> lock(mutex_);
  channels_[channel->id()] = channel;
}

void PreviewGateway::release(const std::shared_ptr<Channel> &channel) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = channels_.find(channel->id());
  if (it != channels_.end() && it->second == channel) {
    channels_.erase(it);
  }
}

std::size_t PreviewGateway::session_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return channels_.size();
}

PreviewGateway::HttpResponse
PreviewGateway::handle_control(const HttpRequest &req) {
  std::string target(req.target());
  std::string path = target.substr(0, target.find('?'));
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }

  const std::string prefix = "/projects";
  if (path.compare(0, prefix.size(), prefix) != 0 ||
      (path.size() > prefix.size() && path[prefix.size()] != '/')) {
    return error_response(req, http::status::not_found, "No route for " + path);
  }

  std::string rest = path.substr(prefix.size());
  auto method = req.method();

  try {
    // /projects
    if (rest.empty()) {
      if (method == http::verb::get) {
        json projects = json::array();
        for (const auto &session : registry_.list()) {
          projects.push_back(to_json(ProjectSummary::from_session(session)));
        }
        return json_response(req, http::status::ok, projects);
      }

      if (method == http::verb::post) {
        json descriptor = json::parse(req.body(), nullptr, false);
        if (descriptor.is_discarded()) {
          return error_response(req, http::status::bad_request,
                                "Body is not valid JSON");
        }
        PreviewSession session =
            registry_.register_project(Project::from_json(descriptor));
        return json_response(
            req, http::status::created,
            {{"id", session.project_id}, {"previewUrl", session.base_url}});
      }

      return error_response(req, http::status::method_not_allowed,
                            "Use GET or POST on /projects");
    }

    std::string id_part = rest.substr(1);
    std::string action;
    size_t slash = id_part.find('/');
    if (slash != std::string::npos) {
      action = id_part.substr(slash + 1);
      id_part = id_part.substr(0, slash);
    }

    std::string project_id;
    if (!url_decode(id_part, project_id) || project_id.empty()) {
      return error_response(req, http::status::bad_request, "Bad project id");
    }

    // /projects/<id>/rebuild
    if (action == "rebuild") {
      if (method != http::verb::post) {
        return error_response(req, http::status::method_not_allowed,
                              "Use POST to trigger a rebuild");
      }
      registry_.rebuild(project_id);
      return json_response(req, http::status::accepted,
                           {{"id", project_id}, {"queued", true}});
    }
    if (!action.empty()) {
      return error_response(req, http::status::not_found,
                            "No route for " + path);
    }

    // /projects/<id>
    if (method == http::verb::get) {
      auto session = registry_.get(project_id);
      if (!session) {
        throw NotFoundError("Unknown project: " + project_id);
      }
      return json_response(req, http::status::ok,
                           to_json(ProjectSummary::from_session(*session)));
    }

    if (method == http::verb::delete_) {
      if (!registry_.unregister_project(project_id)) {
        throw NotFoundError("Unknown project: " + project_id);
      }
      return json_response(req, http::status::no_content, nullptr);
    }

    return error_response(req, http::status::method_not_allowed,
                          "Use GET or DELETE on /projects/<id>");
  } catch (const NotFoundError &e) {
    return error_response(req, http::status::not_found, e.what());
  } catch (const ConfigurationError &e) {
    return error_response(req, http::status::bad_request, e.what());
  } catch (const ResourceExhaustion &e) {
    return error_response(req, http::status::service_unavailable, e.what(),
                          true);
  } catch (const json::exception &e) {
    return error_response(req, http::status::bad_request, e.what());
  } catch (const PreviewError &e) {
    log_error(std::string("Control request failed: ") + e.what());
    return error_response(req, http::status::internal_server_error, e.what(),
                          e.retryable());
  }
}
