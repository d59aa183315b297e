#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "chatbridge/common.hpp"
#include "chatbridge/errors.hpp"
#include "chatbridge/metrics.hpp"
#include "chatbridge/service.hpp"

namespace chatbridge {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

struct RunnerOptions {
  std::string host{"0.0.0.0"};
  // 0 binds an ephemeral port; port() reports the one chosen.
  uint16_t port{8080};
  std::size_t workers{4};
};

struct RoutedResponse {
  unsigned status{200};
  json body{json::object()};
};

// Serializes a response body. Error messages may echo request bytes, so invalid UTF-8 is
// replaced instead of throwing.
inline std::string to_wire(const json& body) {
  return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Hosts every Service behind one listener. Each accepted connection carries one request
// and is served on the worker pool.
class ServicesRunner {
 public:
  ServicesRunner(const std::vector<std::shared_ptr<Service>>& services, RunnerOptions options = {})
      : options_(std::move(options)), port_(options_.port) {
    if (options_.workers < 1) {
      throw ConfigurationError("workers must be at least 1");
    }
    for (const auto& service : services) {
      if (!service) {
        throw ConfigurationError("null service");
      }
      const std::string& path = service->webhook_path();
      if (path.empty() || path.front() != '/') {
        throw ConfigurationError("webhook path must start with '/': " + path);
      }
      if (!routes_.emplace(path, service).second) {
        throw ConfigurationError("duplicate webhook path: " + path);
      }
    }
    if (routes_.empty()) {
      throw ConfigurationError("at least one service must be defined");
    }
  }

  ~ServicesRunner() { stop(); }

  ServicesRunner(const ServicesRunner&) = delete;
  ServicesRunner& operator=(const ServicesRunner&) = delete;

  uint16_t port() const { return port_.load(); }

  bool has_route(const std::string& path) const { return routes_.contains(path); }

  RoutedResponse dispatch(const std::string& path, const std::string& body, const TurnOptions& options = {}) {
    auto it = routes_.find(path);
    if (it == routes_.end()) {
      metrics().inc("http.not_found");
      return RoutedResponse{404, json{{"error", "not_found"}, {"message", "no service for route " + path}}};
    }

    auto outcome = it->second->handle_inbound(body, options);
    if (outcome) {
      return RoutedResponse{200, json{{"messages", outcome.value()}}};
    }

    const PipelineError& err = outcome.error();
    json payload = {{"error", pipeline_error_kind_name(err.kind)}, {"message", err.message}};
    if (err.model_error) {
      payload["modelError"] = model_error_kind_name(*err.model_error);
    }
    switch (err.kind) {
      case PipelineErrorKind::kInvalidPayload:
        return RoutedResponse{400, payload};
      case PipelineErrorKind::kModelUnavailable:
        return RoutedResponse{err.model_error == ModelErrorKind::kTimeout ? 504u : 503u, payload};
      case PipelineErrorKind::kCancelled:
      default:
        return RoutedResponse{503, payload};
    }
  }

  void start() {
    if (running_.exchange(true)) {
      return;
    }
    try {
      const tcp::endpoint endpoint{net::ip::make_address(options_.host), options_.port};
      acceptor_.open(endpoint.protocol());
      acceptor_.set_option(net::socket_base::reuse_address(true));
      acceptor_.bind(endpoint);
      acceptor_.listen(net::socket_base::max_listen_connections);
      port_.store(acceptor_.local_endpoint().port());
    } catch (const std::exception& e) {
      running_.store(false);
      beast::error_code ignored;
      acceptor_.close(ignored);
      throw ConfigurationError("cannot listen on " + options_.host + ":" + std::to_string(options_.port) + ": " +
                               e.what());
    }

    pool_ = std::make_unique<net::thread_pool>(options_.workers);
    accept_thread_ = std::thread([this]() { accept_loop(); });
    Logger::log(Logger::Level::kInfo, "Listening on " + options_.host + ":" + std::to_string(port()) + " with " +
                                          std::to_string(routes_.size()) + " service(s)");
  }

  void stop() {
    if (!running_.exchange(false)) {
      return;
    }

    // Wake the blocking accept with a throwaway connection.
    {
      beast::error_code ec;
      tcp::socket waker(io_);
      waker.connect(tcp::endpoint{net::ip::make_address(wake_address()), port()}, ec);
    }
    if (accept_thread_.joinable()) {
      accept_thread_.join();
    }
    beast::error_code ec;
    acceptor_.close(ec);

    {
      std::lock_guard<std::mutex> lock(active_mu_);
      for (tcp::socket* socket : active_) {
        beast::error_code ignored;
        socket->shutdown(tcp::socket::shutdown_both, ignored);
      }
    }
    if (pool_) {
      pool_->join();
      pool_.reset();
    }
    Logger::log(Logger::Level::kInfo, "Listener stopped");
  }

 private:
  // Registers a socket so stop() can shut it down. Registration fails once stop() has begun,
  // which covers connections still queued on the pool when the listener stops.
  class ActiveConnection {
   public:
    ActiveConnection(ServicesRunner& owner, tcp::socket& socket) : owner_(owner), socket_(&socket) {
      std::lock_guard<std::mutex> lock(owner_.active_mu_);
      registered_ = owner_.running_.load();
      if (registered_) {
        owner_.active_.insert(socket_);
      }
    }

    ~ActiveConnection() {
      if (registered_) {
        std::lock_guard<std::mutex> lock(owner_.active_mu_);
        owner_.active_.erase(socket_);
      }
    }

    bool registered() const { return registered_; }

   private:
    ServicesRunner& owner_;
    tcp::socket* socket_;
    bool registered_{false};
  };

  std::string wake_address() const {
    if (options_.host == "0.0.0.0") {
      return "127.0.0.1";
    }
    if (options_.host == "::") {
      return "::1";
    }
    return options_.host;
  }

  void accept_loop() {
    while (running_.load()) {
      tcp::socket socket(io_);
      beast::error_code ec;
      acceptor_.accept(socket, ec);
      if (!running_.load()) {
        break;
      }
      if (ec) {
        Logger::log(Logger::Level::kWarn, "accept failed: " + ec.message());
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        continue;
      }
      net::post(*pool_, [this, s = std::move(socket)]() mutable { handle_connection(std::move(s)); });
    }
  }

  void handle_connection(tcp::socket socket) {
    ActiveConnection active(*this, socket);
    beast::error_code ec;
    if (!active.registered()) {
      socket.close(ec);
      return;
    }

    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::read(socket, buffer, req, ec);
    if (ec) {
      if (ec != http::error::end_of_stream) {
        Logger::log(Logger::Level::kDebug, "request read failed: " + ec.message());
      }
      return;
    }

    http::response<http::string_body> res;
    try {
      res = handle_request(req);
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kError, std::string("request handling failed: ") + e.what());
      res = make_response(RoutedResponse{500, json{{"error", "internal"}, {"message", e.what()}}}, req.version());
    }
    http::write(socket, res, ec);
    if (ec) {
      Logger::log(Logger::Level::kDebug, "response write failed: " + ec.message());
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
  }

  http::response<http::string_body> handle_request(const http::request<http::string_body>& req) {
    metrics().inc("http.requests");

    std::string path(req.target().data(), req.target().size());
    const auto query = path.find('?');
    if (query != std::string::npos) {
      path.erase(query);
    }

    RoutedResponse routed;
    if (req.method() == http::verb::get && path == "/metrics") {
      routed = RoutedResponse{200, metrics().to_json()};
    } else if (req.method() != http::verb::post && has_route(path)) {
      routed = RoutedResponse{405, json{{"error", "method_not_allowed"}, {"message", "use POST"}}};
    } else if (req.method() != http::verb::post) {
      metrics().inc("http.not_found");
      routed = RoutedResponse{404, json{{"error", "not_found"}, {"message", "no service for route " + path}}};
    } else {
      routed = dispatch(path, req.body());
    }

    return make_response(routed, req.version());
  }

  static http::response<http::string_body> make_response(const RoutedResponse& routed, unsigned version) {
    http::response<http::string_body> res{static_cast<http::status>(routed.status), version};
    res.set(http::field::server, "chatbridge");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = to_wire(routed.body);
    res.prepare_payload();
    return res;
  }

  RunnerOptions options_;
  std::unordered_map<std::string, std::shared_ptr<Service>> routes_;

  std::atomic<bool> running_{false};
  std::atomic<uint16_t> port_;
  net::io_context io_;
  tcp::acceptor acceptor_{io_};
  std::unique_ptr<net::thread_pool> pool_;
  std::thread accept_thread_;

  std::mutex active_mu_;
  std::unordered_set<tcp::socket*> active_;
};

}  // namespace chatbridge
