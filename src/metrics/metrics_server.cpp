// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "metrics/metrics_server.hpp"
#include "metrics/metrics_registry.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>

namespace mintnode {
namespace metrics {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr const char *PROMETHEUS_CONTENT_TYPE = "text/plain; version=0.0.4";

// One HTTP client. Serves requests until the peer closes or asks to.
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
  HttpConnection(tcp::socket socket, const MetricsServer &server,
                 std::chrono::milliseconds timeout)
      : stream_(std::move(socket)), server_(server), timeout_(timeout) {}

  void start() {
    boost::asio::dispatch(stream_.get_executor(),
                          [self = shared_from_this()]() { self->do_read(); });
  }

private:
  void do_read() {
    request_ = {};
    stream_.expires_after(timeout_);
    http::async_read(stream_, buffer_, request_,
                     [self = shared_from_this()](beast::error_code ec,
                                                 std::size_t) {
                       self->on_read(ec);
                     });
  }

  void on_read(beast::error_code ec) {
    if (ec == http::error::end_of_stream) {
      do_close();
      return;
    }
    if (ec) {
      LOG_METRICS_DEBUG("metrics read failed: {}", ec.message());
      do_close();
      return;
    }

    response_ = server_.handle_request(request_);
    bool keep_alive = response_.keep_alive();
    http::async_write(stream_, response_,
                      [self = shared_from_this(), keep_alive](
                          beast::error_code write_ec, std::size_t) {
                        if (write_ec) {
                          LOG_METRICS_DEBUG("metrics write failed: {}",
                                            write_ec.message());
                          self->do_close();
                          return;
                        }
                        if (!keep_alive) {
                          self->do_close();
                          return;
                        }
                        self->do_read();
                      });
  }

  void do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream_.socket().close(ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  HttpRequest request_;
  HttpResponse response_;
  const MetricsServer &server_;
  std::chrono::milliseconds timeout_;
};

HttpResponse make_response(const HttpRequest &req, http::status status,
                           const std::string &content_type, std::string body) {
  HttpResponse res{status, req.version()};
  res.set(http::field::server, GetUserAgent());
  res.set(http::field::content_type, content_type);
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

} // namespace

MetricsServer::MetricsServer(boost::asio::io_context &io_context,
                             const MetricsRegistry &registry,
                             const Config &config)
    : io_context_(io_context), registry_(registry), config_(config),
      acceptor_strand_(boost::asio::make_strand(io_context)),
      started_at_(std::chrono::steady_clock::now()) {}

MetricsServer::~MetricsServer() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
  }
}

bool MetricsServer::start() {
  if (!config_.enabled) {
    LOG_METRICS_INFO("metrics endpoint disabled");
    return true;
  }
  if (running_.exchange(true)) {
    return false;
  }

  try {
    acceptor_ = std::make_unique<tcp::acceptor>(acceptor_strand_);
    tcp::endpoint endpoint(boost::asio::ip::address_v4::loopback(),
                           config_.port);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    local_port_ = acceptor_->local_endpoint().port();
  } catch (const std::exception &e) {
    LOG_METRICS_ERROR("failed to start metrics endpoint on port {}: {}",
                      config_.port, e.what());
    acceptor_.reset();
    running_ = false;
    return false;
  }

  started_at_ = std::chrono::steady_clock::now();
  LOG_METRICS_INFO("metrics endpoint listening on 127.0.0.1:{}",
                   local_port_.load());
  boost::asio::post(acceptor_strand_, [this]() { do_accept(); });
  return true;
}

void MetricsServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  boost::asio::post(acceptor_strand_, [this]() {
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
    }
  });
  LOG_METRICS_INFO("metrics endpoint stopped");
}

void MetricsServer::do_accept() {
  if (!running_.load() || !acceptor_) {
    return;
  }

  acceptor_->async_accept(
      boost::asio::make_strand(io_context_),
      [this](const boost::system::error_code &ec, tcp::socket socket) {
        if (ec) {
          if (ec == boost::asio::error::operation_aborted || !running_) {
            return;
          }
          LOG_METRICS_WARN("metrics accept failed: {}", ec.message());
        } else {
          std::make_shared<HttpConnection>(std::move(socket), *this,
                                           config_.request_timeout)
              ->start();
        }
        do_accept();
      });
}

HttpResponse MetricsServer::handle_request(const HttpRequest &req) const {
  if (req.method() != http::verb::get) {
    auto res = make_response(req, http::status::method_not_allowed,
                             "text/plain", "method not allowed\n");
    res.set(http::field::allow, "GET");
    res.prepare_payload();
    return res;
  }

  // Ignore any query string
  std::string target(req.target().data(), req.target().size());
  auto query = target.find('?');
  if (query != std::string::npos) {
    target.resize(query);
  }

  if (target == "/metrics") {
    return make_response(req, http::status::ok, PROMETHEUS_CONTENT_TYPE,
                         registry_.render_prometheus());
  }

  if (target == "/status") {
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_);
    nlohmann::json status = {
        {"version", GetFullVersionString()},
        {"uptime_seconds", uptime.count()},
        {"metrics", registry_.to_json()},
    };
    return make_response(req, http::status::ok, "application/json",
                         status.dump());
  }

  return make_response(req, http::status::not_found, "text/plain",
                       "not found\n");
}

} // namespace metrics
} // namespace mintnode
