// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_METRICS_SERVER_HPP
#define MINTNODE_METRICS_SERVER_HPP

#include "network/protocol.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <memory>

namespace mintnode {
namespace metrics {

class MetricsRegistry;

using HttpRequest =
    boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse =
    boost::beast::http::response<boost::beast::http::string_body>;

/**
 * MetricsServer - plain HTTP/1.1 pull endpoint over the registry
 *
 *   GET /metrics  Prometheus text exposition (0.0.4)
 *   GET /status   JSON: version, uptime, metric values
 *
 * Other paths get 404, other methods 405. Runs on the shared io_context and
 * only reads the registry.
 */
class MetricsServer {
public:
  struct Config {
    uint16_t port; // 0 = ephemeral
    bool enabled;
    std::chrono::milliseconds request_timeout;

    Config()
        : port(protocol::ports::METRICS), enabled(true),
          request_timeout(std::chrono::seconds(10)) {}
  };

  MetricsServer(boost::asio::io_context &io_context,
                const MetricsRegistry &registry,
                const Config &config = Config{});
  ~MetricsServer();

  MetricsServer(const MetricsServer &) = delete;
  MetricsServer &operator=(const MetricsServer &) = delete;

  bool start();
  void stop();
  bool is_running() const { return running_.load(); }
  uint16_t local_port() const { return local_port_.load(); }

  // Route one request (public for tests)
  HttpResponse handle_request(const HttpRequest &req) const;

private:
  void do_accept();

  boost::asio::io_context &io_context_;
  const MetricsRegistry &registry_;
  Config config_;
  boost::asio::strand<boost::asio::io_context::executor_type> acceptor_strand_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> local_port_{0};
  std::chrono::steady_clock::time_point started_at_;
};

} // namespace metrics
} // namespace mintnode

#endif // MINTNODE_METRICS_SERVER_HPP
