// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_APPLICATION_HPP
#define MINTNODE_APPLICATION_HPP

#include "chain/ledger_handle.hpp"
#include "chain/memory_ledger.hpp"
#include "metrics/metrics_registry.hpp"
#include "metrics/metrics_server.hpp"
#include "mining/mint_scheduler.hpp"
#include "network/connection_manager.hpp"
#include "network/subscription_hub.hpp"
#include "network/websocket_transport.hpp"
#include "rpc/rpc_dispatcher.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace mintnode {
namespace app {

struct AppConfig {
  std::filesystem::path datadir;
  size_t io_threads;
  std::chrono::milliseconds shutdown_grace;

  chain::MemoryLedger::Config ledger_config;
  // Builds the ledger engine; unset means a MemoryLedger from ledger_config
  std::function<std::unique_ptr<chain::LedgerEngine>()> engine_factory;
  network::WebSocketTransport::Config transport_config;
  network::ConnectionManager::Config connection_config;
  mining::MintScheduler::Config mint_config;
  metrics::MetricsServer::Config metrics_config;

  AppConfig();
};

/**
 * Application - owns every component and coordinates startup and shutdown
 *
 * Shutdown (signal, request_shutdown() or an engine-fatal report):
 *   1. stop accepting connections
 *   2. drain every live session
 *   3. stop the mint scheduler
 *   4. wait up to shutdown_grace for sessions to close
 *   5. force-close the rest, stop the metrics endpoint and the io pool
 */
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  bool initialize();
  bool start();
  void stop();

  // Block until a shutdown is requested, then run it
  void wait_for_shutdown();

  // Thread-safe; fatal = engine cannot continue (non-zero exit code)
  void request_shutdown(bool fatal = false);

  bool is_running() const { return running_.load(); }
  int exit_code() const { return fatal_.load() ? 1 : 0; }

  // Component access (valid after initialize())
  chain::LedgerHandlePtr ledger() const { return ledger_; }
  network::SubscriptionHub &subscription_hub() { return *hub_; }
  network::ConnectionManager &connection_manager() { return *connection_manager_; }
  mining::MintScheduler &mint_scheduler() { return *scheduler_; }
  metrics::MetricsRegistry &metrics() { return metrics_; }
  metrics::MetricsServer &metrics_server() { return *metrics_server_; }

  static Application *instance();

private:
  bool init_datadir();
  bool init_ledger();
  bool init_network();
  bool init_minting();
  bool init_metrics();

  void start_io_threads();
  void stop_io_threads();

  void setup_signal_handlers();
  static void signal_handler(int signal);

  void shutdown();

  AppConfig config_;

  // Declared first: destroyed after everything that posts to it
  boost::asio::io_context io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;

  metrics::MetricsRegistry metrics_;
  chain::LedgerHandlePtr ledger_;
  std::unique_ptr<network::SubscriptionHub> hub_;
  std::unique_ptr<rpc::RPCDispatcher> dispatcher_;
  std::shared_ptr<network::WebSocketTransport> transport_;
  std::unique_ptr<network::ConnectionManager> connection_manager_;
  std::unique_ptr<mining::MintScheduler> scheduler_;
  std::unique_ptr<metrics::MetricsServer> metrics_server_;

  bool datadir_locked_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> fatal_{false};

  static Application *instance_;
};

} // namespace app
} // namespace mintnode

#endif // MINTNODE_APPLICATION_HPP
