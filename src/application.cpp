// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "application.hpp"
#include "util/datadir.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <csignal>
#include <iostream> // Startup banner before the logger is fully set up

namespace mintnode {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

static constexpr std::chrono::milliseconds IO_DRAIN_TIMEOUT{1000};

AppConfig::AppConfig()
    : datadir(util::get_default_datadir()), io_threads(4),
      shutdown_grace(protocol::DEFAULT_SHUTDOWN_GRACE_MS) {}

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  std::cout << GetStartupBanner(config_.ledger_config.network,
                                config_.ledger_config.is_minter)
            << std::flush;

  LOG_APP_INFO("Initializing mintnode...");

  if (!init_datadir()) {
    LOG_APP_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_ledger()) {
    LOG_APP_ERROR("Failed to initialize ledger");
    return false;
  }

  if (!init_network()) {
    LOG_APP_ERROR("Failed to initialize network");
    return false;
  }

  if (!init_minting()) {
    LOG_APP_ERROR("Failed to initialize mint scheduler");
    return false;
  }

  if (!init_metrics()) {
    LOG_APP_ERROR("Failed to initialize metrics endpoint");
    return false;
  }

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::init_datadir() {
  if (config_.datadir.empty()) {
    // In-memory only (tests)
    return true;
  }

  LOG_APP_INFO("Data directory: {}", config_.datadir.string());
  if (!util::ensure_directory(config_.datadir)) {
    return false;
  }

  auto result = util::LockDirectory(config_.datadir);
  if (result == util::LockResult::ERROR_WRITE) {
    LOG_APP_ERROR("Cannot write to data directory: {}",
                  config_.datadir.string());
    return false;
  }
  if (result == util::LockResult::ERROR_LOCK) {
    LOG_APP_ERROR("Cannot obtain a lock on data directory {}. "
                  "mintnode is probably already running.",
                  config_.datadir.string());
    return false;
  }
  datadir_locked_ = true;
  return true;
}

bool Application::init_ledger() {
  LOG_APP_INFO("Initializing ledger (network: {}, minter: {})",
               config_.ledger_config.network, config_.ledger_config.minter_id);

  std::unique_ptr<chain::LedgerEngine> engine;
  if (config_.engine_factory) {
    engine = config_.engine_factory();
  } else {
    engine = std::make_unique<chain::MemoryLedger>(config_.ledger_config);
  }
  if (!engine) {
    LOG_APP_ERROR("Ledger engine factory returned no engine");
    return false;
  }

  // No io threads yet, so the engine can be read directly before sharing it
  chain::ChainProperties props;
  try {
    props = engine->GetProperties();
  } catch (const std::exception &e) {
    LOG_APP_ERROR("Failed to read ledger properties: {}", e.what());
    return false;
  }
  metrics_.chain_height.set(static_cast<int64_t>(props.height));

  ledger_ = std::make_shared<chain::LedgerHandle>(io_context_, std::move(engine));
  LOG_APP_INFO("Ledger initialized at height {}", props.height);
  return true;
}

bool Application::init_network() {
  hub_ = std::make_unique<network::SubscriptionHub>(metrics_);
  dispatcher_ = std::make_unique<rpc::RPCDispatcher>(ledger_, *hub_, metrics_);

  config_.transport_config.max_message_size =
      config_.connection_config.session.max_frame_size +
      protocol::FRAME_HEADER_SIZE;
  transport_ = std::make_shared<network::WebSocketTransport>(
      io_context_, config_.transport_config);

  connection_manager_ = std::make_unique<network::ConnectionManager>(
      io_context_, transport_, *dispatcher_, *hub_, metrics_,
      config_.connection_config);
  return true;
}

bool Application::init_minting() {
  scheduler_ = std::make_unique<mining::MintScheduler>(
      io_context_, ledger_, *hub_, metrics_, config_.mint_config,
      [this](const std::string &reason) {
        LOG_APP_ERROR("Application: Engine reported a fatal error ({}). "
                      "Initiating shutdown.",
                      reason);
        request_shutdown(true);
      });
  return true;
}

bool Application::init_metrics() {
  metrics_server_ = std::make_unique<metrics::MetricsServer>(
      io_context_, metrics_, config_.metrics_config);
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  LOG_APP_INFO("Starting mintnode...");

  setup_signal_handlers();
  start_io_threads();
  running_ = true;

  if (!metrics_server_->start()) {
    LOG_APP_ERROR("Failed to start metrics endpoint");
    shutdown();
    return false;
  }

  if (!connection_manager_->start()) {
    LOG_APP_ERROR("Failed to start connection manager");
    shutdown();
    return false;
  }

  scheduler_->Start();

  LOG_APP_INFO("mintnode started successfully");
  if (config_.connection_config.listen_enabled) {
    LOG_APP_INFO("Listening on port: {}", connection_manager_->listen_port());
  } else {
    LOG_APP_INFO("Inbound connections disabled");
  }
  if (config_.metrics_config.enabled) {
    LOG_APP_INFO("Metrics on port: {}", metrics_server_->local_port());
  }
  LOG_APP_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::request_shutdown(bool fatal) {
  if (fatal) {
    fatal_ = true;
  }
  shutdown_requested_ = true;
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_APP_INFO("Shutting down mintnode...");

  LOG_APP_INFO("Stopping listener...");
  connection_manager_->stop_accepting();

  LOG_APP_INFO("Draining {} sessions...", connection_manager_->session_count());
  connection_manager_->drain_all();

  LOG_APP_INFO("Stopping mint scheduler...");
  scheduler_->Stop();

  if (!connection_manager_->wait_for_sessions(config_.shutdown_grace)) {
    LOG_APP_WARN("{} sessions still open after {} ms, closing them",
                 connection_manager_->session_count(),
                 config_.shutdown_grace.count());
    connection_manager_->close_all(network::CloseReason::SHUTDOWN);
    // Close handlers run on the io threads
    connection_manager_->wait_for_sessions(std::chrono::milliseconds(500));
  }

  LOG_APP_INFO("Stopping metrics endpoint...");
  metrics_server_->stop();

  stop_io_threads();

  if (datadir_locked_) {
    util::UnlockDirectory(config_.datadir);
    datadir_locked_ = false;
  }

  if (fatal_) {
    LOG_APP_ERROR("Shutdown complete (engine fatal)");
  } else {
    LOG_APP_INFO("Shutdown complete");
  }
}

void Application::start_io_threads() {
  work_guard_ = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io_context_));

  size_t threads = config_.io_threads > 0 ? config_.io_threads : 1;
  for (size_t i = 0; i < threads; ++i) {
    io_threads_.emplace_back([this]() {
      for (;;) {
        try {
          io_context_.run();
          break;
        } catch (const std::exception &e) {
          LOG_APP_ERROR("Unhandled exception in io thread: {}", e.what());
        }
      }
    });
  }
  LOG_APP_DEBUG("Started {} io threads", threads);
}

void Application::stop_io_threads() {
  work_guard_.reset();

  // Give close handshakes still in flight a moment to finish
  auto deadline = std::chrono::steady_clock::now() + IO_DRAIN_TIMEOUT;
  while (!io_context_.stopped() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  io_context_.stop();
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int) {
  if (instance_) {
    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace mintnode
