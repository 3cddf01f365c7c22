// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mintnode {
namespace util {

namespace {

std::mutex g_log_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
bool g_initialized = false;

const char *const LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

// Caller holds g_log_mutex. Returns true if this call created the loggers.
bool InitializeLocked(const std::string &log_level, bool log_to_file,
                      const std::string &log_file_path) {
  if (g_initialized) {
    return false;
  }

  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (log_to_file) {
      // Append mode so restarts keep history
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          log_file_path, false);
      file_sink->set_pattern(LOG_PATTERN);
      sinks.push_back(file_sink);
    } else {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern(LOG_PATTERN);
      sinks.push_back(console_sink);
    }

    for (const auto &component : LogManager::Components()) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(spdlog::level::from_str(log_level));
      logger->flush_on(spdlog::level::debug);
      spdlog::drop(component);
      spdlog::register_logger(logger);
      g_loggers[component] = logger;
    }

    spdlog::set_default_logger(g_loggers["default"]);
    g_initialized = true;
    return true;
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    return false;
  }
}

} // namespace

const std::vector<std::string> &LogManager::Components() {
  static const std::vector<std::string> components = {
      "default", "network", "rpc", "chain", "metrics", "app"};
  return components;
}

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  bool initialized_now = false;
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    initialized_now = InitializeLocked(log_level, log_to_file, log_file_path);
  }

  if (initialized_now) {
    if (log_to_file) {
      // Visual separator between runs in an appended log file
      LOG_INFO("");
      LOG_INFO("");
    }
    LOG_INFO("Logging system initialized (level: {})", log_level);
  }
}

void LogManager::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_initialized) {
      return;
    }
    g_loggers["default"]->info("Shutting down logging system");
    g_loggers.clear();
    g_initialized = false;
  }
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_initialized) {
    InitializeLocked("info", false, "");
  }

  auto it = g_loggers.find(name);
  if (it != g_loggers.end()) {
    return it->second;
  }

  auto def = g_loggers.find("default");
  if (def != g_loggers.end()) {
    return def->second;
  }
  // Sink creation failed; fall back to spdlog's own default logger
  return spdlog::default_logger();
}

void LogManager::SetLogLevel(const std::string &level) {
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_initialized) {
      return;
    }
    auto log_level = spdlog::level::from_str(level);
    for (auto &[name, logger] : g_loggers) {
      logger->set_level(log_level);
    }
  }
  LOG_INFO("Log level changed to: {}", level);
}

bool LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_initialized) {
      return false;
    }
    auto it = g_loggers.find(component);
    if (it != g_loggers.end()) {
      it->second->set_level(spdlog::level::from_str(level));
      return true;
    }
  }
  LOG_WARN("Unknown log component: {}", component);
  return false;
}

} // namespace util
} // namespace mintnode
