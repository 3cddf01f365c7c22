// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "metrics/metrics_registry.hpp"
#include <sstream>

namespace mintnode {
namespace metrics {

MetricsRegistry::MetricsRegistry()
    : connections_accepted("connections_accepted",
                           "Client connections accepted"),
      blocks_produced("blocks_produced", "Blocks produced by this node"),
      mint_skipped("mint_skipped", "Mint intervals that produced no block"),
      transactions_accepted("transactions_accepted",
                            "Transactions accepted by the ledger"),
      transactions_rejected("transactions_rejected",
                            "Transactions rejected by the ledger"),
      transactions_duplicate("transactions_duplicate",
                             "Resubmissions of already accepted transactions"),
      sessions_dropped_backpressure(
          "sessions_dropped_backpressure",
          "Sessions closed because their outbound queue stalled"),
      notifications_dropped("notifications_dropped",
                            "Block notifications discarded on full queues"),
      frames_malformed("frames_malformed",
                       "Connections closed on an invalid frame header"),
      sessions_active("sessions_active", "Sessions currently open"),
      subscribers("subscribers", "Sessions subscribed to new blocks"),
      chain_height("chain_height", "Height of the last produced block") {
  all_ = {&connections_accepted,
          &blocks_produced,
          &mint_skipped,
          &transactions_accepted,
          &transactions_rejected,
          &transactions_duplicate,
          &sessions_dropped_backpressure,
          &notifications_dropped,
          &frames_malformed,
          &sessions_active,
          &subscribers,
          &chain_height};
}

const Metric *MetricsRegistry::find(const std::string &name) const {
  for (const auto *metric : all_) {
    if (metric->name() == name) {
      return metric;
    }
  }
  return nullptr;
}

std::string MetricsRegistry::render_prometheus() const {
  std::ostringstream out;
  for (const auto *metric : all_) {
    out << "# HELP " << metric->name() << " " << metric->help() << "\n";
    out << "# TYPE " << metric->name() << " "
        << (metric->type() == MetricType::COUNTER ? "counter" : "gauge")
        << "\n";
    out << metric->name() << " " << metric->value() << "\n";
  }
  return out.str();
}

nlohmann::json MetricsRegistry::to_json() const {
  nlohmann::json j = nlohmann::json::object();
  for (const auto *metric : all_) {
    j[metric->name()] = metric->value();
  }
  return j;
}

} // namespace metrics
} // namespace mintnode
