// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "network/subscription_hub.hpp"
#include "metrics/metrics_registry.hpp"
#include "network/codec.hpp"
#include "util/logging.hpp"

namespace mintnode {
namespace network {

SubscriptionHub::SubscriptionHub(metrics::MetricsRegistry &metrics)
    : metrics_(metrics) {}

bool SubscriptionHub::subscribe(uint64_t session_id,
                                std::weak_ptr<NotificationSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = sinks_.emplace(session_id, std::move(sink));
  if (!result.second) {
    return false;
  }
  update_gauge_locked();
  LOG_NET_DEBUG("session {} subscribed to blocks ({} subscribers)", session_id,
                sinks_.size());
  return true;
}

bool SubscriptionHub::unsubscribe(uint64_t session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sinks_.erase(session_id) == 0) {
    return false;
  }
  update_gauge_locked();
  LOG_NET_DEBUG("session {} unsubscribed ({} subscribers)", session_id,
                sinks_.size());
  return true;
}

size_t SubscriptionHub::broadcast(const chain::Block &block) {
  message::BlockProducedNotification notification(block);
  auto frame = std::make_shared<const std::vector<uint8_t>>(
      encode_message_frame(notification));

  std::vector<std::pair<uint64_t, std::shared_ptr<NotificationSink>>> targets;
  std::vector<uint64_t> expired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.reserve(sinks_.size());
    for (const auto &[id, weak] : sinks_) {
      if (auto sink = weak.lock()) {
        targets.emplace_back(id, std::move(sink));
      } else {
        expired.push_back(id);
      }
    }
    for (uint64_t id : expired) {
      sinks_.erase(id);
    }
    if (!expired.empty()) {
      update_gauge_locked();
    }
  }

  for (auto &[id, sink] : targets) {
    try {
      sink->deliver_notification(frame);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("failed to deliver block {} to session {}: {}",
                    block.height, id, e.what());
    }
  }

  LOG_NET_TRACE("broadcast block {} to {} subscribers ({} bytes)", block.height,
                targets.size(), frame->size());
  return targets.size();
}

size_t SubscriptionHub::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sinks_.size();
}

bool SubscriptionHub::contains(uint64_t session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sinks_.count(session_id) != 0;
}

void SubscriptionHub::update_gauge_locked() {
  metrics_.subscribers.set(static_cast<int64_t>(sinks_.size()));
}

} // namespace network
} // namespace mintnode
