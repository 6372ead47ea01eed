// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "notifications.hpp"
#include <utility>

namespace lunachain {

ChainNotifications::Subscription::Subscription(ChainNotifications *owner,
                                               uint64_t id)
    : owner_(owner), id_(id) {}

ChainNotifications::Subscription::~Subscription() { Unsubscribe(); }

ChainNotifications::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)), id_(other.id_) {}

ChainNotifications::Subscription &
ChainNotifications::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = std::exchange(other.owner_, nullptr);
    id_ = other.id_;
  }
  return *this;
}

void ChainNotifications::Subscription::Unsubscribe() {
  if (ChainNotifications *owner = std::exchange(owner_, nullptr)) {
    owner->Unsubscribe(id_);
  }
}

ChainNotifications::Subscription
ChainNotifications::SubscribeTipUpdate(TipUpdateCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  const uint64_t id = next_id_++;
  tip_callbacks_.emplace(id, std::move(callback));
  return Subscription(this, id);
}

ChainNotifications::Subscription
ChainNotifications::SubscribeBlockConnected(BlockConnectedCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  const uint64_t id = next_id_++;
  connected_callbacks_.emplace(id, std::move(callback));
  return Subscription(this, id);
}

void ChainNotifications::NotifyTipUpdate(const TipUpdate &update) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[id, callback] : tip_callbacks_) {
    callback(update);
  }
}

void ChainNotifications::NotifyBlockConnected(const CBlock &block,
                                              const chain::CBlockIndex *pindex) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[id, callback] : connected_callbacks_) {
    callback(block, pindex);
  }
}

size_t ChainNotifications::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tip_callbacks_.size() + connected_callbacks_.size();
}

void ChainNotifications::Unsubscribe(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  tip_callbacks_.erase(id);
  connected_callbacks_.erase(id);
}

} // namespace lunachain
