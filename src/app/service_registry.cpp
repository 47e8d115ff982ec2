// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/service_registry.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace bacstack {
namespace app {

void ServiceRegistry::RegisterConfirmed(apdu::ConfirmedServiceChoice choice,
                                        ConfirmedHandler handler) {
  if (!handler) {
    LOG_APP_ERROR("Attempted to register empty handler for service: {}", apdu::ToString(choice));
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  confirmed_[choice] = std::move(handler);
  LOG_APP_DEBUG("Registered handler for service: {}", apdu::ToString(choice));
}

void ServiceRegistry::RegisterUnconfirmed(apdu::UnconfirmedServiceChoice choice,
                                          UnconfirmedHandler handler) {
  if (!handler) {
    LOG_APP_ERROR("Attempted to register empty handler for service: {}", apdu::ToString(choice));
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  unconfirmed_[choice] = std::move(handler);
  LOG_APP_DEBUG("Registered handler for service: {}", apdu::ToString(choice));
}

void ServiceRegistry::UnregisterConfirmed(apdu::ConfirmedServiceChoice choice) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (confirmed_.erase(choice) > 0) {
    LOG_APP_DEBUG("Unregistered handler for service: {}", apdu::ToString(choice));
  }
}

void ServiceRegistry::UnregisterUnconfirmed(apdu::UnconfirmedServiceChoice choice) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unconfirmed_.erase(choice) > 0) {
    LOG_APP_DEBUG("Unregistered handler for service: {}", apdu::ToString(choice));
  }
}

bool ServiceRegistry::HasHandler(apdu::ConfirmedServiceChoice choice) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return confirmed_.count(choice) > 0;
}

bool ServiceRegistry::HasHandler(apdu::UnconfirmedServiceChoice choice) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return unconfirmed_.count(choice) > 0;
}

ServiceRegistry::ConfirmedHandler
ServiceRegistry::Find(apdu::ConfirmedServiceChoice choice) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = confirmed_.find(choice);
  return it != confirmed_.end() ? it->second : ConfirmedHandler{};
}

ServiceRegistry::UnconfirmedHandler
ServiceRegistry::Find(apdu::UnconfirmedServiceChoice choice) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = unconfirmed_.find(choice);
  return it != unconfirmed_.end() ? it->second : UnconfirmedHandler{};
}

std::vector<std::string> ServiceRegistry::GetRegisteredServices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(confirmed_.size() + unconfirmed_.size());
  for (const auto &[choice, _] : confirmed_) {
    result.push_back(apdu::ToString(choice));
  }
  for (const auto &[choice, _] : unconfirmed_) {
    result.push_back(apdu::ToString(choice));
  }
  std::sort(result.begin(), result.end());
  return result;
}

size_t ServiceRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return confirmed_.size() + unconfirmed_.size();
}

} // namespace app
} // namespace bacstack
