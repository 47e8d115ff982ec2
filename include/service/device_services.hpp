// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "app/service_registry.hpp"
#include "pdu/address.hpp"
#include <cstdint>
#include <optional>

namespace bacstack {

namespace app {
class Application;
} // namespace app

namespace service {

/**
 * DeviceServices - device discovery (Who-Is / I-Am)
 *
 * Answers Who-Is for the application's local device and records every
 * I-Am heard in the application's DeviceInfoCache.
 */
class DeviceServices : public app::ServiceModule {
public:
  explicit DeviceServices(app::Application &application);

  void RegisterServices(app::ServiceRegistry &registry) override;

  // Ask devices in [low, high] (all devices without limits) to announce
  void who_is(std::optional<uint32_t> low_limit = std::nullopt,
              std::optional<uint32_t> high_limit = std::nullopt,
              const pdu::Address &destination = pdu::Address::GlobalBroadcast());

  // Announce the local device (throws UsageError without one)
  void i_am(const pdu::Address &destination = pdu::Address::GlobalBroadcast());

private:
  void HandleWhoIs(const app::UnconfirmedRequestPtr &request);
  void HandleIAm(const app::UnconfirmedRequestPtr &request);

  app::Application &application_;
};

} // namespace service
} // namespace bacstack
