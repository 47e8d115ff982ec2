// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "apdu/apdu.hpp"
#include "apdu/enums.hpp"
#include "app/application.hpp"
#include "app/application_service_access_point.hpp"
#include "app/iocb.hpp"
#include "app/local_object.hpp"
#include "service/device_services.hpp"
#include "sim/simulated_network.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace bacstack {
namespace node {

// Node configuration
struct NodeConfig {
  uint32_t device_instance = 1;
  std::string device_name = "bacstack-device";
  uint16_t vendor_id = 999;
  uint32_t max_apdu_length_accepted = 1024;
  apdu::Segmentation segmentation_supported = apdu::Segmentation::NO_SEGMENTATION;

  // Armed on every confirmed request sent through send_confirmed()
  std::chrono::milliseconds apdu_timeout{3000};
};

// Node - one device on a simulated network
// Stack: Application -> ApplicationServiceAccessPoint -> SimulatedPort
class Node {
public:
  Node(const NodeConfig &config, sim::SimulatedNetwork &network, pdu::Address address);
  ~Node();

  Node(const Node &) = delete;
  Node &operator=(const Node &) = delete;

  // Confirmed request with the configured APDU timeout armed
  app::IOCBPtr send_confirmed(std::shared_ptr<apdu::ConfirmedRequest> request);

  app::Application &application() { return *application_; }
  service::DeviceServices &device_services() { return *device_services_; }
  const app::LocalDevicePtr &local_device() const { return local_device_; }
  const pdu::Address &address() const { return port_->address(); }
  const NodeConfig &config() const { return config_; }

private:
  NodeConfig config_;
  sim::SimulatedNetwork &network_;

  // Components (destroyed in reverse order)
  app::LocalDevicePtr local_device_;
  std::unique_ptr<app::Application> application_;
  std::unique_ptr<app::ApplicationServiceAccessPoint> asap_;
  std::unique_ptr<sim::SimulatedPort> port_;
  std::unique_ptr<service::DeviceServices> device_services_;
};

} // namespace node
} // namespace bacstack
