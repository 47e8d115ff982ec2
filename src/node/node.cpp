// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "node.hpp"
#include "app/errors.hpp"
#include "util/logging.hpp"

namespace bacstack {
namespace node {

Node::Node(const NodeConfig &config, sim::SimulatedNetwork &network, pdu::Address address)
    : config_(config), network_(network) {
  local_device_ = std::make_shared<app::LocalDevice>(
      config_.device_instance, config_.device_name, config_.vendor_id,
      config_.max_apdu_length_accepted, config_.segmentation_supported);

  application_ = std::make_unique<app::Application>(local_device_);
  asap_ = std::make_unique<app::ApplicationServiceAccessPoint>();
  port_ = std::make_unique<sim::SimulatedPort>(network_, std::move(address));

  comm::BindStack(*application_, {asap_.get()}, *port_);

  device_services_ = std::make_unique<service::DeviceServices>(*application_);
  application_->RegisterServices(*device_services_);

  LOG_INFO("Node {} '{}' at {} ({} services)", local_device_->identifier().ToString(),
           local_device_->name(), port_->address().ToString(),
           application_->services().size());
}

Node::~Node() {
  // Port first so nothing is delivered into a half-destroyed stack
  port_.reset();
}

app::IOCBPtr Node::send_confirmed(std::shared_ptr<apdu::ConfirmedRequest> request) {
  if (!request) {
    throw app::UsageError("send_confirmed: null request");
  }

  auto iocb = application_->request(std::move(request));
  if (config_.apdu_timeout.count() > 0) {
    iocb->set_timeout(network_.io_context(), config_.apdu_timeout);
  }
  return iocb;
}

} // namespace node
} // namespace bacstack
