// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sim/simulated_network.hpp"
#include "app/errors.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>
#include <vector>

namespace bacstack {
namespace sim {

void SimulatedNetwork::Attach(SimulatedPort &port) {
  if (!port.address().is_station()) {
    throw app::UsageError("simulated port needs a station address, got " +
                          port.address().ToString());
  }
  if (!ports_.emplace(port.address(), &port).second) {
    throw app::UsageError("address " + port.address().ToString() + " already attached");
  }
  LOG_STACK_DEBUG("Port {} attached", port.address().ToString());
}

void SimulatedNetwork::Detach(SimulatedPort &port) {
  auto it = ports_.find(port.address());
  if (it != ports_.end() && it->second == &port) {
    ports_.erase(it);
    LOG_STACK_DEBUG("Port {} detached", port.address().ToString());
  }
}

void SimulatedNetwork::Send(const SimulatedPort &from, const apdu::APDUPtr &apdu) {
  if (!apdu) {
    throw app::UsageError("send: null APDU");
  }

  ++stats_.sent;

  auto copy = apdu->Clone();
  copy->set_source(from.address());
  apdu::APDUPtr stamped = std::move(copy);

  const auto &destination = stamped->destination();
  std::vector<pdu::Address> recipients;

  if (destination.is_station()) {
    recipients.push_back(destination);
  } else if (destination.is_broadcast()) {
    for (const auto &[address, port] : ports_) {
      if (address != from.address()) {
        recipients.push_back(address);
      }
    }
  } else {
    LOG_STACK_DEBUG("{} from {} has no destination, dropped", stamped->ToString(),
                    from.address().ToString());
    ++stats_.dropped;
    return;
  }

  for (const auto &to : recipients) {
    boost::asio::post(io_context_, [this, to, stamped]() { Deliver(to, stamped); });
  }
}

void SimulatedNetwork::Deliver(const pdu::Address &to, const apdu::APDUPtr &apdu) {
  auto it = ports_.find(to);
  if (it == ports_.end()) {
    LOG_STACK_DEBUG("No station {} for {}, dropped", to.ToString(), apdu->ToString());
    ++stats_.dropped;
    return;
  }

  ++stats_.delivered;
  LOG_STACK_TRACE("{} -> {}: {}", apdu->source().ToString(), to.ToString(), apdu->ToString());
  it->second->Receive(apdu);
}

SimulatedPort::SimulatedPort(SimulatedNetwork &network, pdu::Address address)
    : network_(network), address_(std::move(address)) {
  network_.Attach(*this);
}

SimulatedPort::~SimulatedPort() {
  network_.Detach(*this);
}

void SimulatedPort::request(apdu::APDUPtr apdu) {
  network_.Send(*this, apdu);
}

void SimulatedPort::response(apdu::APDUPtr apdu) {
  network_.Send(*this, apdu);
}

void SimulatedPort::Receive(const apdu::APDUPtr &apdu) {
  // The network is the event loop boundary: a failing stack must not take
  // the other stations down with it
  try {
    if (apdu->is_request()) {
      send_indication(apdu);
    } else {
      send_confirmation(apdu);
    }
  } catch (const std::exception &e) {
    LOG_STACK_ERROR("Station {} failed to process {}: {}", address_.ToString(), apdu->ToString(),
                    e.what());
  }
}

} // namespace sim
} // namespace bacstack
