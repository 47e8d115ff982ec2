// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 SimulatedNetwork - in-process network for stacks on one io_context

 Every send is cloned, stamped with the sender's address and posted onto
 the io_context, one handler per recipient, so upper layers are entered
 only from io_context::run() and never re-entrantly from a send.

 Routing
 - Station destination: the port with that address, if attached
 - Any broadcast: every attached port except the sender
 - Anything else: dropped
 Requests arrive as indications, everything else as confirmations.
*/

#include "apdu/apdu.hpp"
#include "comm/layer.hpp"
#include "pdu/address.hpp"
#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <map>

namespace bacstack {
namespace sim {

class SimulatedPort;

class SimulatedNetwork {
public:
  struct Stats {
    uint64_t sent = 0;
    uint64_t delivered = 0;
    uint64_t dropped = 0;
  };

  explicit SimulatedNetwork(boost::asio::io_context &io_context) : io_context_(io_context) {}

  SimulatedNetwork(const SimulatedNetwork &) = delete;
  SimulatedNetwork &operator=(const SimulatedNetwork &) = delete;

  boost::asio::io_context &io_context() { return io_context_; }

  // Ports attach themselves on construction (throws UsageError on a
  // duplicate or non-station address)
  void Attach(SimulatedPort &port);
  void Detach(SimulatedPort &port);

  void Send(const SimulatedPort &from, const apdu::APDUPtr &apdu);

  const Stats &stats() const { return stats_; }
  size_t port_count() const { return ports_.size(); }

private:
  void Deliver(const pdu::Address &to, const apdu::APDUPtr &apdu);

  boost::asio::io_context &io_context_;
  std::map<pdu::Address, SimulatedPort *> ports_;
  Stats stats_;
};

// Bottom of a stack: one station on a SimulatedNetwork
class SimulatedPort : public comm::ServiceAccessPoint {
public:
  SimulatedPort(SimulatedNetwork &network, pdu::Address address);
  ~SimulatedPort() override;

  SimulatedPort(const SimulatedPort &) = delete;
  SimulatedPort &operator=(const SimulatedPort &) = delete;

  const pdu::Address &address() const { return address_; }

  void request(apdu::APDUPtr apdu) override;
  void response(apdu::APDUPtr apdu) override;

private:
  friend class SimulatedNetwork;

  // Hand a delivered APDU to the layer above
  void Receive(const apdu::APDUPtr &apdu);

  SimulatedNetwork &network_;
  pdu::Address address_;
};

} // namespace sim
} // namespace bacstack
