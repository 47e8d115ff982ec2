// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 DestinationController - per-peer FIFO for outbound confirmed requests

 Purpose
 - At most one confirmed request in flight per destination address
 - Requests to one destination reach the lower layer in submission order

 Lifecycle
 - Created by the application on the first confirmed request to a
   destination, dropped by it once the idle callback fires (queue and
   active slot both empty). Never dropped earlier, so the next queued
   request goes out without a new lookup.

 Stalls
 - Nothing here times out. An active request leaves only through
   complete_io/abort_io; an IOCB that is never resolved blocks its
   destination for good. IOCB::set_timeout and IOCB::cancel exist to
   guarantee that resolution happens.

 Threading
 - Not thread-safe; one event flow drives all calls.
*/

#include "apdu/apdu.hpp"
#include "app/iocb.hpp"
#include "pdu/address.hpp"
#include <deque>
#include <functional>
#include <memory>

namespace bacstack {
namespace app {

class DestinationController : public std::enable_shared_from_this<DestinationController> {
public:
  using SendFunction = std::function<void(const apdu::APDUPtr &)>;
  using IdleCallback = std::function<void(DestinationController &)>;

  DestinationController(pdu::Address destination, SendFunction send);
  ~DestinationController();

  DestinationController(const DestinationController &) = delete;
  DestinationController &operator=(const DestinationController &) = delete;

  const pdu::Address &destination() const { return destination_; }

  // Fired after complete_io/abort_io leaves the controller idle
  void set_idle_callback(IdleCallback callback) { on_idle_ = std::move(callback); }

  // Queue a request; sends it at once when nothing is active
  void submit(IOCBPtr iocb);

  // Positive outcome for `iocb` (normally the active one)
  void complete_io(const IOCBPtr &iocb, apdu::APDUPtr response);

  // Failure outcome for `iocb`; a queued IOCB is removed without being sent
  void abort_io(const IOCBPtr &iocb, apdu::APDUPtr error);

  const IOCBPtr &active() const { return active_; }
  size_t queue_size() const { return queue_.size(); }
  bool idle() const { return !active_ && queue_.empty(); }

private:
  // Shared body of complete_io/abort_io
  void finish(const IOCBPtr &iocb, IOState state, apdu::APDUPtr outcome);

  // Promote the queue head to active and send it
  void start_next();
  void notify_if_idle();

  pdu::Address destination_;
  SendFunction send_;
  IdleCallback on_idle_;

  std::deque<IOCBPtr> queue_;
  IOCBPtr active_;

  // Set while an outcome is being delivered; submit() only queues and the
  // idle callback is held back until the next request has been started.
  bool advancing_ = false;
};

using DestinationControllerPtr = std::shared_ptr<DestinationController>;

} // namespace app
} // namespace bacstack
