// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 IOCB - I/O control block for one outbound confirmed request

 Wraps the request and a single-assignment outcome: a positive response
 (SimpleAck / ComplexAck) or a failure (Error / Reject / Abort). The first
 outcome wins; later ones are ignored.

 While queued or in flight the IOCB belongs to the DestinationController
 for its destination. abort() and cancel() go through that controller, so
 an abandoned request never keeps its destination blocked: a queued IOCB
 leaves the queue, an active one lets the next request go.

 Timeouts are the IOCB's own business (set_timeout); the application core
 never times anything out itself.
*/

#include "apdu/apdu.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace bacstack {
namespace app {

class DestinationController;

enum class IOState {
  IDLE,      // created, not yet submitted
  PENDING,   // queued behind another request to the same destination
  ACTIVE,    // sent, waiting for the outcome
  COMPLETED, // positive response received
  ABORTED,   // error, reject, abort, timeout or cancel
};

std::string ToString(IOState state);

class IOCB : public std::enable_shared_from_this<IOCB> {
public:
  using Callback = std::function<void(const IOCB &)>;

  explicit IOCB(apdu::APDUPtr request);
  ~IOCB();

  IOCB(const IOCB &) = delete;
  IOCB &operator=(const IOCB &) = delete;

  uint64_t id() const { return id_; }
  const apdu::APDUPtr &request() const { return request_; }

  IOState state() const { return state_; }
  bool resolved() const { return state_ == IOState::COMPLETED || state_ == IOState::ABORTED; }

  // Positive response (COMPLETED) or failure message (ABORTED)
  const apdu::APDUPtr &response() const { return response_; }
  const apdu::APDUPtr &error() const { return error_; }

  // Called once when the IOCB resolves; immediately if already resolved
  void add_callback(Callback callback);

  // Resolve from outside the normal confirmation path
  void complete(apdu::APDUPtr response);
  void abort(apdu::APDUPtr error);

  // Abandon the request (local Abort, reason other)
  void cancel();

  // Abort with application-exceeded-reply-time unless resolved within
  // `timeout`. Rearming replaces the previous timer.
  void set_timeout(boost::asio::io_context &io_context, std::chrono::milliseconds timeout);
  void clear_timeout();

private:
  friend class DestinationController;

  // Local failure addressed as if sent by the destination
  apdu::APDUPtr MakeLocalAbort(apdu::AbortReason reason) const;

  // Single-assignment resolution; returns false if already resolved
  bool resolve(IOState state, apdu::APDUPtr outcome);

  uint64_t id_;
  apdu::APDUPtr request_;
  IOState state_ = IOState::IDLE;
  apdu::APDUPtr response_;
  apdu::APDUPtr error_;
  std::vector<Callback> callbacks_;

  // Owning controller while queued or active (cleared on resolve)
  DestinationController *controller_ = nullptr;

  std::unique_ptr<boost::asio::steady_timer> timer_;
};

using IOCBPtr = std::shared_ptr<IOCB>;

} // namespace app
} // namespace bacstack
