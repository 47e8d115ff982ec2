// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/destination_controller.hpp"
#include "app/errors.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace bacstack {
namespace app {

DestinationController::DestinationController(pdu::Address destination, SendFunction send)
    : destination_(std::move(destination)), send_(std::move(send)) {
  if (!send_) {
    throw UsageError("destination controller requires a send function");
  }
}

DestinationController::~DestinationController() {
  // Detach whatever is still outstanding so late abort()/cancel() calls on
  // those IOCBs resolve them directly instead of reaching a dead controller
  for (auto &iocb : queue_) {
    iocb->controller_ = nullptr;
  }
  if (active_) {
    active_->controller_ = nullptr;
  }
}

void DestinationController::submit(IOCBPtr iocb) {
  if (!iocb) {
    throw UsageError("submit: null IOCB");
  }
  if (iocb->state() != IOState::IDLE) {
    throw UsageError("submit: IOCB " + std::to_string(iocb->id()) + " is already " +
                     ToString(iocb->state()));
  }

  iocb->controller_ = this;
  iocb->state_ = IOState::PENDING;
  queue_.push_back(std::move(iocb));

  LOG_APP_TRACE("Queued request for {} (queue size {}, active {})", destination_.ToString(),
                queue_.size(), active_ ? "yes" : "no");

  if (!advancing_) {
    start_next();
  }
}

void DestinationController::complete_io(const IOCBPtr &iocb, apdu::APDUPtr response) {
  finish(iocb, IOState::COMPLETED, std::move(response));
}

void DestinationController::abort_io(const IOCBPtr &iocb, apdu::APDUPtr error) {
  finish(iocb, IOState::ABORTED, std::move(error));
}

void DestinationController::finish(const IOCBPtr &iocb, IOState state, apdu::APDUPtr outcome) {
  if (!iocb || iocb->controller_ != this) {
    LOG_APP_WARN("Outcome for an IOCB not owned by the controller for {}",
                 destination_.ToString());
    return;
  }

  // The idle callback may drop the owner's reference
  auto keep_alive = weak_from_this().lock();

  if (iocb == active_) {
    active_.reset();
  } else {
    auto it = std::find(queue_.begin(), queue_.end(), iocb);
    if (it != queue_.end()) {
      LOG_APP_DEBUG("Request {} to {} resolved while still queued", iocb->id(),
                    destination_.ToString());
      queue_.erase(it);
    }
  }

  // Requests submitted from completion callbacks queue behind the ones
  // already waiting
  bool was_advancing = advancing_;
  advancing_ = true;
  try {
    iocb->resolve(state, std::move(outcome));
  } catch (...) {
    advancing_ = was_advancing;
    throw;
  }
  advancing_ = was_advancing;

  if (!advancing_) {
    start_next();
    notify_if_idle();
  }
}

void DestinationController::start_next() {
  if (active_ || queue_.empty()) {
    return;
  }

  active_ = queue_.front();
  queue_.pop_front();
  active_->state_ = IOState::ACTIVE;

  LOG_APP_DEBUG("Sending request {} to {} ({} waiting)", active_->id(), destination_.ToString(),
                queue_.size());

  // Copy: a synchronous lower layer may resolve and replace active_ before
  // send_ returns
  apdu::APDUPtr request = active_->request();
  send_(request);
}

void DestinationController::notify_if_idle() {
  if (advancing_ || !idle() || !on_idle_) {
    return;
  }
  auto callback = on_idle_;
  callback(*this);
}

} // namespace app
} // namespace bacstack
