// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/iocb.hpp"
#include "app/destination_controller.hpp"
#include "app/errors.hpp"
#include "util/logging.hpp"
#include <atomic>
#include <exception>

namespace bacstack {
namespace app {

static std::atomic<uint64_t> s_next_iocb_id{1};

std::string ToString(IOState state) {
  switch (state) {
  case IOState::IDLE: return "idle";
  case IOState::PENDING: return "pending";
  case IOState::ACTIVE: return "active";
  case IOState::COMPLETED: return "completed";
  case IOState::ABORTED: return "aborted";
  }
  return "unknown";
}

IOCB::IOCB(apdu::APDUPtr request) : id_(s_next_iocb_id++), request_(std::move(request)) {
  if (!request_) {
    throw UsageError("IOCB requires a request");
  }
}

IOCB::~IOCB() = default;

void IOCB::add_callback(Callback callback) {
  if (!callback) {
    return;
  }
  if (resolved()) {
    callback(*this);
    return;
  }
  callbacks_.push_back(std::move(callback));
}

void IOCB::complete(apdu::APDUPtr response) {
  if (resolved()) {
    LOG_APP_TRACE("IOCB {} already {}, ignoring completion", id_, ToString(state_));
    return;
  }
  if (controller_) {
    controller_->complete_io(shared_from_this(), std::move(response));
  } else {
    resolve(IOState::COMPLETED, std::move(response));
  }
}

void IOCB::abort(apdu::APDUPtr error) {
  if (resolved()) {
    LOG_APP_TRACE("IOCB {} already {}, ignoring abort", id_, ToString(state_));
    return;
  }
  if (controller_) {
    controller_->abort_io(shared_from_this(), std::move(error));
  } else {
    resolve(IOState::ABORTED, std::move(error));
  }
}

void IOCB::cancel() {
  abort(MakeLocalAbort(apdu::AbortReason::OTHER));
}

void IOCB::set_timeout(boost::asio::io_context &io_context, std::chrono::milliseconds timeout) {
  if (resolved()) {
    return;
  }

  // Replacing the timer cancels any earlier wait
  timer_ = std::make_unique<boost::asio::steady_timer>(io_context, timeout);

  std::weak_ptr<IOCB> weak_self = weak_from_this();
  timer_->async_wait([weak_self](const boost::system::error_code &ec) {
    if (ec) {
      return;
    }
    auto self = weak_self.lock();
    if (!self || self->resolved()) {
      return;
    }
    LOG_APP_DEBUG("IOCB {} timed out waiting for {}", self->id_,
                  self->request_->destination().ToString());
    self->abort(self->MakeLocalAbort(apdu::AbortReason::APPLICATION_EXCEEDED_REPLY_TIME));
  });
}

void IOCB::clear_timeout() {
  if (timer_) {
    timer_->cancel();
  }
}

apdu::APDUPtr IOCB::MakeLocalAbort(apdu::AbortReason reason) const {
  if (request_->is_confirmed_request()) {
    const auto &request = static_cast<const apdu::ConfirmedRequest &>(*request_);
    return apdu::Abort::ForRequest(request, reason, false);
  }
  return std::make_shared<apdu::Abort>(reason, false);
}

bool IOCB::resolve(IOState state, apdu::APDUPtr outcome) {
  if (resolved()) {
    return false;
  }

  state_ = state;
  if (state == IOState::COMPLETED) {
    response_ = std::move(outcome);
  } else {
    error_ = std::move(outcome);
  }
  controller_ = nullptr;
  clear_timeout();

  LOG_APP_TRACE("IOCB {} {}", id_, ToString(state_));

  auto callbacks = std::move(callbacks_);
  callbacks_.clear();
  for (const auto &callback : callbacks) {
    // A failing callback must not starve the others or the controller
    try {
      callback(*this);
    } catch (const std::exception &e) {
      LOG_APP_ERROR("Completion callback for IOCB {} threw: {}", id_, e.what());
    } catch (...) {
      LOG_APP_ERROR("Unknown exception in completion callback for IOCB {}", id_);
    }
  }
  return true;
}

} // namespace app
} // namespace bacstack
