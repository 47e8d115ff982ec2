// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "comm/layer.hpp"
#include "app/errors.hpp"
#include "util/logging.hpp"

namespace bacstack {
namespace comm {

void ServiceElement::send_request(apdu::APDUPtr apdu) {
  if (!lower_) {
    throw app::ConfigurationError("unbound service element: no lower layer for request");
  }
  lower_->request(std::move(apdu));
}

void ServiceElement::send_response(apdu::APDUPtr apdu) {
  if (!lower_) {
    throw app::ConfigurationError("unbound service element: no lower layer for response");
  }
  lower_->response(std::move(apdu));
}

void ServiceAccessPoint::send_indication(apdu::APDUPtr apdu) {
  if (!upper_) {
    throw app::ConfigurationError("unbound access point: no upper layer for indication");
  }
  upper_->indication(std::move(apdu));
}

void ServiceAccessPoint::send_confirmation(apdu::APDUPtr apdu) {
  if (!upper_) {
    throw app::ConfigurationError("unbound access point: no upper layer for confirmation");
  }
  upper_->confirmation(std::move(apdu));
}

void Bind(ServiceElement &upper, ServiceAccessPoint &lower) {
  if (upper.lower_ || lower.upper_) {
    throw app::ConfigurationError("layer already bound");
  }
  upper.lower_ = &lower;
  lower.upper_ = &upper;
}

void BindStack(ServiceElement &top, std::initializer_list<Layer *> middle,
               ServiceAccessPoint &bottom) {
  ServiceElement *current = &top;
  for (Layer *layer : middle) {
    if (!layer) {
      throw app::ConfigurationError("null layer in stack");
    }
    Bind(*current, *layer);
    current = layer;
  }
  Bind(*current, bottom);
  LOG_STACK_DEBUG("Bound stack with {} middle layer(s)", middle.size());
}

} // namespace comm
} // namespace bacstack
