// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "apdu/apdu.hpp"
#include <initializer_list>
#include <utility>

namespace bacstack {
namespace comm {

// Protocol stack composition
//
// Every layer speaks the same three-operation interface:
// - request / response travel down the stack
// - indication / confirmation travel up the stack
//
// ServiceElement is the upper role (it sits on top of something),
// ServiceAccessPoint is the lower role (something sits on top of it), and
// Layer plays both. Stacks are wired once at startup with Bind() /
// BindStack(); there is no rebinding while traffic flows.

class ServiceAccessPoint;

class ServiceElement {
public:
  virtual ~ServiceElement() = default;

  // Upward traffic from the layer below
  virtual void indication(apdu::APDUPtr apdu) = 0;
  virtual void confirmation(apdu::APDUPtr apdu) = 0;

  ServiceAccessPoint *lower() const { return lower_; }

protected:
  ServiceElement() = default;

  // Downward traffic (throws app::ConfigurationError when unbound)
  void send_request(apdu::APDUPtr apdu);
  void send_response(apdu::APDUPtr apdu);

private:
  friend void Bind(ServiceElement &upper, ServiceAccessPoint &lower);
  ServiceAccessPoint *lower_ = nullptr;
};

class ServiceAccessPoint {
public:
  virtual ~ServiceAccessPoint() = default;

  // Downward traffic from the layer above
  virtual void request(apdu::APDUPtr apdu) = 0;
  virtual void response(apdu::APDUPtr apdu) = 0;

  ServiceElement *upper() const { return upper_; }

protected:
  ServiceAccessPoint() = default;

  // Upward traffic (throws app::ConfigurationError when unbound)
  void send_indication(apdu::APDUPtr apdu);
  void send_confirmation(apdu::APDUPtr apdu);

private:
  friend void Bind(ServiceElement &upper, ServiceAccessPoint &lower);
  ServiceElement *upper_ = nullptr;
};

// Middle layer: passes everything through unless overridden
class Layer : public ServiceElement, public ServiceAccessPoint {
public:
  void indication(apdu::APDUPtr apdu) override { send_indication(std::move(apdu)); }
  void confirmation(apdu::APDUPtr apdu) override { send_confirmation(std::move(apdu)); }
  void request(apdu::APDUPtr apdu) override { send_request(std::move(apdu)); }
  void response(apdu::APDUPtr apdu) override { send_response(std::move(apdu)); }
};

// Wire `upper` directly on top of `lower`
void Bind(ServiceElement &upper, ServiceAccessPoint &lower);

// Wire top -> middle[0] -> ... -> middle[n-1] -> bottom
void BindStack(ServiceElement &top, std::initializer_list<Layer *> middle,
               ServiceAccessPoint &bottom);

} // namespace comm
} // namespace bacstack
