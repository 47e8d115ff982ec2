// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Application - top of the protocol stack

 Outbound
 - request(): unconfirmed requests go straight down; confirmed requests are
   wrapped in an IOCB and serialized per destination through a
   DestinationController. Controllers are created on demand and dropped as
   soon as they go idle.
 - response(): answers to indications, sent straight down.

 Inbound
 - confirmation(): routed by source address to that destination's
   controller and resolves its active request.
 - indication(): dispatched through the ServiceRegistry. Handler failures
   are mapped here (ExecutionError and unclassified failures become Error
   responses); RejectException, AbortException and UnrecognizedService
   propagate to the ApplicationServiceAccessPoint below.

 Objects
 - Registry of hosted objects indexed by name and by identifier, both
   unique. The local device's object list mirrors the registry.

 Threading
 - Not thread-safe. The lower layer serializes request / indication /
   confirmation.
*/

#include "apdu/apdu.hpp"
#include "apdu/services_supported.hpp"
#include "app/destination_controller.hpp"
#include "app/device_info_cache.hpp"
#include "app/iocb.hpp"
#include "app/local_object.hpp"
#include "app/service_registry.hpp"
#include "comm/layer.hpp"
#include "pdu/address.hpp"
#include "pdu/object_identifier.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace bacstack {
namespace app {

class Application : public comm::ServiceElement {
public:
  // A cache is created when none is shared in
  explicit Application(LocalDevicePtr local_device = nullptr,
                       std::shared_ptr<DeviceInfoCache> device_info_cache = nullptr);
  ~Application() override;

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Let a capability module add its handlers
  void RegisterServices(ServiceModule &module);
  ServiceRegistry &services() { return services_; }
  const ServiceRegistry &services() const { return services_; }

  /**
   * Send a request
   * @return IOCB tracking a confirmed request, nullptr for unconfirmed
   * @throws UsageError for anything that is not a request
   */
  IOCBPtr request(apdu::APDUPtr apdu);

  // Send a response to an earlier indication
  void response(apdu::APDUPtr apdu);

  void indication(apdu::APDUPtr apdu) override;
  void confirmation(apdu::APDUPtr apdu) override;

  // One bit per service with a registered handler
  apdu::ServicesSupported get_services_supported() const;

  // Object registry
  void add_object(LocalObjectPtr object);
  void delete_object(const LocalObjectPtr &object);
  LocalObjectPtr get_object_id(const pdu::ObjectIdentifier &identifier) const;
  LocalObjectPtr get_object_name(const std::string &name) const;
  std::vector<LocalObjectPtr> objects() const;

  const LocalDevicePtr &local_device() const { return local_device_; }
  DeviceInfoCache &device_info_cache() { return *device_info_cache_; }
  const std::shared_ptr<DeviceInfoCache> &shared_device_info_cache() const {
    return device_info_cache_;
  }

  size_t controller_count() const { return controllers_.size(); }
  bool has_controller(const pdu::Address &destination) const {
    return controllers_.count(destination) > 0;
  }

private:
  void HandleConfirmedIndication(const ConfirmedRequestPtr &request);
  void HandleUnconfirmedIndication(const UnconfirmedRequestPtr &request);

  DestinationControllerPtr GetOrCreateController(const pdu::Address &destination);
  void OnControllerIdle(DestinationController &controller);

  LocalDevicePtr local_device_;
  std::shared_ptr<DeviceInfoCache> device_info_cache_;
  ServiceRegistry services_;

  std::map<std::string, LocalObjectPtr> objects_by_name_;
  std::map<pdu::ObjectIdentifier, LocalObjectPtr> objects_by_id_;

  std::map<pdu::Address, DestinationControllerPtr> controllers_;
};

} // namespace app
} // namespace bacstack
