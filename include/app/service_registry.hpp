// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#ifndef BACSTACK_APP_SERVICE_REGISTRY_HPP
#define BACSTACK_APP_SERVICE_REGISTRY_HPP

#include "apdu/apdu.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bacstack {
namespace app {

using ConfirmedRequestPtr = std::shared_ptr<const apdu::ConfirmedRequest>;
using UnconfirmedRequestPtr = std::shared_ptr<const apdu::UnconfirmedRequest>;

/**
 * ServiceRegistry - service handler table keyed by service choice
 *
 * Design:
 * - Capability modules register handlers for the services they implement
 * - The application dispatches indications through this table and derives
 *   its protocol-services-supported bits from it
 * - One handler per service choice; registering again replaces it
 *
 * Handler contract:
 * - A confirmed handler that succeeds must send its own response
 * - Failures are reported by throwing RejectException, AbortException or
 *   ExecutionError (see app/errors.hpp)
 *
 * Usage:
 *   ServiceRegistry registry;
 *   registry.RegisterUnconfirmed(apdu::UnconfirmedServiceChoice::WHO_IS,
 *     [this](const UnconfirmedRequestPtr &req) { HandleWhoIs(req); });
 */
class ServiceRegistry {
public:
  using ConfirmedHandler = std::function<void(const ConfirmedRequestPtr &)>;
  using UnconfirmedHandler = std::function<void(const UnconfirmedRequestPtr &)>;

  ServiceRegistry() = default;
  ~ServiceRegistry() = default;

  // Non-copyable
  ServiceRegistry(const ServiceRegistry &) = delete;
  ServiceRegistry &operator=(const ServiceRegistry &) = delete;

  /**
   * Register handler for a confirmed service
   *
   * @param choice Service choice handled
   * @param handler Handler (required, must not be empty)
   *
   * Note: Empty handlers are rejected to prevent std::bad_function_call
   */
  void RegisterConfirmed(apdu::ConfirmedServiceChoice choice, ConfirmedHandler handler);

  /**
   * Register handler for an unconfirmed service
   */
  void RegisterUnconfirmed(apdu::UnconfirmedServiceChoice choice, UnconfirmedHandler handler);

  void UnregisterConfirmed(apdu::ConfirmedServiceChoice choice);
  void UnregisterUnconfirmed(apdu::UnconfirmedServiceChoice choice);

  bool HasHandler(apdu::ConfirmedServiceChoice choice) const;
  bool HasHandler(apdu::UnconfirmedServiceChoice choice) const;

  /**
   * Look up a handler
   *
   * @return Copy of the handler, empty if none is registered. The copy is
   *         invoked outside the registry lock.
   */
  ConfirmedHandler Find(apdu::ConfirmedServiceChoice choice) const;
  UnconfirmedHandler Find(apdu::UnconfirmedServiceChoice choice) const;

  /**
   * Get list of registered service names (for diagnostics)
   *
   * @return Sorted vector of service names
   */
  std::vector<std::string> GetRegisteredServices() const;

  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<apdu::ConfirmedServiceChoice, ConfirmedHandler> confirmed_;
  std::map<apdu::UnconfirmedServiceChoice, UnconfirmedHandler> unconfirmed_;
};

/**
 * ServiceModule - a capability that contributes service handlers
 *
 * The application hands its registry to each module once, at startup.
 */
class ServiceModule {
public:
  virtual ~ServiceModule() = default;

  virtual void RegisterServices(ServiceRegistry &registry) = 0;
};

} // namespace app
} // namespace bacstack

#endif // BACSTACK_APP_SERVICE_REGISTRY_HPP
