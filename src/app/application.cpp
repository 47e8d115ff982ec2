// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/application.hpp"
#include "app/errors.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace bacstack {
namespace app {

Application::Application(LocalDevicePtr local_device,
                         std::shared_ptr<DeviceInfoCache> device_info_cache)
    : local_device_(std::move(local_device)), device_info_cache_(std::move(device_info_cache)) {
  if (!device_info_cache_) {
    device_info_cache_ = std::make_shared<DeviceInfoCache>();
  }
  if (local_device_) {
    add_object(local_device_);
  }
}

Application::~Application() {
  if (!controllers_.empty()) {
    LOG_APP_DEBUG("Application shutting down with {} busy destination(s)", controllers_.size());
  }
}

void Application::RegisterServices(ServiceModule &module) {
  module.RegisterServices(services_);
}

// ---------------------------------------------------------------------------
// Outbound
// ---------------------------------------------------------------------------

IOCBPtr Application::request(apdu::APDUPtr apdu) {
  if (!apdu) {
    throw UsageError("request: null APDU");
  }

  if (apdu->is_unconfirmed_request()) {
    LOG_APP_TRACE("Sending {}", apdu->ToString());
    send_request(std::move(apdu));
    return nullptr;
  }

  if (!apdu->is_confirmed_request()) {
    throw UsageError("request: " + apdu::ToString(apdu->apdu_type()) + " is not a request");
  }

  auto iocb = std::make_shared<IOCB>(apdu);
  auto controller = GetOrCreateController(apdu->destination());
  controller->submit(iocb);
  return iocb;
}

void Application::response(apdu::APDUPtr apdu) {
  if (!apdu) {
    throw UsageError("response: null APDU");
  }
  LOG_APP_TRACE("Responding {}", apdu->ToString());
  send_response(std::move(apdu));
}

DestinationControllerPtr Application::GetOrCreateController(const pdu::Address &destination) {
  auto it = controllers_.find(destination);
  if (it != controllers_.end()) {
    return it->second;
  }

  auto controller = std::make_shared<DestinationController>(
      destination, [this](const apdu::APDUPtr &apdu) { send_request(apdu); });
  controller->set_idle_callback(
      [this](DestinationController &idle) { OnControllerIdle(idle); });
  controllers_.emplace(destination, controller);

  LOG_APP_TRACE("New destination controller for {}", destination.ToString());
  return controller;
}

void Application::OnControllerIdle(DestinationController &controller) {
  auto it = controllers_.find(controller.destination());
  // A newer controller may already own this destination
  if (it != controllers_.end() && it->second.get() == &controller) {
    LOG_APP_TRACE("Destination {} idle, dropping controller", controller.destination().ToString());
    controllers_.erase(it);
  }
}

// ---------------------------------------------------------------------------
// Inbound
// ---------------------------------------------------------------------------

void Application::confirmation(apdu::APDUPtr apdu) {
  if (!apdu) {
    throw UsageError("confirmation: null APDU");
  }

  auto it = controllers_.find(apdu->source());
  if (it == controllers_.end()) {
    LOG_APP_DEBUG("Stray {} from {} (no request outstanding)", apdu::ToString(apdu->apdu_type()),
                  apdu->source().ToString());
    return;
  }
  DestinationControllerPtr controller = it->second;

  bool positive = false;
  switch (apdu->apdu_type()) {
  case apdu::ApduType::SIMPLE_ACK:
  case apdu::ApduType::COMPLEX_ACK:
    positive = true;
    break;
  case apdu::ApduType::ERROR_PDU:
  case apdu::ApduType::REJECT:
  case apdu::ApduType::ABORT:
    break;
  default:
    throw ProtocolViolation("unexpected " + apdu::ToString(apdu->apdu_type()) +
                            " confirmation from " + apdu->source().ToString());
  }

  IOCBPtr iocb = controller->active();
  if (!iocb) {
    LOG_APP_DEBUG("{} from {} with nothing active, dropped", apdu::ToString(apdu->apdu_type()),
                  apdu->source().ToString());
    return;
  }

  if (positive) {
    controller->complete_io(iocb, std::move(apdu));
  } else {
    controller->abort_io(iocb, std::move(apdu));
  }
}

void Application::indication(apdu::APDUPtr apdu) {
  if (!apdu) {
    throw UsageError("indication: null APDU");
  }

  switch (apdu->apdu_type()) {
  case apdu::ApduType::CONFIRMED_REQUEST:
    HandleConfirmedIndication(std::static_pointer_cast<const apdu::ConfirmedRequest>(apdu));
    break;
  case apdu::ApduType::UNCONFIRMED_REQUEST:
    HandleUnconfirmedIndication(std::static_pointer_cast<const apdu::UnconfirmedRequest>(apdu));
    break;
  default:
    throw ProtocolViolation("unexpected " + apdu::ToString(apdu->apdu_type()) +
                            " indication from " + apdu->source().ToString());
  }
}

void Application::HandleConfirmedIndication(const ConfirmedRequestPtr &request) {
  auto handler = services_.Find(request->service_choice());
  if (!handler) {
    throw UnrecognizedService("no handler for " + apdu::ToString(request->service_choice()));
  }

  LOG_APP_TRACE("Dispatching {}", request->ToString());

  try {
    handler(request);
  } catch (const RejectException &) {
    throw;
  } catch (const AbortException &) {
    throw;
  } catch (const ExecutionError &e) {
    LOG_APP_DEBUG("{} from {} failed: {}", apdu::ToString(request->service_choice()),
                  request->source().ToString(), e.what());
    response(apdu::Error::ForRequest(*request, e.error_class(), e.error_code()));
  } catch (const std::exception &e) {
    LOG_APP_ERROR("Handler exception for service {}: {}",
                  apdu::ToString(request->service_choice()), e.what());
    response(apdu::Error::ForRequest(*request, apdu::ErrorClass::DEVICE,
                                     apdu::ErrorCode::OPERATIONAL_PROBLEM));
  } catch (...) {
    LOG_APP_ERROR("Unknown exception in handler for service {}",
                  apdu::ToString(request->service_choice()));
    response(apdu::Error::ForRequest(*request, apdu::ErrorClass::DEVICE,
                                     apdu::ErrorCode::OPERATIONAL_PROBLEM));
  }
}

void Application::HandleUnconfirmedIndication(const UnconfirmedRequestPtr &request) {
  auto handler = services_.Find(request->service_choice());
  if (!handler) {
    LOG_APP_TRACE("No handler for {}, ignored", apdu::ToString(request->service_choice()));
    return;
  }

  try {
    handler(request);
  } catch (const RejectException &) {
    throw;
  } catch (const AbortException &) {
    throw;
  } catch (const ExecutionError &e) {
    LOG_APP_DEBUG("{} from {} failed: {}", apdu::ToString(request->service_choice()),
                  request->source().ToString(), e.what());
  } catch (const std::exception &e) {
    LOG_APP_ERROR("Handler exception for service {}: {}",
                  apdu::ToString(request->service_choice()), e.what());
  } catch (...) {
    LOG_APP_ERROR("Unknown exception in handler for service {}",
                  apdu::ToString(request->service_choice()));
  }
}

apdu::ServicesSupported Application::get_services_supported() const {
  apdu::ServicesSupported supported;
  for (auto choice : apdu::CONFIRMED_SERVICES) {
    if (services_.HasHandler(choice)) {
      supported.set(choice);
    }
  }
  for (auto choice : apdu::UNCONFIRMED_SERVICES) {
    if (services_.HasHandler(choice)) {
      supported.set(choice);
    }
  }
  return supported;
}

// ---------------------------------------------------------------------------
// Objects
// ---------------------------------------------------------------------------

void Application::add_object(LocalObjectPtr object) {
  if (!object) {
    throw UsageError("add_object: null object");
  }

  const auto &name = object->name();
  const auto &identifier = object->identifier();

  if (name.empty()) {
    throw UsageError("add_object: object name required");
  }
  if (!identifier.has_valid_instance()) {
    throw UsageError("add_object: instance out of range in " + identifier.ToString());
  }
  if (objects_by_name_.count(name) > 0) {
    throw UsageError("add_object: already an object named '" + name + "'");
  }
  if (objects_by_id_.count(identifier) > 0) {
    throw UsageError("add_object: already an object with identifier " + identifier.ToString());
  }

  objects_by_name_[name] = object;
  objects_by_id_[identifier] = object;

  if (local_device_ && local_device_->object_list) {
    auto &list = *local_device_->object_list;
    if (std::find(list.begin(), list.end(), identifier) == list.end()) {
      list.push_back(identifier);
    }
  }

  LOG_APP_DEBUG("Added object {} '{}'", identifier.ToString(), name);
}

void Application::delete_object(const LocalObjectPtr &object) {
  if (!object) {
    throw UsageError("delete_object: null object");
  }

  auto by_id = objects_by_id_.find(object->identifier());
  if (by_id == objects_by_id_.end() || by_id->second != object) {
    throw UsageError("delete_object: " + object->identifier().ToString() + " is not registered");
  }

  objects_by_id_.erase(by_id);
  objects_by_name_.erase(object->name());

  if (local_device_ && local_device_->object_list) {
    auto &list = *local_device_->object_list;
    list.erase(std::remove(list.begin(), list.end(), object->identifier()), list.end());
  }

  LOG_APP_DEBUG("Deleted object {} '{}'", object->identifier().ToString(), object->name());
}

LocalObjectPtr Application::get_object_id(const pdu::ObjectIdentifier &identifier) const {
  auto it = objects_by_id_.find(identifier);
  return it != objects_by_id_.end() ? it->second : nullptr;
}

LocalObjectPtr Application::get_object_name(const std::string &name) const {
  auto it = objects_by_name_.find(name);
  return it != objects_by_name_.end() ? it->second : nullptr;
}

std::vector<LocalObjectPtr> Application::objects() const {
  std::vector<LocalObjectPtr> result;
  result.reserve(objects_by_id_.size());
  for (const auto &[id, object] : objects_by_id_) {
    result.push_back(object);
  }
  return result;
}

} // namespace app
} // namespace bacstack
