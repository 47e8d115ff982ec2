// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "service/device_services.hpp"
#include "app/application.hpp"
#include "app/errors.hpp"
#include "util/logging.hpp"

namespace bacstack {
namespace service {

DeviceServices::DeviceServices(app::Application &application) : application_(application) {}

void DeviceServices::RegisterServices(app::ServiceRegistry &registry) {
  registry.RegisterUnconfirmed(apdu::UnconfirmedServiceChoice::WHO_IS,
                               [this](const app::UnconfirmedRequestPtr &request) {
                                 HandleWhoIs(request);
                               });
  registry.RegisterUnconfirmed(apdu::UnconfirmedServiceChoice::I_AM,
                               [this](const app::UnconfirmedRequestPtr &request) {
                                 HandleIAm(request);
                               });
}

void DeviceServices::who_is(std::optional<uint32_t> low_limit, std::optional<uint32_t> high_limit,
                            const pdu::Address &destination) {
  if (low_limit.has_value() != high_limit.has_value()) {
    throw app::UsageError("who_is: give both limits or neither");
  }

  auto who_is = std::make_shared<apdu::WhoIsRequest>(low_limit, high_limit);
  who_is->set_destination(destination);

  LOG_APP_DEBUG("Sending {}", who_is->ToString());
  application_.request(who_is);
}

void DeviceServices::i_am(const pdu::Address &destination) {
  const auto &device = application_.local_device();
  if (!device) {
    throw app::UsageError("i_am: no local device");
  }

  auto i_am = std::make_shared<apdu::IAmRequest>(device->identifier(),
                                                 device->max_apdu_length_accepted,
                                                 device->segmentation_supported, device->vendor_id);
  i_am->set_destination(destination);

  LOG_APP_DEBUG("Sending {}", i_am->ToString());
  application_.request(i_am);
}

void DeviceServices::HandleWhoIs(const app::UnconfirmedRequestPtr &request) {
  auto who_is = std::dynamic_pointer_cast<const apdu::WhoIsRequest>(request);
  if (!who_is) {
    LOG_APP_WARN("Who-Is from {} was not decoded, dropped", request->source().ToString());
    return;
  }

  const auto &device = application_.local_device();
  if (!device) {
    LOG_APP_TRACE("Who-Is ignored: no local device");
    return;
  }

  auto low = who_is->low_limit();
  auto high = who_is->high_limit();
  if (low.has_value() != high.has_value()) {
    throw app::RejectException(apdu::RejectReason::MISSING_REQUIRED_PARAMETER);
  }

  uint32_t instance = device->identifier().instance;
  if (low && (instance < *low || instance > *high)) {
    LOG_APP_TRACE("Who-Is [{}, {}] does not cover device {}", *low, *high, instance);
    return;
  }

  i_am(who_is->source());
}

void DeviceServices::HandleIAm(const app::UnconfirmedRequestPtr &request) {
  auto i_am = std::dynamic_pointer_cast<const apdu::IAmRequest>(request);
  if (!i_am) {
    LOG_APP_WARN("I-Am from {} was not decoded, dropped", request->source().ToString());
    return;
  }

  if (!i_am->device_identifier().is_device()) {
    LOG_APP_DEBUG("I-Am from {} carries non-device identifier {}, ignored",
                  i_am->source().ToString(), i_am->device_identifier().ToString());
    return;
  }

  LOG_APP_DEBUG("I-Am {} from {}", i_am->device_identifier().ToString(),
                i_am->source().ToString());
  application_.device_info_cache().ingest(*i_am);
}

} // namespace service
} // namespace bacstack
