// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/application_service_access_point.hpp"
#include "app/errors.hpp"
#include "util/logging.hpp"

namespace bacstack {
namespace app {

void ApplicationServiceAccessPoint::indication(apdu::APDUPtr apdu) {
  if (!apdu || !apdu->is_confirmed_request()) {
    try {
      send_indication(apdu);
    } catch (const UnrecognizedService &e) {
      LOG_STACK_DEBUG("Unconfirmed indication dropped: {}", e.what());
    } catch (const RejectException &e) {
      LOG_STACK_DEBUG("Unconfirmed indication dropped: {}", e.what());
    } catch (const AbortException &e) {
      LOG_STACK_DEBUG("Unconfirmed indication dropped: {}", e.what());
    }
    return;
  }

  auto request = std::static_pointer_cast<const apdu::ConfirmedRequest>(apdu);

  try {
    send_indication(apdu);
  } catch (const UnrecognizedService &e) {
    LOG_STACK_DEBUG("Rejecting {} from {}: {}", apdu::ToString(request->service_choice()),
                    request->source().ToString(), e.what());
    send_response(apdu::Reject::ForRequest(*request, apdu::RejectReason::UNRECOGNIZED_SERVICE));
  } catch (const RejectException &e) {
    LOG_STACK_DEBUG("Rejecting {} from {}: {}", apdu::ToString(request->service_choice()),
                    request->source().ToString(), apdu::ToString(e.reason()));
    send_response(apdu::Reject::ForRequest(*request, e.reason()));
  } catch (const AbortException &e) {
    LOG_STACK_DEBUG("Aborting {} from {}: {}", apdu::ToString(request->service_choice()),
                    request->source().ToString(), apdu::ToString(e.reason()));
    send_response(apdu::Abort::ForRequest(*request, e.reason(), true));
  }
}

} // namespace app
} // namespace bacstack
