// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "comm/layer.hpp"

namespace bacstack {
namespace app {

/**
 * ApplicationServiceAccessPoint - layer directly below the Application
 *
 * Turns failures escaping Application::indication() into the message the
 * peer sees:
 *   UnrecognizedService -> Reject(unrecognized-service)
 *   RejectException     -> Reject(reason)
 *   AbortException      -> Abort(reason, server)
 * Only confirmed requests are answered; for unconfirmed ones the failure
 * is logged and dropped. Other traffic passes through unchanged.
 */
class ApplicationServiceAccessPoint : public comm::Layer {
public:
  void indication(apdu::APDUPtr apdu) override;
};

} // namespace app
} // namespace bacstack
