// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "apdu/enums.hpp"
#include "pdu/object_identifier.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bacstack {
namespace app {

// An object hosted by the local application
class LocalObject {
public:
  LocalObject(const pdu::ObjectIdentifier &identifier, std::string name)
      : identifier_(identifier), name_(std::move(name)) {}
  virtual ~LocalObject() = default;

  const pdu::ObjectIdentifier &identifier() const { return identifier_; }
  const std::string &name() const { return name_; }

private:
  pdu::ObjectIdentifier identifier_;
  std::string name_;
};

using LocalObjectPtr = std::shared_ptr<LocalObject>;

/**
 * LocalDevice - the device object describing this application
 *
 * When object_list is engaged the application keeps it in step with its
 * object registry (adds append, deletes remove). It starts out holding the
 * device's own identifier.
 */
class LocalDevice : public LocalObject {
public:
  LocalDevice(uint32_t instance, std::string name, uint16_t vendor_id,
              uint32_t max_apdu_length_accepted = 1024,
              apdu::Segmentation segmentation_supported = apdu::Segmentation::NO_SEGMENTATION)
      : LocalObject(pdu::ObjectIdentifier(pdu::ObjectType::DEVICE, instance), std::move(name)),
        vendor_id(vendor_id), max_apdu_length_accepted(max_apdu_length_accepted),
        segmentation_supported(segmentation_supported),
        object_list(std::vector<pdu::ObjectIdentifier>{identifier()}) {}

  uint16_t vendor_id;
  uint32_t max_apdu_length_accepted;
  apdu::Segmentation segmentation_supported;
  std::optional<std::vector<pdu::ObjectIdentifier>> object_list;
};

using LocalDevicePtr = std::shared_ptr<LocalDevice>;

} // namespace app
} // namespace bacstack
