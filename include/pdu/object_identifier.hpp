// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace bacstack {
namespace pdu {

// Standard object types (subset hosted or referenced by this stack)
enum class ObjectType : uint16_t {
  ANALOG_INPUT = 0,
  ANALOG_OUTPUT = 1,
  ANALOG_VALUE = 2,
  BINARY_INPUT = 3,
  BINARY_OUTPUT = 4,
  BINARY_VALUE = 5,
  CALENDAR = 6,
  COMMAND = 7,
  DEVICE = 8,
  EVENT_ENROLLMENT = 9,
  FILE = 10,
  GROUP = 11,
  LOOP = 12,
  MULTI_STATE_INPUT = 13,
  MULTI_STATE_OUTPUT = 14,
  NOTIFICATION_CLASS = 15,
  PROGRAM = 16,
  SCHEDULE = 17,
  AVERAGING = 18,
  MULTI_STATE_VALUE = 19,
  TREND_LOG = 20,
};

std::string ToString(ObjectType type);
std::optional<ObjectType> ObjectTypeFromString(const std::string &name);

/**
 * ObjectIdentifier - (object type, instance number)
 *
 * The instance number is a 22-bit field. MAXIMUM_INSTANCE_NUMBER itself is
 * the "unconfigured" wildcard, so hosted objects must use an instance
 * strictly below it.
 */
struct ObjectIdentifier {
  static constexpr uint32_t MAXIMUM_INSTANCE_NUMBER = 0x003FFFFF;

  ObjectType type = ObjectType::ANALOG_INPUT;
  uint32_t instance = 0;

  ObjectIdentifier() = default;
  ObjectIdentifier(ObjectType t, uint32_t i) : type(t), instance(i) {}

  bool is_device() const { return type == ObjectType::DEVICE; }
  bool has_valid_instance() const { return instance < MAXIMUM_INSTANCE_NUMBER; }

  // "device:1234"
  std::string ToString() const;

  // Inverse of ToString(); std::nullopt if malformed or instance too large
  static std::optional<ObjectIdentifier> Parse(const std::string &text);

  auto operator<=>(const ObjectIdentifier &) const = default;
  bool operator==(const ObjectIdentifier &) const = default;
};

} // namespace pdu
} // namespace bacstack
