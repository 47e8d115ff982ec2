// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "pdu/object_identifier.hpp"
#include "util/string_parsing.hpp"
#include <array>
#include <utility>

namespace bacstack {
namespace pdu {

namespace {

constexpr std::array<std::pair<ObjectType, const char *>, 21> OBJECT_TYPE_NAMES = {{
    {ObjectType::ANALOG_INPUT, "analogInput"},
    {ObjectType::ANALOG_OUTPUT, "analogOutput"},
    {ObjectType::ANALOG_VALUE, "analogValue"},
    {ObjectType::BINARY_INPUT, "binaryInput"},
    {ObjectType::BINARY_OUTPUT, "binaryOutput"},
    {ObjectType::BINARY_VALUE, "binaryValue"},
    {ObjectType::CALENDAR, "calendar"},
    {ObjectType::COMMAND, "command"},
    {ObjectType::DEVICE, "device"},
    {ObjectType::EVENT_ENROLLMENT, "eventEnrollment"},
    {ObjectType::FILE, "file"},
    {ObjectType::GROUP, "group"},
    {ObjectType::LOOP, "loop"},
    {ObjectType::MULTI_STATE_INPUT, "multiStateInput"},
    {ObjectType::MULTI_STATE_OUTPUT, "multiStateOutput"},
    {ObjectType::NOTIFICATION_CLASS, "notificationClass"},
    {ObjectType::PROGRAM, "program"},
    {ObjectType::SCHEDULE, "schedule"},
    {ObjectType::AVERAGING, "averaging"},
    {ObjectType::MULTI_STATE_VALUE, "multiStateValue"},
    {ObjectType::TREND_LOG, "trendLog"},
}};

} // namespace

std::string ToString(ObjectType type) {
  for (const auto &[value, name] : OBJECT_TYPE_NAMES) {
    if (value == type) {
      return name;
    }
  }
  return std::to_string(static_cast<uint16_t>(type));
}

std::optional<ObjectType> ObjectTypeFromString(const std::string &name) {
  for (const auto &[value, text] : OBJECT_TYPE_NAMES) {
    if (name == text) {
      return value;
    }
  }
  return std::nullopt;
}

std::string ObjectIdentifier::ToString() const {
  return pdu::ToString(type) + ":" + std::to_string(instance);
}

std::optional<ObjectIdentifier> ObjectIdentifier::Parse(const std::string &text) {
  size_t colon = text.find(':');
  if (colon == std::string::npos) {
    return std::nullopt;
  }

  auto type = ObjectTypeFromString(text.substr(0, colon));
  if (!type) {
    return std::nullopt;
  }

  auto instance = util::SafeParseInt64(text.substr(colon + 1), 0, MAXIMUM_INSTANCE_NUMBER);
  if (!instance) {
    return std::nullopt;
  }

  return ObjectIdentifier(*type, static_cast<uint32_t>(*instance));
}

} // namespace pdu
} // namespace bacstack
