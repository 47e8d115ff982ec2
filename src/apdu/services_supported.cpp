// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "apdu/services_supported.hpp"

namespace bacstack {
namespace apdu {

size_t ServicesSupportedBit(ConfirmedServiceChoice choice) {
  switch (choice) {
  // Positions 0-23 match the service choice
  case ConfirmedServiceChoice::ACKNOWLEDGE_ALARM:
  case ConfirmedServiceChoice::CONFIRMED_COV_NOTIFICATION:
  case ConfirmedServiceChoice::CONFIRMED_EVENT_NOTIFICATION:
  case ConfirmedServiceChoice::GET_ALARM_SUMMARY:
  case ConfirmedServiceChoice::GET_ENROLLMENT_SUMMARY:
  case ConfirmedServiceChoice::SUBSCRIBE_COV:
  case ConfirmedServiceChoice::ATOMIC_READ_FILE:
  case ConfirmedServiceChoice::ATOMIC_WRITE_FILE:
  case ConfirmedServiceChoice::ADD_LIST_ELEMENT:
  case ConfirmedServiceChoice::REMOVE_LIST_ELEMENT:
  case ConfirmedServiceChoice::CREATE_OBJECT:
  case ConfirmedServiceChoice::DELETE_OBJECT:
  case ConfirmedServiceChoice::READ_PROPERTY:
  case ConfirmedServiceChoice::READ_PROPERTY_MULTIPLE:
  case ConfirmedServiceChoice::WRITE_PROPERTY:
  case ConfirmedServiceChoice::WRITE_PROPERTY_MULTIPLE:
  case ConfirmedServiceChoice::DEVICE_COMMUNICATION_CONTROL:
  case ConfirmedServiceChoice::CONFIRMED_PRIVATE_TRANSFER:
  case ConfirmedServiceChoice::CONFIRMED_TEXT_MESSAGE:
  case ConfirmedServiceChoice::REINITIALIZE_DEVICE:
  case ConfirmedServiceChoice::VT_OPEN:
  case ConfirmedServiceChoice::VT_CLOSE:
  case ConfirmedServiceChoice::VT_DATA:
    return static_cast<size_t>(choice);
  case ConfirmedServiceChoice::READ_RANGE: return 35;
  case ConfirmedServiceChoice::LIFE_SAFETY_OPERATION: return 37;
  case ConfirmedServiceChoice::SUBSCRIBE_COV_PROPERTY: return 38;
  case ConfirmedServiceChoice::GET_EVENT_INFORMATION: return 39;
  }
  return static_cast<size_t>(choice);
}

size_t ServicesSupportedBit(UnconfirmedServiceChoice choice) {
  switch (choice) {
  case UnconfirmedServiceChoice::I_AM: return 26;
  case UnconfirmedServiceChoice::I_HAVE: return 27;
  case UnconfirmedServiceChoice::UNCONFIRMED_COV_NOTIFICATION: return 28;
  case UnconfirmedServiceChoice::UNCONFIRMED_EVENT_NOTIFICATION: return 29;
  case UnconfirmedServiceChoice::UNCONFIRMED_PRIVATE_TRANSFER: return 30;
  case UnconfirmedServiceChoice::UNCONFIRMED_TEXT_MESSAGE: return 31;
  case UnconfirmedServiceChoice::TIME_SYNCHRONIZATION: return 32;
  case UnconfirmedServiceChoice::WHO_HAS: return 33;
  case UnconfirmedServiceChoice::WHO_IS: return 34;
  case UnconfirmedServiceChoice::UTC_TIME_SYNCHRONIZATION: return 36;
  case UnconfirmedServiceChoice::WRITE_GROUP: return 40;
  }
  return 26 + static_cast<size_t>(choice);
}

void ServicesSupported::set(ConfirmedServiceChoice choice, bool value) {
  bits_.set(ServicesSupportedBit(choice), value);
}

void ServicesSupported::set(UnconfirmedServiceChoice choice, bool value) {
  bits_.set(ServicesSupportedBit(choice), value);
}

bool ServicesSupported::test(ConfirmedServiceChoice choice) const {
  return bits_.test(ServicesSupportedBit(choice));
}

bool ServicesSupported::test(UnconfirmedServiceChoice choice) const {
  return bits_.test(ServicesSupportedBit(choice));
}

std::string ServicesSupported::ToString() const {
  std::string text;
  text.reserve(BIT_LENGTH);
  for (size_t i = 0; i < BIT_LENGTH; ++i) {
    text.push_back(bits_.test(i) ? '1' : '0');
  }
  return text;
}

} // namespace apdu
} // namespace bacstack
