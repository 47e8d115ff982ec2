// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Application-layer enumerations

 Numeric values are the on-the-wire values from ANSI/ASHRAE 135. Only the
 names are used by this stack (encoding lives in the lower layers), but
 keeping the standard values lets log output be matched against captures.
*/

#include <array>
#include <cstdint>
#include <string>

namespace bacstack {
namespace apdu {

enum class ConfirmedServiceChoice : uint8_t {
  ACKNOWLEDGE_ALARM = 0,
  CONFIRMED_COV_NOTIFICATION = 1,
  CONFIRMED_EVENT_NOTIFICATION = 2,
  GET_ALARM_SUMMARY = 3,
  GET_ENROLLMENT_SUMMARY = 4,
  SUBSCRIBE_COV = 5,
  ATOMIC_READ_FILE = 6,
  ATOMIC_WRITE_FILE = 7,
  ADD_LIST_ELEMENT = 8,
  REMOVE_LIST_ELEMENT = 9,
  CREATE_OBJECT = 10,
  DELETE_OBJECT = 11,
  READ_PROPERTY = 12,
  READ_PROPERTY_MULTIPLE = 14,
  WRITE_PROPERTY = 15,
  WRITE_PROPERTY_MULTIPLE = 16,
  DEVICE_COMMUNICATION_CONTROL = 17,
  CONFIRMED_PRIVATE_TRANSFER = 18,
  CONFIRMED_TEXT_MESSAGE = 19,
  REINITIALIZE_DEVICE = 20,
  VT_OPEN = 21,
  VT_CLOSE = 22,
  VT_DATA = 23,
  READ_RANGE = 26,
  LIFE_SAFETY_OPERATION = 27,
  SUBSCRIBE_COV_PROPERTY = 28,
  GET_EVENT_INFORMATION = 29,
};

enum class UnconfirmedServiceChoice : uint8_t {
  I_AM = 0,
  I_HAVE = 1,
  UNCONFIRMED_COV_NOTIFICATION = 2,
  UNCONFIRMED_EVENT_NOTIFICATION = 3,
  UNCONFIRMED_PRIVATE_TRANSFER = 4,
  UNCONFIRMED_TEXT_MESSAGE = 5,
  TIME_SYNCHRONIZATION = 6,
  WHO_HAS = 7,
  WHO_IS = 8,
  UTC_TIME_SYNCHRONIZATION = 9,
  WRITE_GROUP = 10,
};

// Every known service, in service-choice order
inline constexpr std::array<ConfirmedServiceChoice, 27> CONFIRMED_SERVICES = {
    ConfirmedServiceChoice::ACKNOWLEDGE_ALARM,
    ConfirmedServiceChoice::CONFIRMED_COV_NOTIFICATION,
    ConfirmedServiceChoice::CONFIRMED_EVENT_NOTIFICATION,
    ConfirmedServiceChoice::GET_ALARM_SUMMARY,
    ConfirmedServiceChoice::GET_ENROLLMENT_SUMMARY,
    ConfirmedServiceChoice::SUBSCRIBE_COV,
    ConfirmedServiceChoice::ATOMIC_READ_FILE,
    ConfirmedServiceChoice::ATOMIC_WRITE_FILE,
    ConfirmedServiceChoice::ADD_LIST_ELEMENT,
    ConfirmedServiceChoice::REMOVE_LIST_ELEMENT,
    ConfirmedServiceChoice::CREATE_OBJECT,
    ConfirmedServiceChoice::DELETE_OBJECT,
    ConfirmedServiceChoice::READ_PROPERTY,
    ConfirmedServiceChoice::READ_PROPERTY_MULTIPLE,
    ConfirmedServiceChoice::WRITE_PROPERTY,
    ConfirmedServiceChoice::WRITE_PROPERTY_MULTIPLE,
    ConfirmedServiceChoice::DEVICE_COMMUNICATION_CONTROL,
    ConfirmedServiceChoice::CONFIRMED_PRIVATE_TRANSFER,
    ConfirmedServiceChoice::CONFIRMED_TEXT_MESSAGE,
    ConfirmedServiceChoice::REINITIALIZE_DEVICE,
    ConfirmedServiceChoice::VT_OPEN,
    ConfirmedServiceChoice::VT_CLOSE,
    ConfirmedServiceChoice::VT_DATA,
    ConfirmedServiceChoice::READ_RANGE,
    ConfirmedServiceChoice::LIFE_SAFETY_OPERATION,
    ConfirmedServiceChoice::SUBSCRIBE_COV_PROPERTY,
    ConfirmedServiceChoice::GET_EVENT_INFORMATION,
};

inline constexpr std::array<UnconfirmedServiceChoice, 11> UNCONFIRMED_SERVICES = {
    UnconfirmedServiceChoice::I_AM,
    UnconfirmedServiceChoice::I_HAVE,
    UnconfirmedServiceChoice::UNCONFIRMED_COV_NOTIFICATION,
    UnconfirmedServiceChoice::UNCONFIRMED_EVENT_NOTIFICATION,
    UnconfirmedServiceChoice::UNCONFIRMED_PRIVATE_TRANSFER,
    UnconfirmedServiceChoice::UNCONFIRMED_TEXT_MESSAGE,
    UnconfirmedServiceChoice::TIME_SYNCHRONIZATION,
    UnconfirmedServiceChoice::WHO_HAS,
    UnconfirmedServiceChoice::WHO_IS,
    UnconfirmedServiceChoice::UTC_TIME_SYNCHRONIZATION,
    UnconfirmedServiceChoice::WRITE_GROUP,
};

enum class ErrorClass : uint8_t {
  DEVICE = 0,
  OBJECT = 1,
  PROPERTY = 2,
  RESOURCES = 3,
  SECURITY = 4,
  SERVICES = 5,
  VT = 6,
  COMMUNICATION = 7,
};

enum class ErrorCode : uint8_t {
  OTHER = 0,
  CONFIGURATION_IN_PROGRESS = 2,
  DEVICE_BUSY = 3,
  DYNAMIC_CREATION_NOT_SUPPORTED = 4,
  INCONSISTENT_PARAMETERS = 7,
  INVALID_DATA_TYPE = 9,
  MISSING_REQUIRED_PARAMETER = 16,
  NO_SPACE_FOR_OBJECT = 18,
  OBJECT_DELETION_NOT_PERMITTED = 23,
  OBJECT_IDENTIFIER_ALREADY_EXISTS = 24,
  OPERATIONAL_PROBLEM = 25,
  READ_ACCESS_DENIED = 27,
  SERVICE_REQUEST_DENIED = 29,
  TIMEOUT = 30,
  UNKNOWN_OBJECT = 31,
  UNKNOWN_PROPERTY = 32,
  UNSUPPORTED_OBJECT_TYPE = 36,
  VALUE_OUT_OF_RANGE = 37,
  WRITE_ACCESS_DENIED = 40,
};

enum class RejectReason : uint8_t {
  OTHER = 0,
  BUFFER_OVERFLOW = 1,
  INCONSISTENT_PARAMETERS = 2,
  INVALID_PARAMETER_DATA_TYPE = 3,
  INVALID_TAG = 4,
  MISSING_REQUIRED_PARAMETER = 5,
  PARAMETER_OUT_OF_RANGE = 6,
  TOO_MANY_ARGUMENTS = 7,
  UNDEFINED_ENUMERATION = 8,
  UNRECOGNIZED_SERVICE = 9,
};

enum class AbortReason : uint8_t {
  OTHER = 0,
  BUFFER_OVERFLOW = 1,
  INVALID_APDU_IN_THIS_STATE = 2,
  PREEMPTED_BY_HIGHER_PRIORITY_TASK = 3,
  SEGMENTATION_NOT_SUPPORTED = 4,
  SECURITY_ERROR = 5,
  INSUFFICIENT_SECURITY = 6,
  WINDOW_SIZE_OUT_OF_RANGE = 7,
  APPLICATION_EXCEEDED_REPLY_TIME = 8,
  OUT_OF_RESOURCES = 9,
  TSM_TIMEOUT = 10,
  APDU_TOO_LONG = 11,
};

enum class Segmentation : uint8_t {
  SEGMENTED_BOTH = 0,
  SEGMENTED_TRANSMIT = 1,
  SEGMENTED_RECEIVE = 2,
  NO_SEGMENTATION = 3,
};

std::string ToString(ConfirmedServiceChoice choice);
std::string ToString(UnconfirmedServiceChoice choice);
std::string ToString(ErrorClass error_class);
std::string ToString(ErrorCode error_code);
std::string ToString(RejectReason reason);
std::string ToString(AbortReason reason);
std::string ToString(Segmentation segmentation);

} // namespace apdu
} // namespace bacstack
