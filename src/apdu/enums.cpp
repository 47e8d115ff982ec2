// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "apdu/enums.hpp"

namespace bacstack {
namespace apdu {

std::string ToString(ConfirmedServiceChoice choice) {
  switch (choice) {
  case ConfirmedServiceChoice::ACKNOWLEDGE_ALARM: return "acknowledgeAlarm";
  case ConfirmedServiceChoice::CONFIRMED_COV_NOTIFICATION: return "confirmedCOVNotification";
  case ConfirmedServiceChoice::CONFIRMED_EVENT_NOTIFICATION: return "confirmedEventNotification";
  case ConfirmedServiceChoice::GET_ALARM_SUMMARY: return "getAlarmSummary";
  case ConfirmedServiceChoice::GET_ENROLLMENT_SUMMARY: return "getEnrollmentSummary";
  case ConfirmedServiceChoice::SUBSCRIBE_COV: return "subscribeCOV";
  case ConfirmedServiceChoice::ATOMIC_READ_FILE: return "atomicReadFile";
  case ConfirmedServiceChoice::ATOMIC_WRITE_FILE: return "atomicWriteFile";
  case ConfirmedServiceChoice::ADD_LIST_ELEMENT: return "addListElement";
  case ConfirmedServiceChoice::REMOVE_LIST_ELEMENT: return "removeListElement";
  case ConfirmedServiceChoice::CREATE_OBJECT: return "createObject";
  case ConfirmedServiceChoice::DELETE_OBJECT: return "deleteObject";
  case ConfirmedServiceChoice::READ_PROPERTY: return "readProperty";
  case ConfirmedServiceChoice::READ_PROPERTY_MULTIPLE: return "readPropertyMultiple";
  case ConfirmedServiceChoice::WRITE_PROPERTY: return "writeProperty";
  case ConfirmedServiceChoice::WRITE_PROPERTY_MULTIPLE: return "writePropertyMultiple";
  case ConfirmedServiceChoice::DEVICE_COMMUNICATION_CONTROL: return "deviceCommunicationControl";
  case ConfirmedServiceChoice::CONFIRMED_PRIVATE_TRANSFER: return "confirmedPrivateTransfer";
  case ConfirmedServiceChoice::CONFIRMED_TEXT_MESSAGE: return "confirmedTextMessage";
  case ConfirmedServiceChoice::REINITIALIZE_DEVICE: return "reinitializeDevice";
  case ConfirmedServiceChoice::VT_OPEN: return "vtOpen";
  case ConfirmedServiceChoice::VT_CLOSE: return "vtClose";
  case ConfirmedServiceChoice::VT_DATA: return "vtData";
  case ConfirmedServiceChoice::READ_RANGE: return "readRange";
  case ConfirmedServiceChoice::LIFE_SAFETY_OPERATION: return "lifeSafetyOperation";
  case ConfirmedServiceChoice::SUBSCRIBE_COV_PROPERTY: return "subscribeCOVProperty";
  case ConfirmedServiceChoice::GET_EVENT_INFORMATION: return "getEventInformation";
  }
  return "confirmedService(" + std::to_string(static_cast<int>(choice)) + ")";
}

std::string ToString(UnconfirmedServiceChoice choice) {
  switch (choice) {
  case UnconfirmedServiceChoice::I_AM: return "iAm";
  case UnconfirmedServiceChoice::I_HAVE: return "iHave";
  case UnconfirmedServiceChoice::UNCONFIRMED_COV_NOTIFICATION: return "unconfirmedCOVNotification";
  case UnconfirmedServiceChoice::UNCONFIRMED_EVENT_NOTIFICATION: return "unconfirmedEventNotification";
  case UnconfirmedServiceChoice::UNCONFIRMED_PRIVATE_TRANSFER: return "unconfirmedPrivateTransfer";
  case UnconfirmedServiceChoice::UNCONFIRMED_TEXT_MESSAGE: return "unconfirmedTextMessage";
  case UnconfirmedServiceChoice::TIME_SYNCHRONIZATION: return "timeSynchronization";
  case UnconfirmedServiceChoice::WHO_HAS: return "whoHas";
  case UnconfirmedServiceChoice::WHO_IS: return "whoIs";
  case UnconfirmedServiceChoice::UTC_TIME_SYNCHRONIZATION: return "utcTimeSynchronization";
  case UnconfirmedServiceChoice::WRITE_GROUP: return "writeGroup";
  }
  return "unconfirmedService(" + std::to_string(static_cast<int>(choice)) + ")";
}

std::string ToString(ErrorClass error_class) {
  switch (error_class) {
  case ErrorClass::DEVICE: return "device";
  case ErrorClass::OBJECT: return "object";
  case ErrorClass::PROPERTY: return "property";
  case ErrorClass::RESOURCES: return "resources";
  case ErrorClass::SECURITY: return "security";
  case ErrorClass::SERVICES: return "services";
  case ErrorClass::VT: return "vt";
  case ErrorClass::COMMUNICATION: return "communication";
  }
  return "errorClass(" + std::to_string(static_cast<int>(error_class)) + ")";
}

std::string ToString(ErrorCode error_code) {
  switch (error_code) {
  case ErrorCode::OTHER: return "other";
  case ErrorCode::CONFIGURATION_IN_PROGRESS: return "configurationInProgress";
  case ErrorCode::DEVICE_BUSY: return "deviceBusy";
  case ErrorCode::DYNAMIC_CREATION_NOT_SUPPORTED: return "dynamicCreationNotSupported";
  case ErrorCode::INCONSISTENT_PARAMETERS: return "inconsistentParameters";
  case ErrorCode::INVALID_DATA_TYPE: return "invalidDataType";
  case ErrorCode::MISSING_REQUIRED_PARAMETER: return "missingRequiredParameter";
  case ErrorCode::NO_SPACE_FOR_OBJECT: return "noSpaceForObject";
  case ErrorCode::OBJECT_DELETION_NOT_PERMITTED: return "objectDeletionNotPermitted";
  case ErrorCode::OBJECT_IDENTIFIER_ALREADY_EXISTS: return "objectIdentifierAlreadyExists";
  case ErrorCode::OPERATIONAL_PROBLEM: return "operationalProblem";
  case ErrorCode::READ_ACCESS_DENIED: return "readAccessDenied";
  case ErrorCode::SERVICE_REQUEST_DENIED: return "serviceRequestDenied";
  case ErrorCode::TIMEOUT: return "timeout";
  case ErrorCode::UNKNOWN_OBJECT: return "unknownObject";
  case ErrorCode::UNKNOWN_PROPERTY: return "unknownProperty";
  case ErrorCode::UNSUPPORTED_OBJECT_TYPE: return "unsupportedObjectType";
  case ErrorCode::VALUE_OUT_OF_RANGE: return "valueOutOfRange";
  case ErrorCode::WRITE_ACCESS_DENIED: return "writeAccessDenied";
  }
  return "errorCode(" + std::to_string(static_cast<int>(error_code)) + ")";
}

std::string ToString(RejectReason reason) {
  switch (reason) {
  case RejectReason::OTHER: return "other";
  case RejectReason::BUFFER_OVERFLOW: return "bufferOverflow";
  case RejectReason::INCONSISTENT_PARAMETERS: return "inconsistentParameters";
  case RejectReason::INVALID_PARAMETER_DATA_TYPE: return "invalidParameterDatatype";
  case RejectReason::INVALID_TAG: return "invalidTag";
  case RejectReason::MISSING_REQUIRED_PARAMETER: return "missingRequiredParameter";
  case RejectReason::PARAMETER_OUT_OF_RANGE: return "parameterOutOfRange";
  case RejectReason::TOO_MANY_ARGUMENTS: return "tooManyArguments";
  case RejectReason::UNDEFINED_ENUMERATION: return "undefinedEnumeration";
  case RejectReason::UNRECOGNIZED_SERVICE: return "unrecognizedService";
  }
  return "rejectReason(" + std::to_string(static_cast<int>(reason)) + ")";
}

std::string ToString(AbortReason reason) {
  switch (reason) {
  case AbortReason::OTHER: return "other";
  case AbortReason::BUFFER_OVERFLOW: return "bufferOverflow";
  case AbortReason::INVALID_APDU_IN_THIS_STATE: return "invalidApduInThisState";
  case AbortReason::PREEMPTED_BY_HIGHER_PRIORITY_TASK: return "preemptedByHigherPriorityTask";
  case AbortReason::SEGMENTATION_NOT_SUPPORTED: return "segmentationNotSupported";
  case AbortReason::SECURITY_ERROR: return "securityError";
  case AbortReason::INSUFFICIENT_SECURITY: return "insufficientSecurity";
  case AbortReason::WINDOW_SIZE_OUT_OF_RANGE: return "windowSizeOutOfRange";
  case AbortReason::APPLICATION_EXCEEDED_REPLY_TIME: return "applicationExceededReplyTime";
  case AbortReason::OUT_OF_RESOURCES: return "outOfResources";
  case AbortReason::TSM_TIMEOUT: return "tsmTimeout";
  case AbortReason::APDU_TOO_LONG: return "apduTooLong";
  }
  return "abortReason(" + std::to_string(static_cast<int>(reason)) + ")";
}

std::string ToString(Segmentation segmentation) {
  switch (segmentation) {
  case Segmentation::SEGMENTED_BOTH: return "segmentedBoth";
  case Segmentation::SEGMENTED_TRANSMIT: return "segmentedTransmit";
  case Segmentation::SEGMENTED_RECEIVE: return "segmentedReceive";
  case Segmentation::NO_SEGMENTATION: return "noSegmentation";
  }
  return "segmentation(" + std::to_string(static_cast<int>(segmentation)) + ")";
}

} // namespace apdu
} // namespace bacstack
