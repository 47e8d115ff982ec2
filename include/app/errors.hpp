// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Application-layer error taxonomy

 UsageError           caller misuse (bad cache key, bad object, unbound
                      layer). Never recovered.
 UnrecognizedService  confirmed request with no registered handler. The
                      access point answers it with a Reject.
 RejectException      handler found the request malformed; answered with
                      a Reject carrying reason().
 AbortException       severe condition for this transaction; answered with
                      an Abort carrying reason().
 ExecutionError       business-rule failure; the application answers with
                      an Error(error_class(), error_code()).
 ProtocolViolation    a lower layer delivered something the application
                      can never accept (e.g. a SegmentAck confirmation).
*/

#include "apdu/enums.hpp"
#include <stdexcept>
#include <string>

namespace bacstack {
namespace app {

class UsageError : public std::logic_error {
public:
  explicit UsageError(const std::string &what) : std::logic_error(what) {}
};

class InvalidKey : public UsageError {
public:
  explicit InvalidKey(const std::string &what) : UsageError(what) {}
};

class ConfigurationError : public UsageError {
public:
  explicit ConfigurationError(const std::string &what) : UsageError(what) {}
};

class UnrecognizedService : public std::runtime_error {
public:
  explicit UnrecognizedService(const std::string &what) : std::runtime_error(what) {}
};

class RejectException : public std::runtime_error {
public:
  explicit RejectException(apdu::RejectReason reason)
      : std::runtime_error("reject: " + apdu::ToString(reason)), reason_(reason) {}

  apdu::RejectReason reason() const { return reason_; }

private:
  apdu::RejectReason reason_;
};

class AbortException : public std::runtime_error {
public:
  explicit AbortException(apdu::AbortReason reason)
      : std::runtime_error("abort: " + apdu::ToString(reason)), reason_(reason) {}

  apdu::AbortReason reason() const { return reason_; }

private:
  apdu::AbortReason reason_;
};

class ExecutionError : public std::runtime_error {
public:
  ExecutionError(apdu::ErrorClass error_class, apdu::ErrorCode error_code)
      : std::runtime_error("execution error: " + apdu::ToString(error_class) + "/" +
                           apdu::ToString(error_code)),
        error_class_(error_class), error_code_(error_code) {}

  apdu::ErrorClass error_class() const { return error_class_; }
  apdu::ErrorCode error_code() const { return error_code_; }

private:
  apdu::ErrorClass error_class_;
  apdu::ErrorCode error_code_;
};

class ProtocolViolation : public std::runtime_error {
public:
  explicit ProtocolViolation(const std::string &what) : std::runtime_error(what) {}
};

} // namespace app
} // namespace bacstack
