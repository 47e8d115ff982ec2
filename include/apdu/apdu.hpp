// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 APDU - decoded application-layer messages

 These are the message shapes exchanged between the application core and
 the lower layers. Encoding and decoding happen below the application; by
 the time an APDU reaches this code it is a typed object.

 Ownership: APDUs travel as std::shared_ptr<const APDU>. A layer that needs
 to stamp addressing on a message it did not create uses Clone().
*/

#include "apdu/enums.hpp"
#include "pdu/address.hpp"
#include "pdu/object_identifier.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace bacstack {
namespace apdu {

// PDU type nibble from the first octet of an APDU
enum class ApduType : uint8_t {
  CONFIRMED_REQUEST = 0,
  UNCONFIRMED_REQUEST = 1,
  SIMPLE_ACK = 2,
  COMPLEX_ACK = 3,
  SEGMENT_ACK = 4,
  ERROR_PDU = 5,
  REJECT = 6,
  ABORT = 7,
};

std::string ToString(ApduType type);

class APDU;
using APDUPtr = std::shared_ptr<const APDU>;

/**
 * Base class for all APDUs
 */
class APDU {
public:
  virtual ~APDU() = default;

  ApduType apdu_type() const { return type_; }

  const pdu::Address &source() const { return source_; }
  void set_source(const pdu::Address &source) { source_ = source; }

  const pdu::Address &destination() const { return destination_; }
  void set_destination(const pdu::Address &destination) { destination_ = destination; }

  // Correlates a confirmed request with its response (assigned below the
  // application, carried through unchanged here)
  uint8_t invoke_id() const { return invoke_id_; }
  void set_invoke_id(uint8_t invoke_id) { invoke_id_ = invoke_id; }

  bool is_confirmed_request() const { return type_ == ApduType::CONFIRMED_REQUEST; }
  bool is_unconfirmed_request() const { return type_ == ApduType::UNCONFIRMED_REQUEST; }
  bool is_request() const { return is_confirmed_request() || is_unconfirmed_request(); }

  virtual std::shared_ptr<APDU> Clone() const = 0;
  virtual std::string ToString() const;

protected:
  explicit APDU(ApduType type) : type_(type) {}
  APDU(const APDU &) = default;
  APDU &operator=(const APDU &) = default;

private:
  ApduType type_;
  pdu::Address source_;
  pdu::Address destination_;
  uint8_t invoke_id_ = 0;
};

class ConfirmedRequest : public APDU {
public:
  explicit ConfirmedRequest(ConfirmedServiceChoice choice)
      : APDU(ApduType::CONFIRMED_REQUEST), service_choice_(choice) {}

  ConfirmedServiceChoice service_choice() const { return service_choice_; }

  std::shared_ptr<APDU> Clone() const override;
  std::string ToString() const override;

private:
  ConfirmedServiceChoice service_choice_;
};

class UnconfirmedRequest : public APDU {
public:
  explicit UnconfirmedRequest(UnconfirmedServiceChoice choice)
      : APDU(ApduType::UNCONFIRMED_REQUEST), service_choice_(choice) {}

  UnconfirmedServiceChoice service_choice() const { return service_choice_; }

  std::shared_ptr<APDU> Clone() const override;
  std::string ToString() const override;

private:
  UnconfirmedServiceChoice service_choice_;
};

class SimpleAck : public APDU {
public:
  explicit SimpleAck(ConfirmedServiceChoice choice)
      : APDU(ApduType::SIMPLE_ACK), service_choice_(choice) {}

  static std::shared_ptr<SimpleAck> ForRequest(const ConfirmedRequest &request);

  ConfirmedServiceChoice service_choice() const { return service_choice_; }

  std::shared_ptr<APDU> Clone() const override;
  std::string ToString() const override;

private:
  ConfirmedServiceChoice service_choice_;
};

class ComplexAck : public APDU {
public:
  explicit ComplexAck(ConfirmedServiceChoice choice)
      : APDU(ApduType::COMPLEX_ACK), service_choice_(choice) {}

  static std::shared_ptr<ComplexAck> ForRequest(const ConfirmedRequest &request);

  ConfirmedServiceChoice service_choice() const { return service_choice_; }

  std::shared_ptr<APDU> Clone() const override;
  std::string ToString() const override;

private:
  ConfirmedServiceChoice service_choice_;
};

// Segment acknowledgements belong to the segmentation state machine and
// must never be handed to the application.
class SegmentAck : public APDU {
public:
  SegmentAck(uint8_t sequence_number, uint8_t actual_window_size)
      : APDU(ApduType::SEGMENT_ACK), sequence_number_(sequence_number),
        actual_window_size_(actual_window_size) {}

  uint8_t sequence_number() const { return sequence_number_; }
  uint8_t actual_window_size() const { return actual_window_size_; }

  std::shared_ptr<APDU> Clone() const override;

private:
  uint8_t sequence_number_;
  uint8_t actual_window_size_;
};

class Error : public APDU {
public:
  Error(ConfirmedServiceChoice choice, ErrorClass error_class, ErrorCode error_code)
      : APDU(ApduType::ERROR_PDU), service_choice_(choice), error_class_(error_class),
        error_code_(error_code) {}

  // Error response addressed back to the requester of `request`
  static std::shared_ptr<Error> ForRequest(const ConfirmedRequest &request,
                                           ErrorClass error_class, ErrorCode error_code);

  ConfirmedServiceChoice service_choice() const { return service_choice_; }
  ErrorClass error_class() const { return error_class_; }
  ErrorCode error_code() const { return error_code_; }

  std::shared_ptr<APDU> Clone() const override;
  std::string ToString() const override;

private:
  ConfirmedServiceChoice service_choice_;
  ErrorClass error_class_;
  ErrorCode error_code_;
};

class Reject : public APDU {
public:
  explicit Reject(RejectReason reason) : APDU(ApduType::REJECT), reason_(reason) {}

  static std::shared_ptr<Reject> ForRequest(const ConfirmedRequest &request, RejectReason reason);

  RejectReason reason() const { return reason_; }

  std::shared_ptr<APDU> Clone() const override;
  std::string ToString() const override;

private:
  RejectReason reason_;
};

class Abort : public APDU {
public:
  Abort(AbortReason reason, bool server) : APDU(ApduType::ABORT), reason_(reason), server_(server) {}

  static std::shared_ptr<Abort> ForRequest(const ConfirmedRequest &request, AbortReason reason,
                                           bool server);

  AbortReason reason() const { return reason_; }
  // True when sent by the server side of the transaction
  bool server() const { return server_; }

  std::shared_ptr<APDU> Clone() const override;
  std::string ToString() const override;

private:
  AbortReason reason_;
  bool server_;
};

/**
 * Who-Is: asks devices whose instance is within [low, high] (or every
 * device, when no limits are given) to announce themselves.
 */
class WhoIsRequest : public UnconfirmedRequest {
public:
  WhoIsRequest() : UnconfirmedRequest(UnconfirmedServiceChoice::WHO_IS) {}
  WhoIsRequest(std::optional<uint32_t> low_limit, std::optional<uint32_t> high_limit)
      : UnconfirmedRequest(UnconfirmedServiceChoice::WHO_IS), low_limit_(low_limit),
        high_limit_(high_limit) {}

  std::optional<uint32_t> low_limit() const { return low_limit_; }
  std::optional<uint32_t> high_limit() const { return high_limit_; }

  std::shared_ptr<APDU> Clone() const override;
  std::string ToString() const override;

private:
  std::optional<uint32_t> low_limit_;
  std::optional<uint32_t> high_limit_;
};

/**
 * I-Am: peer announcement carrying the capabilities recorded in the
 * device info cache.
 */
class IAmRequest : public UnconfirmedRequest {
public:
  IAmRequest(const pdu::ObjectIdentifier &device_identifier, uint32_t max_apdu_length_accepted,
             Segmentation segmentation_supported, uint16_t vendor_id)
      : UnconfirmedRequest(UnconfirmedServiceChoice::I_AM),
        device_identifier_(device_identifier),
        max_apdu_length_accepted_(max_apdu_length_accepted),
        segmentation_supported_(segmentation_supported), vendor_id_(vendor_id) {}

  const pdu::ObjectIdentifier &device_identifier() const { return device_identifier_; }
  uint32_t max_apdu_length_accepted() const { return max_apdu_length_accepted_; }
  Segmentation segmentation_supported() const { return segmentation_supported_; }
  uint16_t vendor_id() const { return vendor_id_; }

  std::shared_ptr<APDU> Clone() const override;
  std::string ToString() const override;

private:
  pdu::ObjectIdentifier device_identifier_;
  uint32_t max_apdu_length_accepted_;
  Segmentation segmentation_supported_;
  uint16_t vendor_id_;
};

} // namespace apdu
} // namespace bacstack
