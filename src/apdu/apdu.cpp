// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "apdu/apdu.hpp"

namespace bacstack {
namespace apdu {

namespace {

// Copy the addressing of a response from the request it answers
template <typename Response>
std::shared_ptr<Response> AddressedTo(std::shared_ptr<Response> response,
                                      const ConfirmedRequest &request) {
  response->set_source(request.destination());
  response->set_destination(request.source());
  response->set_invoke_id(request.invoke_id());
  return response;
}

} // namespace

std::string ToString(ApduType type) {
  switch (type) {
  case ApduType::CONFIRMED_REQUEST: return "ConfirmedRequest";
  case ApduType::UNCONFIRMED_REQUEST: return "UnconfirmedRequest";
  case ApduType::SIMPLE_ACK: return "SimpleAck";
  case ApduType::COMPLEX_ACK: return "ComplexAck";
  case ApduType::SEGMENT_ACK: return "SegmentAck";
  case ApduType::ERROR_PDU: return "Error";
  case ApduType::REJECT: return "Reject";
  case ApduType::ABORT: return "Abort";
  }
  return "APDU(" + std::to_string(static_cast<int>(type)) + ")";
}

std::string APDU::ToString() const {
  return apdu::ToString(type_) + " " + source_.ToString() + " -> " + destination_.ToString() +
         " invoke=" + std::to_string(invoke_id_);
}

std::shared_ptr<APDU> ConfirmedRequest::Clone() const {
  return std::make_shared<ConfirmedRequest>(*this);
}

std::string ConfirmedRequest::ToString() const {
  return APDU::ToString() + " " + apdu::ToString(service_choice_);
}

std::shared_ptr<APDU> UnconfirmedRequest::Clone() const {
  return std::make_shared<UnconfirmedRequest>(*this);
}

std::string UnconfirmedRequest::ToString() const {
  return APDU::ToString() + " " + apdu::ToString(service_choice_);
}

std::shared_ptr<SimpleAck> SimpleAck::ForRequest(const ConfirmedRequest &request) {
  return AddressedTo(std::make_shared<SimpleAck>(request.service_choice()), request);
}

std::shared_ptr<APDU> SimpleAck::Clone() const {
  return std::make_shared<SimpleAck>(*this);
}

std::string SimpleAck::ToString() const {
  return APDU::ToString() + " " + apdu::ToString(service_choice_);
}

std::shared_ptr<ComplexAck> ComplexAck::ForRequest(const ConfirmedRequest &request) {
  return AddressedTo(std::make_shared<ComplexAck>(request.service_choice()), request);
}

std::shared_ptr<APDU> ComplexAck::Clone() const {
  return std::make_shared<ComplexAck>(*this);
}

std::string ComplexAck::ToString() const {
  return APDU::ToString() + " " + apdu::ToString(service_choice_);
}

std::shared_ptr<APDU> SegmentAck::Clone() const {
  return std::make_shared<SegmentAck>(*this);
}

std::shared_ptr<Error> Error::ForRequest(const ConfirmedRequest &request,
                                         ErrorClass error_class, ErrorCode error_code) {
  return AddressedTo(std::make_shared<Error>(request.service_choice(), error_class, error_code),
                     request);
}

std::shared_ptr<APDU> Error::Clone() const {
  return std::make_shared<Error>(*this);
}

std::string Error::ToString() const {
  return APDU::ToString() + " " + apdu::ToString(service_choice_) + " " +
         apdu::ToString(error_class_) + "/" + apdu::ToString(error_code_);
}

std::shared_ptr<Reject> Reject::ForRequest(const ConfirmedRequest &request, RejectReason reason) {
  return AddressedTo(std::make_shared<Reject>(reason), request);
}

std::shared_ptr<APDU> Reject::Clone() const {
  return std::make_shared<Reject>(*this);
}

std::string Reject::ToString() const {
  return APDU::ToString() + " " + apdu::ToString(reason_);
}

std::shared_ptr<Abort> Abort::ForRequest(const ConfirmedRequest &request, AbortReason reason,
                                         bool server) {
  return AddressedTo(std::make_shared<Abort>(reason, server), request);
}

std::shared_ptr<APDU> Abort::Clone() const {
  return std::make_shared<Abort>(*this);
}

std::string Abort::ToString() const {
  return APDU::ToString() + " " + apdu::ToString(reason_) + (server_ ? " (server)" : " (client)");
}

std::shared_ptr<APDU> WhoIsRequest::Clone() const {
  return std::make_shared<WhoIsRequest>(*this);
}

std::string WhoIsRequest::ToString() const {
  std::string text = UnconfirmedRequest::ToString();
  if (low_limit_ || high_limit_) {
    text += " [" + (low_limit_ ? std::to_string(*low_limit_) : std::string("-")) + ", " +
            (high_limit_ ? std::to_string(*high_limit_) : std::string("-")) + "]";
  }
  return text;
}

std::shared_ptr<APDU> IAmRequest::Clone() const {
  return std::make_shared<IAmRequest>(*this);
}

std::string IAmRequest::ToString() const {
  return UnconfirmedRequest::ToString() + " " + device_identifier_.ToString() +
         " maxApdu=" + std::to_string(max_apdu_length_accepted_) + " " +
         apdu::ToString(segmentation_supported_) + " vendor=" + std::to_string(vendor_id_);
}

} // namespace apdu
} // namespace bacstack
