// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "apdu/services_supported.hpp"
#include <set>

using namespace bacstack::apdu;

TEST_CASE("ServicesSupported - Standard bit positions", "[apdu][services_supported]") {
  REQUIRE(ServicesSupportedBit(ConfirmedServiceChoice::ACKNOWLEDGE_ALARM) == 0);
  REQUIRE(ServicesSupportedBit(ConfirmedServiceChoice::READ_PROPERTY) == 12);
  REQUIRE(ServicesSupportedBit(ConfirmedServiceChoice::WRITE_PROPERTY) == 15);
  REQUIRE(ServicesSupportedBit(ConfirmedServiceChoice::READ_RANGE) == 35);
  REQUIRE(ServicesSupportedBit(ConfirmedServiceChoice::GET_EVENT_INFORMATION) == 39);

  REQUIRE(ServicesSupportedBit(UnconfirmedServiceChoice::I_AM) == 26);
  REQUIRE(ServicesSupportedBit(UnconfirmedServiceChoice::WHO_IS) == 34);
  REQUIRE(ServicesSupportedBit(UnconfirmedServiceChoice::UTC_TIME_SYNCHRONIZATION) == 36);
  REQUIRE(ServicesSupportedBit(UnconfirmedServiceChoice::WRITE_GROUP) == 40);
}

TEST_CASE("ServicesSupported - Every service has its own bit", "[apdu][services_supported]") {
  std::set<size_t> bits;
  for (auto choice : CONFIRMED_SERVICES) {
    size_t bit = ServicesSupportedBit(choice);
    REQUIRE(bit < ServicesSupported::BIT_LENGTH);
    bits.insert(bit);
  }
  for (auto choice : UNCONFIRMED_SERVICES) {
    size_t bit = ServicesSupportedBit(choice);
    REQUIRE(bit < ServicesSupported::BIT_LENGTH);
    bits.insert(bit);
  }
  REQUIRE(bits.size() == CONFIRMED_SERVICES.size() + UNCONFIRMED_SERVICES.size());
}

TEST_CASE("ServicesSupported - Set and test", "[apdu][services_supported]") {
  ServicesSupported supported;
  REQUIRE(supported.none());

  supported.set(ConfirmedServiceChoice::READ_PROPERTY);
  supported.set(UnconfirmedServiceChoice::WHO_IS);

  REQUIRE(supported.test(ConfirmedServiceChoice::READ_PROPERTY));
  REQUIRE(supported.test(UnconfirmedServiceChoice::WHO_IS));
  REQUIRE_FALSE(supported.test(ConfirmedServiceChoice::WRITE_PROPERTY));
  REQUIRE(supported.count() == 2);

  std::string bits = supported.ToString();
  REQUIRE(bits.size() == ServicesSupported::BIT_LENGTH);
  REQUIRE(bits[12] == '1');
  REQUIRE(bits[34] == '1');
  REQUIRE(bits[15] == '0');

  supported.set(ConfirmedServiceChoice::READ_PROPERTY, false);
  REQUIRE_FALSE(supported.test(ConfirmedServiceChoice::READ_PROPERTY));
  REQUIRE(supported.count() == 1);
}
