// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "app/device_info_cache.hpp"
#include "app/errors.hpp"

using namespace bacstack;
using namespace bacstack::app;

namespace {

pdu::ObjectIdentifier Device(uint32_t instance) {
  return pdu::ObjectIdentifier(pdu::ObjectType::DEVICE, instance);
}

apdu::IAmRequest MakeIAm(uint32_t instance, const pdu::Address &source,
                         uint32_t max_apdu = 1476, uint16_t vendor_id = 15) {
  apdu::IAmRequest i_am(Device(instance), max_apdu, apdu::Segmentation::SEGMENTED_BOTH,
                        vendor_id);
  i_am.set_source(source);
  return i_am;
}

} // namespace

TEST_CASE("DeviceInfoCache - Lookup by address creates on miss", "[app][device_info_cache]") {
  DeviceInfoCache cache;
  auto addr = pdu::Address::LocalStation({1});

  REQUIRE_FALSE(cache.has(addr));

  auto first = cache.get(addr);
  REQUIRE(first);
  REQUIRE(first->address == addr);
  REQUIRE_FALSE(first->device_identifier.has_value());
  REQUIRE(first->indexed_address() == addr);
  REQUIRE_FALSE(first->indexed_identifier().has_value());
  REQUIRE(cache.has(addr));

  SECTION("Second lookup returns the same record") {
    auto second = cache.get(addr);
    REQUIRE(second == first);
    REQUIRE(cache.size() == 1);
  }

  SECTION("Defaults") {
    REQUIRE(first->max_apdu_length_accepted == 1024);
    REQUIRE(first->segmentation_supported == apdu::Segmentation::NO_SEGMENTATION);
    REQUIRE(first->max_npdu_length == 1497);
    REQUIRE_FALSE(first->vendor_id.has_value());
    REQUIRE_FALSE(first->max_segments_accepted.has_value());
  }
}

TEST_CASE("DeviceInfoCache - Lookup by identifier never creates", "[app][device_info_cache]") {
  DeviceInfoCache cache;
  REQUIRE(cache.get(Device(10)) == nullptr);
  REQUIRE_FALSE(cache.has(Device(10)));
  REQUIRE(cache.size() == 0);
}

TEST_CASE("DeviceInfoCache - Invalid keys", "[app][device_info_cache]") {
  DeviceInfoCache cache;

  REQUIRE_THROWS_AS(cache.get(pdu::Address::LocalBroadcast()), InvalidKey);
  REQUIRE_THROWS_AS(cache.get(pdu::Address::GlobalBroadcast()), InvalidKey);
  REQUIRE_THROWS_AS(cache.get(pdu::Address::RemoteBroadcast(5)), InvalidKey);
  REQUIRE_THROWS_AS(cache.get(pdu::Address()), InvalidKey);
  REQUIRE_THROWS_AS(cache.get(pdu::ObjectIdentifier(pdu::ObjectType::ANALOG_INPUT, 1)),
                    InvalidKey);

  // Remote stations are valid keys
  REQUIRE(cache.get(pdu::Address::RemoteStation(5, {1})));
  REQUIRE(cache.size() == 1);
}

TEST_CASE("DeviceInfoCache - Ingest I-Am", "[app][device_info_cache]") {
  DeviceInfoCache cache;
  auto a1 = pdu::Address::LocalStation({1});
  auto a2 = pdu::Address::LocalStation({2});

  SECTION("Unknown device is indexed by both keys") {
    cache.ingest(MakeIAm(100, a1));

    auto by_id = cache.get(Device(100));
    REQUIRE(by_id);
    REQUIRE(by_id->address == a1);
    REQUIRE(by_id->max_apdu_length_accepted == 1476);
    REQUIRE(by_id->segmentation_supported == apdu::Segmentation::SEGMENTED_BOTH);
    REQUIRE(by_id->vendor_id == 15);
    REQUIRE(cache.get(a1) == by_id);
    REQUIRE(cache.size() == 1);
  }

  SECTION("Record created by address picks up the identifier") {
    auto heard = cache.get(a1);
    cache.ingest(MakeIAm(100, a1));

    REQUIRE(cache.get(Device(100)) == heard);
    REQUIRE(heard->device_identifier == Device(100));
    REQUIRE(heard->indexed_identifier() == Device(100));
    REQUIRE(cache.size() == 1);
  }

  SECTION("Device moves to a new address") {
    cache.ingest(MakeIAm(100, a1));
    auto record = cache.get(Device(100));

    cache.ingest(MakeIAm(100, a2, 480, 7));

    auto moved = cache.get(Device(100));
    REQUIRE(moved == record);
    REQUIRE(moved->address == a2);
    REQUIRE(moved->max_apdu_length_accepted == 480);
    REQUIRE(moved->vendor_id == 7);
    REQUIRE(cache.has(a2));
    REQUIRE_FALSE(cache.has(a1));
    REQUIRE(cache.get(a2) == record);

    // The old address now yields a fresh blank record
    auto fresh = cache.get(a1);
    REQUIRE(fresh != record);
    REQUIRE_FALSE(fresh->device_identifier.has_value());
  }

  SECTION("Repeated I-Am from the same address is a no-op") {
    cache.ingest(MakeIAm(100, a1, 1476, 15));
    auto record = cache.get(Device(100));
    record->max_apdu_length_accepted = 50;

    cache.ingest(MakeIAm(100, a1, 1476, 15));
    REQUIRE(record->max_apdu_length_accepted == 50);
  }
}

TEST_CASE("DeviceInfoCache - Reindex after manual edits", "[app][device_info_cache]") {
  DeviceInfoCache cache;
  auto a1 = pdu::Address::LocalStation({1});
  auto a2 = pdu::Address::RemoteStation(3, {9});

  auto record = cache.get(a1);

  SECTION("Field assignment alone does not rekey") {
    record->device_identifier = Device(5);
    REQUIRE_FALSE(cache.has(Device(5)));

    cache.reindex(record);
    REQUIRE(cache.get(Device(5)) == record);
  }

  SECTION("Address change moves the address key") {
    record->address = a2;
    cache.reindex(record);
    REQUIRE(cache.has(a2));
    REQUIRE_FALSE(cache.has(a1));
    REQUIRE(record->indexed_address() == a2);
  }

  SECTION("Clearing a field removes its key") {
    record->device_identifier = Device(5);
    cache.reindex(record);
    record->device_identifier.reset();
    cache.reindex(record);
    REQUIRE_FALSE(cache.has(Device(5)));
    REQUIRE(cache.has(a1));
  }

  SECTION("Invalid field values leave the indexes untouched") {
    record->device_identifier = pdu::ObjectIdentifier(pdu::ObjectType::ANALOG_VALUE, 1);
    REQUIRE_THROWS_AS(cache.reindex(record), InvalidKey);
    REQUIRE(cache.has(a1));
    REQUIRE_FALSE(record->indexed_identifier().has_value());
  }

  SECTION("Taking over another record's key") {
    auto other = cache.get(a2);
    record->address = a2;
    cache.reindex(record);

    REQUIRE(cache.get(a2) == record);
    REQUIRE_FALSE(other->indexed_address().has_value());

    // Releasing the loser must not remove the winner's entry
    cache.release(other);
    REQUIRE(cache.get(a2) == record);
  }
}

TEST_CASE("DeviceInfoCache - Release", "[app][device_info_cache]") {
  DeviceInfoCache cache;
  auto a1 = pdu::Address::LocalStation({1});
  cache.ingest(MakeIAm(100, a1));
  auto record = cache.get(Device(100));

  cache.release(record);

  REQUIRE_FALSE(cache.has(Device(100)));
  REQUIRE_FALSE(cache.has(a1));
  REQUIRE(cache.get(Device(100)) == nullptr);
  REQUIRE(cache.size() == 0);

  // The caller still owns a usable record
  REQUIRE(record->device_identifier == Device(100));
  REQUIRE(record->address == a1);
  REQUIRE_FALSE(record->indexed_identifier().has_value());
  REQUIRE_FALSE(record->indexed_address().has_value());

  // A lookup by the old address creates a new record
  REQUIRE(cache.get(a1) != record);
}

TEST_CASE("DeviceInfoCache - Snapshot", "[app][device_info_cache]") {
  DeviceInfoCache cache;
  cache.ingest(MakeIAm(100, pdu::Address::LocalStation({1})));
  cache.ingest(MakeIAm(200, pdu::Address::LocalStation({2})));

  auto snapshot = cache.Snapshot();
  REQUIRE(snapshot.is_array());
  REQUIRE(snapshot.size() == 2);
  REQUIRE(snapshot[0]["device_identifier"] == "device:100");
  REQUIRE(snapshot[0]["address"] == "1");
  REQUIRE(snapshot[1]["vendor_id"] == 15);
}
