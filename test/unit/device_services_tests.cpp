// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "app/application.hpp"
#include "app/errors.hpp"
#include "infra/mock_lower_layer.hpp"
#include "service/device_services.hpp"

using namespace bacstack;
using namespace bacstack::app;
using bacstack::test::MockLowerLayer;
using bacstack::test::Station;

namespace {

struct DeviceFixture {
  std::shared_ptr<LocalDevice> device =
      std::make_shared<LocalDevice>(500, "plant-room", 42, 1476, apdu::Segmentation::SEGMENTED_BOTH);
  Application app{device};
  MockLowerLayer lower;
  service::DeviceServices services{app};

  DeviceFixture() {
    comm::Bind(app, lower);
    app.RegisterServices(services);
  }

  static std::shared_ptr<apdu::WhoIsRequest> WhoIs(std::optional<uint32_t> low,
                                                   std::optional<uint32_t> high) {
    auto who_is = std::make_shared<apdu::WhoIsRequest>(low, high);
    who_is->set_source(Station(9));
    who_is->set_destination(pdu::Address::GlobalBroadcast());
    return who_is;
  }
};

} // namespace

TEST_CASE("DeviceServices - Registration", "[service][device]") {
  DeviceFixture f;
  REQUIRE(f.app.services().HasHandler(apdu::UnconfirmedServiceChoice::WHO_IS));
  REQUIRE(f.app.services().HasHandler(apdu::UnconfirmedServiceChoice::I_AM));

  auto supported = f.app.get_services_supported();
  REQUIRE(supported.test(apdu::UnconfirmedServiceChoice::WHO_IS));
  REQUIRE(supported.test(apdu::UnconfirmedServiceChoice::I_AM));
}

TEST_CASE("DeviceServices - Answering Who-Is", "[service][device]") {
  DeviceFixture f;

  SECTION("Unlimited Who-Is is answered to the requester") {
    f.app.indication(DeviceFixture::WhoIs(std::nullopt, std::nullopt));

    REQUIRE(f.lower.requests.size() == 1);
    auto i_am = MockLowerLayer::as<apdu::IAmRequest>(f.lower.requests[0]);
    REQUIRE(i_am);
    REQUIRE(i_am->destination() == Station(9));
    REQUIRE(i_am->device_identifier() == f.device->identifier());
    REQUIRE(i_am->max_apdu_length_accepted() == 1476);
    REQUIRE(i_am->segmentation_supported() == apdu::Segmentation::SEGMENTED_BOTH);
    REQUIRE(i_am->vendor_id() == 42);
  }

  SECTION("Range covering the device") {
    f.app.indication(DeviceFixture::WhoIs(500u, 500u));
    REQUIRE(f.lower.requests.size() == 1);
  }

  SECTION("Range missing the device") {
    f.app.indication(DeviceFixture::WhoIs(0u, 499u));
    f.app.indication(DeviceFixture::WhoIs(501u, 1000u));
    REQUIRE(f.lower.requests.empty());
  }

  SECTION("Only one limit is a reject") {
    REQUIRE_THROWS_AS(f.app.indication(DeviceFixture::WhoIs(1u, std::nullopt)),
                      RejectException);
    REQUIRE(f.lower.requests.empty());
  }
}

TEST_CASE("DeviceServices - Who-Is without a local device", "[service][device]") {
  Application app;
  MockLowerLayer lower;
  comm::Bind(app, lower);
  service::DeviceServices services(app);
  app.RegisterServices(services);

  app.indication(DeviceFixture::WhoIs(std::nullopt, std::nullopt));
  REQUIRE(lower.requests.empty());

  REQUIRE_THROWS_AS(services.i_am(), UsageError);
}

TEST_CASE("DeviceServices - Learning from I-Am", "[service][device]") {
  DeviceFixture f;
  auto peer = pdu::ObjectIdentifier(pdu::ObjectType::DEVICE, 77);

  auto i_am = std::make_shared<apdu::IAmRequest>(peer, 480, apdu::Segmentation::NO_SEGMENTATION, 5);
  i_am->set_source(Station(3));
  f.app.indication(i_am);

  auto info = f.app.device_info_cache().get(peer);
  REQUIRE(info);
  REQUIRE(info->address == Station(3));
  REQUIRE(info->max_apdu_length_accepted == 480);
  REQUIRE(info->vendor_id == 5);

  SECTION("Non-device identifiers are ignored") {
    auto odd = std::make_shared<apdu::IAmRequest>(
        pdu::ObjectIdentifier(pdu::ObjectType::ANALOG_INPUT, 1), 480,
        apdu::Segmentation::NO_SEGMENTATION, 5);
    odd->set_source(Station(4));
    f.app.indication(odd);
    REQUIRE_FALSE(f.app.device_info_cache().has(Station(4)));
    REQUIRE(f.app.device_info_cache().size() == 1);
  }
}

TEST_CASE("DeviceServices - Sending Who-Is and I-Am", "[service][device]") {
  DeviceFixture f;

  f.services.who_is(10, 20, Station(4));
  REQUIRE(f.lower.requests.size() == 1);
  auto who_is = MockLowerLayer::as<apdu::WhoIsRequest>(f.lower.requests[0]);
  REQUIRE(who_is);
  REQUIRE(who_is->low_limit() == 10u);
  REQUIRE(who_is->high_limit() == 20u);
  REQUIRE(who_is->destination() == Station(4));

  f.services.i_am();
  auto i_am = MockLowerLayer::as<apdu::IAmRequest>(f.lower.requests[1]);
  REQUIRE(i_am);
  REQUIRE(i_am->destination() == pdu::Address::GlobalBroadcast());

  REQUIRE_THROWS_AS(f.services.who_is(10, std::nullopt), UsageError);

  // Nothing confirmed was sent
  REQUIRE(f.app.controller_count() == 0);
}
