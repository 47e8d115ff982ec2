// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "app/application.hpp"
#include "app/errors.hpp"
#include "infra/mock_lower_layer.hpp"
#include <stdexcept>

using namespace bacstack;
using namespace bacstack::app;
using apdu::ConfirmedServiceChoice;
using apdu::UnconfirmedServiceChoice;
using bacstack::test::MakeConfirmed;
using bacstack::test::MockLowerLayer;
using bacstack::test::Station;

namespace {

struct IndicationFixture {
  Application app;
  MockLowerLayer lower;
  std::shared_ptr<apdu::ConfirmedRequest> read_property;
  std::shared_ptr<apdu::UnconfirmedRequest> time_sync;

  IndicationFixture() {
    comm::Bind(app, lower);
    read_property = MakeConfirmed(ConfirmedServiceChoice::READ_PROPERTY, Station(7), Station(1), 33);
    time_sync = std::make_shared<apdu::UnconfirmedRequest>(
        UnconfirmedServiceChoice::TIME_SYNCHRONIZATION);
    time_sync->set_source(Station(7));
  }

  void OnReadProperty(ServiceRegistry::ConfirmedHandler handler) {
    app.services().RegisterConfirmed(ConfirmedServiceChoice::READ_PROPERTY, std::move(handler));
  }

  void OnTimeSync(ServiceRegistry::UnconfirmedHandler handler) {
    app.services().RegisterUnconfirmed(UnconfirmedServiceChoice::TIME_SYNCHRONIZATION,
                                       std::move(handler));
  }

  std::shared_ptr<const apdu::Error> OnlyError() const {
    REQUIRE(lower.responses.size() == 1);
    auto error = MockLowerLayer::as<apdu::Error>(lower.responses[0]);
    REQUIRE(error);
    return error;
  }
};

} // namespace

TEST_CASE("Application indication - No handler registered", "[app][indication]") {
  IndicationFixture f;

  SECTION("Confirmed request raises UnrecognizedService") {
    REQUIRE_THROWS_AS(f.app.indication(f.read_property), UnrecognizedService);
    REQUIRE(f.lower.responses.empty());
  }

  SECTION("Unconfirmed request is ignored") {
    REQUIRE_NOTHROW(f.app.indication(f.time_sync));
    REQUIRE(f.lower.responses.empty());
    REQUIRE(f.lower.requests.empty());
  }
}

TEST_CASE("Application indication - Handler dispatch", "[app][indication]") {
  IndicationFixture f;
  std::shared_ptr<const apdu::ConfirmedRequest> seen;

  f.OnReadProperty([&](const ConfirmedRequestPtr &request) {
    seen = request;
    f.app.response(apdu::ComplexAck::ForRequest(*request));
  });

  f.app.indication(f.read_property);

  REQUIRE(seen == f.read_property);
  REQUIRE(f.lower.responses.size() == 1);
  auto ack = MockLowerLayer::as<apdu::ComplexAck>(f.lower.responses[0]);
  REQUIRE(ack);
  REQUIRE(ack->destination() == Station(7));
  REQUIRE(ack->invoke_id() == 33);
}

TEST_CASE("Application indication - Execution errors", "[app][indication]") {
  IndicationFixture f;

  SECTION("Confirmed: one Error response referencing the request") {
    f.OnReadProperty([](const ConfirmedRequestPtr &) {
      throw ExecutionError(apdu::ErrorClass::OBJECT, apdu::ErrorCode::UNKNOWN_OBJECT);
    });

    REQUIRE_NOTHROW(f.app.indication(f.read_property));

    auto error = f.OnlyError();
    REQUIRE(error->error_class() == apdu::ErrorClass::OBJECT);
    REQUIRE(error->error_code() == apdu::ErrorCode::UNKNOWN_OBJECT);
    REQUIRE(error->service_choice() == ConfirmedServiceChoice::READ_PROPERTY);
    REQUIRE(error->destination() == Station(7));
    REQUIRE(error->invoke_id() == 33);
  }

  SECTION("Unconfirmed: dropped") {
    f.OnTimeSync([](const UnconfirmedRequestPtr &) {
      throw ExecutionError(apdu::ErrorClass::SERVICES, apdu::ErrorCode::SERVICE_REQUEST_DENIED);
    });

    REQUIRE_NOTHROW(f.app.indication(f.time_sync));
    REQUIRE(f.lower.responses.empty());
  }
}

TEST_CASE("Application indication - Unclassified failures", "[app][indication]") {
  IndicationFixture f;

  SECTION("Confirmed: generic device/operationalProblem error") {
    f.OnReadProperty([](const ConfirmedRequestPtr &) { throw std::runtime_error("bug"); });

    REQUIRE_NOTHROW(f.app.indication(f.read_property));

    auto error = f.OnlyError();
    REQUIRE(error->error_class() == apdu::ErrorClass::DEVICE);
    REQUIRE(error->error_code() == apdu::ErrorCode::OPERATIONAL_PROBLEM);
    REQUIRE(error->invoke_id() == 33);
  }

  SECTION("Confirmed: non-standard exception type") {
    f.OnReadProperty([](const ConfirmedRequestPtr &) { throw 42; });

    REQUIRE_NOTHROW(f.app.indication(f.read_property));
    REQUIRE(f.OnlyError()->error_code() == apdu::ErrorCode::OPERATIONAL_PROBLEM);
  }

  SECTION("Unconfirmed: dropped") {
    f.OnTimeSync([](const UnconfirmedRequestPtr &) { throw std::logic_error("bug"); });

    REQUIRE_NOTHROW(f.app.indication(f.time_sync));
    REQUIRE(f.lower.responses.empty());
  }
}

TEST_CASE("Application indication - Reject and abort propagate", "[app][indication]") {
  IndicationFixture f;

  SECTION("Reject") {
    f.OnReadProperty([](const ConfirmedRequestPtr &) {
      throw RejectException(apdu::RejectReason::INVALID_TAG);
    });

    try {
      f.app.indication(f.read_property);
      FAIL("expected RejectException");
    } catch (const RejectException &e) {
      REQUIRE(e.reason() == apdu::RejectReason::INVALID_TAG);
    }
    REQUIRE(f.lower.responses.empty());
  }

  SECTION("Abort") {
    f.OnReadProperty([](const ConfirmedRequestPtr &) {
      throw AbortException(apdu::AbortReason::SEGMENTATION_NOT_SUPPORTED);
    });

    REQUIRE_THROWS_AS(f.app.indication(f.read_property), AbortException);
    REQUIRE(f.lower.responses.empty());
  }

  SECTION("Unconfirmed reject also propagates") {
    f.OnTimeSync([](const UnconfirmedRequestPtr &) {
      throw RejectException(apdu::RejectReason::MISSING_REQUIRED_PARAMETER);
    });

    REQUIRE_THROWS_AS(f.app.indication(f.time_sync), RejectException);
  }
}

TEST_CASE("Application indication - Non-request APDUs", "[app][indication]") {
  IndicationFixture f;
  auto ack = std::make_shared<apdu::SimpleAck>(ConfirmedServiceChoice::READ_PROPERTY);
  REQUIRE_THROWS_AS(f.app.indication(ack), ProtocolViolation);
}

TEST_CASE("Application - Services supported follows the registry", "[app][services_supported]") {
  Application app;

  REQUIRE(app.get_services_supported().none());

  app.services().RegisterConfirmed(ConfirmedServiceChoice::READ_PROPERTY,
                                   [](const ConfirmedRequestPtr &) {});
  app.services().RegisterUnconfirmed(UnconfirmedServiceChoice::WHO_IS,
                                     [](const UnconfirmedRequestPtr &) {});

  auto supported = app.get_services_supported();
  REQUIRE(supported.test(ConfirmedServiceChoice::READ_PROPERTY));
  REQUIRE(supported.test(UnconfirmedServiceChoice::WHO_IS));
  for (auto choice : apdu::CONFIRMED_SERVICES) {
    if (choice != ConfirmedServiceChoice::READ_PROPERTY) {
      REQUIRE_FALSE(supported.test(choice));
    }
  }
  REQUIRE(supported.count() == 2);

  app.services().UnregisterConfirmed(ConfirmedServiceChoice::READ_PROPERTY);
  REQUIRE_FALSE(app.get_services_supported().test(ConfirmedServiceChoice::READ_PROPERTY));
}
