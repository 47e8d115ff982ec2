// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "app/service_registry.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace bacstack;
using namespace bacstack::app;
using apdu::ConfirmedServiceChoice;
using apdu::UnconfirmedServiceChoice;

TEST_CASE("ServiceRegistry - Basic registration and lookup", "[app][service_registry]") {
  ServiceRegistry registry;

  SECTION("Register and find confirmed handler") {
    bool handler_called = false;
    registry.RegisterConfirmed(ConfirmedServiceChoice::READ_PROPERTY,
                               [&](const ConfirmedRequestPtr &) { handler_called = true; });

    REQUIRE(registry.HasHandler(ConfirmedServiceChoice::READ_PROPERTY));

    auto handler = registry.Find(ConfirmedServiceChoice::READ_PROPERTY);
    REQUIRE(handler);
    handler(std::make_shared<apdu::ConfirmedRequest>(ConfirmedServiceChoice::READ_PROPERTY));
    REQUIRE(handler_called);
  }

  SECTION("Confirmed and unconfirmed tables are separate") {
    // I_AM and ACKNOWLEDGE_ALARM are both service choice 0
    registry.RegisterUnconfirmed(UnconfirmedServiceChoice::I_AM,
                                 [](const UnconfirmedRequestPtr &) {});
    REQUIRE(registry.HasHandler(UnconfirmedServiceChoice::I_AM));
    REQUIRE_FALSE(registry.HasHandler(ConfirmedServiceChoice::ACKNOWLEDGE_ALARM));
  }

  SECTION("Find on unregistered service returns empty handler") {
    REQUIRE_FALSE(registry.Find(ConfirmedServiceChoice::WRITE_PROPERTY));
    REQUIRE_FALSE(registry.Find(UnconfirmedServiceChoice::WHO_HAS));
  }
}

TEST_CASE("ServiceRegistry - Multiple handlers", "[app][service_registry]") {
  ServiceRegistry registry;

  registry.RegisterConfirmed(ConfirmedServiceChoice::WRITE_PROPERTY,
                             [](const ConfirmedRequestPtr &) {});
  registry.RegisterConfirmed(ConfirmedServiceChoice::READ_PROPERTY,
                             [](const ConfirmedRequestPtr &) {});
  registry.RegisterUnconfirmed(UnconfirmedServiceChoice::WHO_IS,
                               [](const UnconfirmedRequestPtr &) {});

  SECTION("GetRegisteredServices returns sorted list") {
    auto services = registry.GetRegisteredServices();
    REQUIRE(services.size() == 3);
    REQUIRE(services[0] == "readProperty");
    REQUIRE(services[1] == "whoIs");
    REQUIRE(services[2] == "writeProperty");
  }

  SECTION("Size counts both tables") {
    REQUIRE(registry.size() == 3);
  }
}

TEST_CASE("ServiceRegistry - Empty handlers are rejected", "[app][service_registry]") {
  ServiceRegistry registry;

  registry.RegisterConfirmed(ConfirmedServiceChoice::READ_PROPERTY, nullptr);
  registry.RegisterUnconfirmed(UnconfirmedServiceChoice::WHO_IS, nullptr);

  REQUIRE_FALSE(registry.HasHandler(ConfirmedServiceChoice::READ_PROPERTY));
  REQUIRE_FALSE(registry.HasHandler(UnconfirmedServiceChoice::WHO_IS));
  REQUIRE(registry.size() == 0);
}

TEST_CASE("ServiceRegistry - Unregister", "[app][service_registry]") {
  ServiceRegistry registry;

  int call_count = 0;
  registry.RegisterConfirmed(ConfirmedServiceChoice::READ_PROPERTY,
                             [&](const ConfirmedRequestPtr &) { ++call_count; });

  SECTION("Unregister removes handler") {
    registry.UnregisterConfirmed(ConfirmedServiceChoice::READ_PROPERTY);
    REQUIRE_FALSE(registry.HasHandler(ConfirmedServiceChoice::READ_PROPERTY));
    REQUIRE_FALSE(registry.Find(ConfirmedServiceChoice::READ_PROPERTY));
    REQUIRE(call_count == 0);
  }

  SECTION("Unregister non-existent handler is safe") {
    registry.UnregisterConfirmed(ConfirmedServiceChoice::WRITE_PROPERTY);
    registry.UnregisterUnconfirmed(UnconfirmedServiceChoice::WHO_IS);
    REQUIRE(registry.HasHandler(ConfirmedServiceChoice::READ_PROPERTY));
  }
}

TEST_CASE("ServiceRegistry - Handler replacement", "[app][service_registry]") {
  ServiceRegistry registry;

  int first_count = 0;
  int second_count = 0;

  registry.RegisterConfirmed(ConfirmedServiceChoice::READ_PROPERTY,
                             [&](const ConfirmedRequestPtr &) { ++first_count; });
  registry.RegisterConfirmed(ConfirmedServiceChoice::READ_PROPERTY,
                             [&](const ConfirmedRequestPtr &) { ++second_count; });

  registry.Find(ConfirmedServiceChoice::READ_PROPERTY)(nullptr);

  REQUIRE(first_count == 0);
  REQUIRE(second_count == 1);
  REQUIRE(registry.size() == 1);
}

TEST_CASE("ServiceRegistry - Thread safety", "[app][service_registry]") {
  ServiceRegistry registry;

  SECTION("Concurrent registration") {
    std::vector<std::thread> threads;
    for (auto choice : apdu::CONFIRMED_SERVICES) {
      threads.emplace_back([&registry, choice]() {
        registry.RegisterConfirmed(choice, [](const ConfirmedRequestPtr &) {});
      });
    }

    for (auto &t : threads) {
      t.join();
    }

    REQUIRE(registry.size() == apdu::CONFIRMED_SERVICES.size());
  }

  SECTION("Concurrent lookup") {
    std::atomic<int> call_count{0};
    registry.RegisterUnconfirmed(UnconfirmedServiceChoice::WHO_IS,
                                 [&](const UnconfirmedRequestPtr &) { ++call_count; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
      threads.emplace_back([&registry]() {
        auto handler = registry.Find(UnconfirmedServiceChoice::WHO_IS);
        if (handler) {
          handler(nullptr);
        }
      });
    }

    for (auto &t : threads) {
      t.join();
    }

    REQUIRE(call_count == 50);
  }
}
