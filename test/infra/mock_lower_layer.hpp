// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

// Recording bottom layer for application tests. Everything the stack sends
// down is kept in order; tests feed traffic up with deliver_*().

#include "apdu/apdu.hpp"
#include "comm/layer.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace bacstack {
namespace test {

class MockLowerLayer : public comm::ServiceAccessPoint {
public:
    void request(apdu::APDUPtr apdu) override {
        requests.push_back(apdu);
        if (on_request) {
            on_request(apdu);
        }
    }

    void response(apdu::APDUPtr apdu) override {
        responses.push_back(std::move(apdu));
    }

    void deliver_indication(apdu::APDUPtr apdu) { send_indication(std::move(apdu)); }
    void deliver_confirmation(apdu::APDUPtr apdu) { send_confirmation(std::move(apdu)); }

    // Typed view of a recorded APDU (nullptr when the type differs)
    template <typename T>
    static std::shared_ptr<const T> as(const apdu::APDUPtr& apdu) {
        return std::dynamic_pointer_cast<const T>(apdu);
    }

    void clear() {
        requests.clear();
        responses.clear();
    }

    std::vector<apdu::APDUPtr> requests;
    std::vector<apdu::APDUPtr> responses;

    // Runs after a request is recorded (lets a test answer synchronously)
    std::function<void(const apdu::APDUPtr&)> on_request;
};

// Confirmed request from `source` to `destination`
inline std::shared_ptr<apdu::ConfirmedRequest> MakeConfirmed(
    apdu::ConfirmedServiceChoice choice, const pdu::Address& source,
    const pdu::Address& destination, uint8_t invoke_id = 1) {
    auto request = std::make_shared<apdu::ConfirmedRequest>(choice);
    request->set_source(source);
    request->set_destination(destination);
    request->set_invoke_id(invoke_id);
    return request;
}

inline pdu::Address Station(uint8_t mac) {
    return pdu::Address::LocalStation({mac});
}

} // namespace test
} // namespace bacstack
