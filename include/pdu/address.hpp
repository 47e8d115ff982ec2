// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Address - network-layer address of a BACnet peer

 Forms:
 - Null                  no address
 - LocalBroadcast  "*"   every station on the local network
 - LocalStation          one station on the local network (MAC bytes)
 - RemoteBroadcast "N:*" every station on network N
 - RemoteStation   "N:m" one station on network N
 - GlobalBroadcast "*:*" every station on every network

 MAC text forms (local and remote stations):
 - "a.b.c.d" or "a.b.c.d:port"  6-byte B/IP MAC (default port 47808)
 - "0x0102ab"                    raw hex bytes
 - "12"                          single byte (0-255), e.g. MS/TP

 Addresses are totally ordered so they can be used as map keys by the
 device info cache and the destination controller registry.
*/

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bacstack {
namespace pdu {

class Address {
public:
  enum class Type : uint8_t {
    NULL_ADDRESS = 0,
    LOCAL_BROADCAST = 1,
    LOCAL_STATION = 2,
    REMOTE_BROADCAST = 3,
    REMOTE_STATION = 4,
    GLOBAL_BROADCAST = 5,
  };

  // B/IP well-known UDP port (0xBAC0)
  static constexpr uint16_t DEFAULT_BIP_PORT = 47808;

  Address() = default;

  static Address LocalStation(std::vector<uint8_t> mac);
  static Address RemoteStation(uint16_t network, std::vector<uint8_t> mac);
  static Address LocalBroadcast();
  static Address RemoteBroadcast(uint16_t network);
  static Address GlobalBroadcast();

  // B/IP station from dotted IPv4 text and port
  static std::optional<Address> FromIPv4(const std::string &ip, uint16_t port = DEFAULT_BIP_PORT);

  // Parse the text forms listed above; std::nullopt if malformed
  static std::optional<Address> Parse(const std::string &text);

  Type type() const { return type_; }
  std::optional<uint16_t> network() const { return network_; }
  const std::vector<uint8_t> &mac() const { return mac_; }

  bool is_null() const { return type_ == Type::NULL_ADDRESS; }
  bool is_station() const {
    return type_ == Type::LOCAL_STATION || type_ == Type::REMOTE_STATION;
  }
  bool is_broadcast() const {
    return type_ == Type::LOCAL_BROADCAST || type_ == Type::REMOTE_BROADCAST ||
           type_ == Type::GLOBAL_BROADCAST;
  }

  std::string ToString() const;

  auto operator<=>(const Address &) const = default;
  bool operator==(const Address &) const = default;

private:
  Address(Type type, std::optional<uint16_t> network, std::vector<uint8_t> mac)
      : type_(type), network_(network), mac_(std::move(mac)) {}

  Type type_ = Type::NULL_ADDRESS;
  std::optional<uint16_t> network_;
  std::vector<uint8_t> mac_;
};

std::string ToString(Address::Type type);

} // namespace pdu
} // namespace bacstack
