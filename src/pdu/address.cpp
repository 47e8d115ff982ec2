// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "pdu/address.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <iomanip>
#include <sstream>

namespace bacstack {
namespace pdu {

namespace {

// Network number 0xFFFF is reserved for global broadcast
constexpr int MAX_NETWORK_NUMBER = 65534;

std::optional<std::vector<uint8_t>> ParseMac(const std::string &text) {
  if (text.empty()) {
    return std::nullopt;
  }

  // Hex form
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    return util::ParseHexBytes(text.substr(2));
  }

  // Dotted IPv4 with optional port
  if (text.find('.') != std::string::npos) {
    std::string ip = text;
    uint16_t port = Address::DEFAULT_BIP_PORT;
    size_t colon = text.find(':');
    if (colon != std::string::npos) {
      ip = text.substr(0, colon);
      auto port_opt = util::SafeParsePort(text.substr(colon + 1));
      if (!port_opt) {
        return std::nullopt;
      }
      port = *port_opt;
    }
    auto station = Address::FromIPv4(ip, port);
    if (!station) {
      return std::nullopt;
    }
    return station->mac();
  }

  // Single byte station number
  auto value = util::SafeParseInt(text, 0, 255);
  if (!value) {
    return std::nullopt;
  }
  return std::vector<uint8_t>{static_cast<uint8_t>(*value)};
}

std::string MacToString(const std::vector<uint8_t> &mac) {
  if (mac.size() == 1) {
    return std::to_string(mac[0]);
  }

  if (mac.size() == 6) {
    std::string text = std::to_string(mac[0]) + "." + std::to_string(mac[1]) + "." +
                       std::to_string(mac[2]) + "." + std::to_string(mac[3]);
    uint16_t port = static_cast<uint16_t>((mac[4] << 8) | mac[5]);
    if (port != Address::DEFAULT_BIP_PORT) {
      text += ":" + std::to_string(port);
    }
    return text;
  }

  std::ostringstream oss;
  oss << "0x" << std::hex << std::setfill('0');
  for (uint8_t b : mac) {
    oss << std::setw(2) << static_cast<int>(b);
  }
  return oss.str();
}

} // namespace

Address Address::LocalStation(std::vector<uint8_t> mac) {
  return Address(Type::LOCAL_STATION, std::nullopt, std::move(mac));
}

Address Address::RemoteStation(uint16_t network, std::vector<uint8_t> mac) {
  return Address(Type::REMOTE_STATION, network, std::move(mac));
}

Address Address::LocalBroadcast() {
  return Address(Type::LOCAL_BROADCAST, std::nullopt, {});
}

Address Address::RemoteBroadcast(uint16_t network) {
  return Address(Type::REMOTE_BROADCAST, network, {});
}

Address Address::GlobalBroadcast() {
  return Address(Type::GLOBAL_BROADCAST, std::nullopt, {});
}

std::optional<Address> Address::FromIPv4(const std::string &ip, uint16_t port) {
  boost::system::error_code ec;
  auto v4 = boost::asio::ip::make_address_v4(ip, ec);
  if (ec) {
    return std::nullopt;
  }

  auto bytes = v4.to_bytes();
  std::vector<uint8_t> mac(bytes.begin(), bytes.end());
  mac.push_back(static_cast<uint8_t>(port >> 8));
  mac.push_back(static_cast<uint8_t>(port & 0xFF));
  return LocalStation(std::move(mac));
}

std::optional<Address> Address::Parse(const std::string &text) {
  if (text.empty()) {
    return std::nullopt;
  }

  if (text == "*") {
    return LocalBroadcast();
  }
  if (text == "*:*") {
    return GlobalBroadcast();
  }

  size_t colon = text.find(':');

  // No network prefix, or the prefix is the host part of "ip:port"
  if (colon == std::string::npos || text.substr(0, colon).find('.') != std::string::npos) {
    auto mac = ParseMac(text);
    if (!mac) {
      return std::nullopt;
    }
    return LocalStation(std::move(*mac));
  }

  auto network = util::SafeParseInt(text.substr(0, colon), 1, MAX_NETWORK_NUMBER);
  if (!network) {
    return std::nullopt;
  }

  std::string rest = text.substr(colon + 1);
  if (rest == "*") {
    return RemoteBroadcast(static_cast<uint16_t>(*network));
  }

  auto mac = ParseMac(rest);
  if (!mac) {
    return std::nullopt;
  }
  return RemoteStation(static_cast<uint16_t>(*network), std::move(*mac));
}

std::string Address::ToString() const {
  switch (type_) {
  case Type::NULL_ADDRESS:
    return "null";
  case Type::LOCAL_BROADCAST:
    return "*";
  case Type::LOCAL_STATION:
    return MacToString(mac_);
  case Type::REMOTE_BROADCAST:
    return std::to_string(network_.value_or(0)) + ":*";
  case Type::REMOTE_STATION:
    return std::to_string(network_.value_or(0)) + ":" + MacToString(mac_);
  case Type::GLOBAL_BROADCAST:
    return "*:*";
  }
  return "unknown";
}

std::string ToString(Address::Type type) {
  switch (type) {
  case Address::Type::NULL_ADDRESS: return "null";
  case Address::Type::LOCAL_BROADCAST: return "local-broadcast";
  case Address::Type::LOCAL_STATION: return "local-station";
  case Address::Type::REMOTE_BROADCAST: return "remote-broadcast";
  case Address::Type::REMOTE_STATION: return "remote-station";
  case Address::Type::GLOBAL_BROADCAST: return "global-broadcast";
  }
  return "unknown";
}

} // namespace pdu
} // namespace bacstack
