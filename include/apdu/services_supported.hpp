// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "apdu/enums.hpp"
#include <bitset>
#include <cstddef>
#include <string>

namespace bacstack {
namespace apdu {

/**
 * ServicesSupported - the Protocol_Services_Supported bit string
 *
 * Bit positions are fixed by the standard and differ from the service
 * choice numbers (confirmed and unconfirmed services share one string).
 * Peers read this from the device object to learn which services to try.
 */
class ServicesSupported {
public:
  static constexpr size_t BIT_LENGTH = 44;

  void set(ConfirmedServiceChoice choice, bool value = true);
  void set(UnconfirmedServiceChoice choice, bool value = true);

  bool test(ConfirmedServiceChoice choice) const;
  bool test(UnconfirmedServiceChoice choice) const;

  // Raw access by bit position
  bool test_bit(size_t position) const { return bits_.test(position); }

  size_t count() const { return bits_.count(); }
  bool none() const { return bits_.none(); }

  // One character per bit, position 0 first ("0110...")
  std::string ToString() const;

  bool operator==(const ServicesSupported &other) const { return bits_ == other.bits_; }

private:
  std::bitset<BIT_LENGTH> bits_;
};

// Bit position of a service in the Protocol_Services_Supported string
size_t ServicesSupportedBit(ConfirmedServiceChoice choice);
size_t ServicesSupportedBit(UnconfirmedServiceChoice choice);

} // namespace apdu
} // namespace bacstack
