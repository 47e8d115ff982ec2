// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 DeviceInfoCache - per-peer capability records, indexed two ways

 Purpose
 - Remember what each peer told us in its I-Am (max APDU length,
   segmentation support, vendor) so the segmentation and transaction
   layers can size their traffic for that peer.

 Indexing
 - A record is reachable by its device identifier and by its station
   address. Either may change during the record's life (a device moves to
   a new address, an address-only record learns its identifier).
 - Each record remembers the keys it is currently indexed under
   (indexed_identifier / indexed_address). reindex() compares those with
   the record's current fields and moves the index entries. Assigning a
   field does NOT reindex; callers run reindex() after mutating.
 - Invariant: at most one identifier key and one address key per record,
   and after reindex() they equal the record's current fields. When a key
   moves onto one already held by another record, that record loses the
   key.

 Lifetime
 - Records are shared. release() only makes a record unreachable; an owner
   holding the pointer (e.g. a segmentation state machine) may keep using
   it.

 Threading
 - Not thread-safe. Driven from the single protocol event flow.
*/

#include "apdu/apdu.hpp"
#include "pdu/address.hpp"
#include "pdu/object_identifier.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <variant>
#include <vector>

namespace bacstack {
namespace app {

class DeviceInfoCache;

class DeviceInfo {
public:
  static constexpr uint32_t DEFAULT_MAX_APDU_LENGTH = 1024;
  static constexpr uint32_t DEFAULT_MAX_NPDU_LENGTH = 1497;

  // From the peer's I-Am
  std::optional<pdu::ObjectIdentifier> device_identifier;
  std::optional<pdu::Address> address;
  uint32_t max_apdu_length_accepted = DEFAULT_MAX_APDU_LENGTH;
  apdu::Segmentation segmentation_supported = apdu::Segmentation::NO_SEGMENTATION;
  std::optional<uint16_t> vendor_id;

  // Maximum we can send in transit
  uint32_t max_npdu_length = DEFAULT_MAX_NPDU_LENGTH;
  // Proposed/actual window size
  std::optional<uint32_t> max_segments_accepted;

  const std::optional<pdu::ObjectIdentifier> &indexed_identifier() const { return cache_id_; }
  const std::optional<pdu::Address> &indexed_address() const { return cache_address_; }

  nlohmann::json ToJson() const;

private:
  friend class DeviceInfoCache;
  std::optional<pdu::ObjectIdentifier> cache_id_;
  std::optional<pdu::Address> cache_address_;
};

using DeviceInfoPtr = std::shared_ptr<DeviceInfo>;

class DeviceInfoCache {
public:
  // A device identifier (object type must be device) or a station address
  using Key = std::variant<pdu::ObjectIdentifier, pdu::Address>;

  DeviceInfoCache() = default;

  DeviceInfoCache(const DeviceInfoCache &) = delete;
  DeviceInfoCache &operator=(const DeviceInfoCache &) = delete;

  // True iff a record is indexed under `key`
  bool has(const Key &key) const;

  // Lookup by identifier returns the record or nullptr. Lookup by address
  // creates and indexes a blank record on a miss.
  // Throws InvalidKey for a non-device identifier or a non-station address.
  DeviceInfoPtr get(const Key &key);

  // Fold a peer announcement into the cache
  void ingest(const apdu::IAmRequest &iam);

  // Bring the index in line with the record's current identifier/address
  void reindex(const DeviceInfoPtr &info);

  // Remove both of the record's index entries
  void release(const DeviceInfoPtr &info);

  // Number of distinct reachable records
  size_t size() const;

  // Distinct reachable records, address-indexed first
  std::vector<DeviceInfoPtr> records() const;

  nlohmann::json Snapshot() const;

private:
  static void ValidateKey(const Key &key);

  std::map<pdu::ObjectIdentifier, DeviceInfoPtr> by_identifier_;
  std::map<pdu::Address, DeviceInfoPtr> by_address_;
};

} // namespace app
} // namespace bacstack
