// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/device_info_cache.hpp"
#include "app/errors.hpp"
#include "util/logging.hpp"
#include <set>

namespace bacstack {
namespace app {

nlohmann::json DeviceInfo::ToJson() const {
  nlohmann::json j;
  j["device_identifier"] = device_identifier ? nlohmann::json(device_identifier->ToString())
                                             : nlohmann::json(nullptr);
  j["address"] = address ? nlohmann::json(address->ToString()) : nlohmann::json(nullptr);
  j["max_apdu_length_accepted"] = max_apdu_length_accepted;
  j["segmentation_supported"] = apdu::ToString(segmentation_supported);
  j["vendor_id"] = vendor_id ? nlohmann::json(*vendor_id) : nlohmann::json(nullptr);
  j["max_npdu_length"] = max_npdu_length;
  j["max_segments_accepted"] =
      max_segments_accepted ? nlohmann::json(*max_segments_accepted) : nlohmann::json(nullptr);
  return j;
}

void DeviceInfoCache::ValidateKey(const Key &key) {
  if (const auto *id = std::get_if<pdu::ObjectIdentifier>(&key)) {
    if (!id->is_device()) {
      throw InvalidKey("device info key must be a device identifier, got " + id->ToString());
    }
    return;
  }

  const auto &address = std::get<pdu::Address>(key);
  if (!address.is_station()) {
    throw InvalidKey("device info address must be a local or remote station, got " +
                     pdu::ToString(address.type()));
  }
}

bool DeviceInfoCache::has(const Key &key) const {
  if (const auto *id = std::get_if<pdu::ObjectIdentifier>(&key)) {
    return by_identifier_.count(*id) > 0;
  }
  return by_address_.count(std::get<pdu::Address>(key)) > 0;
}

DeviceInfoPtr DeviceInfoCache::get(const Key &key) {
  ValidateKey(key);

  if (const auto *id = std::get_if<pdu::ObjectIdentifier>(&key)) {
    auto it = by_identifier_.find(*id);
    return it != by_identifier_.end() ? it->second : nullptr;
  }

  const auto &address = std::get<pdu::Address>(key);
  auto it = by_address_.find(address);
  if (it != by_address_.end()) {
    return it->second;
  }

  // First time we hear from this station
  auto info = std::make_shared<DeviceInfo>();
  info->address = address;
  info->cache_address_ = address;
  by_address_[address] = info;

  LOG_CACHE_DEBUG("New device info record for {}", address.ToString());
  return info;
}

void DeviceInfoCache::ingest(const apdu::IAmRequest &iam) {
  const auto &identifier = iam.device_identifier();
  const auto &source = iam.source();

  auto info = get(identifier);
  if (info) {
    if (info->address == source) {
      LOG_CACHE_TRACE("I-Am from {} at {}: record already current", identifier.ToString(),
                      source.ToString());
      return;
    }

    LOG_CACHE_DEBUG("Device {} moved from {} to {}", identifier.ToString(),
                    info->address ? info->address->ToString() : std::string("(none)"),
                    source.ToString());
    info->address = source;
  } else {
    // Creates the record if this station is unknown too
    info = get(source);
    info->device_identifier = identifier;
  }

  info->max_apdu_length_accepted = iam.max_apdu_length_accepted();
  info->segmentation_supported = iam.segmentation_supported();
  info->vendor_id = iam.vendor_id();

  reindex(info);
}

void DeviceInfoCache::reindex(const DeviceInfoPtr &info) {
  if (!info) {
    throw UsageError("reindex: null device info");
  }

  // Validate before touching either index so a bad record changes nothing
  if (info->device_identifier && !info->device_identifier->is_device()) {
    throw InvalidKey("device identifier must be of type device, got " +
                     info->device_identifier->ToString());
  }
  if (info->address && !info->address->is_station()) {
    throw InvalidKey("device address must be a local or remote station, got " +
                     pdu::ToString(info->address->type()));
  }

  if (info->device_identifier != info->cache_id_) {
    if (info->cache_id_) {
      auto it = by_identifier_.find(*info->cache_id_);
      if (it != by_identifier_.end() && it->second == info) {
        by_identifier_.erase(it);
      }
    }
    if (info->device_identifier) {
      auto &slot = by_identifier_[*info->device_identifier];
      if (slot && slot != info) {
        LOG_CACHE_WARN("Identifier {} taken over from another record",
                       info->device_identifier->ToString());
        slot->cache_id_.reset();
      }
      slot = info;
    }
    LOG_CACHE_TRACE("Identifier key updated");
    info->cache_id_ = info->device_identifier;
  }

  if (info->address != info->cache_address_) {
    if (info->cache_address_) {
      auto it = by_address_.find(*info->cache_address_);
      if (it != by_address_.end() && it->second == info) {
        by_address_.erase(it);
      }
    }
    if (info->address) {
      auto &slot = by_address_[*info->address];
      if (slot && slot != info) {
        LOG_CACHE_DEBUG("Address {} taken over from another record", info->address->ToString());
        slot->cache_address_.reset();
      }
      slot = info;
    }
    LOG_CACHE_TRACE("Address key updated");
    info->cache_address_ = info->address;
  }
}

void DeviceInfoCache::release(const DeviceInfoPtr &info) {
  if (!info) {
    throw UsageError("release: null device info");
  }

  if (info->cache_id_) {
    auto it = by_identifier_.find(*info->cache_id_);
    if (it != by_identifier_.end() && it->second == info) {
      by_identifier_.erase(it);
    }
  }
  if (info->cache_address_) {
    auto it = by_address_.find(*info->cache_address_);
    if (it != by_address_.end() && it->second == info) {
      by_address_.erase(it);
    }
  }

  info->cache_id_.reset();
  info->cache_address_.reset();
}

size_t DeviceInfoCache::size() const {
  return records().size();
}

std::vector<DeviceInfoPtr> DeviceInfoCache::records() const {
  std::vector<DeviceInfoPtr> result;
  std::set<const DeviceInfo *> seen;

  for (const auto &[address, info] : by_address_) {
    if (seen.insert(info.get()).second) {
      result.push_back(info);
    }
  }
  for (const auto &[id, info] : by_identifier_) {
    if (seen.insert(info.get()).second) {
      result.push_back(info);
    }
  }
  return result;
}

nlohmann::json DeviceInfoCache::Snapshot() const {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &info : records()) {
    j.push_back(info->ToJson());
  }
  return j;
}

} // namespace app
} // namespace bacstack
