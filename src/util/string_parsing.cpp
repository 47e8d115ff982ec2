#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace bacstack {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  try {
    // Reject empty or whitespace-leading strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long value = std::stol(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int>(value);
  } catch (const std::logic_error&) {
    // std::invalid_argument and std::out_of_range
    return std::nullopt;
  }
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  try {
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int64_t>(value);
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

bool IsValidHex(const std::string& str) {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

static uint8_t HexNibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  return static_cast<uint8_t>(c - 'A' + 10);
}

std::optional<std::vector<uint8_t>> ParseHexBytes(const std::string& str) {
  if (str.size() % 2 != 0 || !IsValidHex(str)) {
    return std::nullopt;
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(str.size() / 2);
  for (size_t i = 0; i < str.size(); i += 2) {
    bytes.push_back(static_cast<uint8_t>((HexNibble(str[i]) << 4) | HexNibble(str[i + 1])));
  }
  return bytes;
}

} // namespace util
} // namespace bacstack
