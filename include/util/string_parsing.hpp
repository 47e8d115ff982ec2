#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Centralized input validation for command-line flags and address text

 Key functions:
 - SafeParseInt / SafeParseInt64: Parse integer with bounds checking
 - SafeParsePort: Parse UDP port number (1-65535)
 - IsValidHex / ParseHexBytes: Validate and decode hexadecimal strings

 All functions validate that the entire input is consumed and return
 std::nullopt on any parsing error (no exceptions thrown).
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bacstack {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * @param str String to parse
 * @param min Minimum allowed value (inclusive)
 * @param max Maximum allowed value (inclusive)
 * @return Parsed integer or std::nullopt if invalid
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("47808") -> 47808
 *   SafeParsePort("0") -> std::nullopt
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse int64_t string with bounds checking
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Validate hexadecimal string
 *
 * @return true if non-empty and all characters are hex digits [0-9a-fA-F]
 */
bool IsValidHex(const std::string& str);

/**
 * Decode an even-length hexadecimal string into bytes
 *
 * Examples:
 *   ParseHexBytes("0a0B") -> {0x0a, 0x0b}
 *   ParseHexBytes("abc") -> std::nullopt (odd length)
 */
std::optional<std::vector<uint8_t>> ParseHexBytes(const std::string& str);

} // namespace util
} // namespace bacstack
