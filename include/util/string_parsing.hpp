#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Hex encoding/decoding for block hashes
 - Centralized input validation to prevent crashes from malformed input

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParsePort: Parse port number (1-65535)
 - ParseHex: Decode an even-length hexadecimal string to bytes
 - HexStr: Encode bytes as lower-case hexadecimal

 Security:
 - All functions validate entire input is consumed (no trailing garbage)
 - Returns std::nullopt on any parsing error (no exceptions thrown)
 - Safe for use with untrusted input (peer messages, command-line args)
*/

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace floodchain {
namespace util {

/**
 * Parse integer string with bounds checking
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
 *   SafeParsePort("9590") -> 9590
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Decode hexadecimal text (either case) to bytes
 *
 * Returns std::nullopt for odd length or any non-hex character.
 * The empty string decodes to an empty vector.
 */
std::optional<std::vector<uint8_t>> ParseHex(const std::string& str);

// Encode bytes as lower-case hexadecimal
std::string HexStr(std::span<const uint8_t> bytes);

} // namespace util
} // namespace floodchain
