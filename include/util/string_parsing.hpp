#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Centralized input validation to prevent crashes from malformed input
   (seed files, command-line flags, hex signatures)

 Key functions:
 - SafeParseInt / SafeParsePort / SafeParseDouble: bounded numeric parsing
 - HexStr / ParseHex: binary <-> lowercase hex
 - TrimWhitespace / SplitWhitespace: line tokenizing for text configs
 - IsValidUtf8: host names from seed files must be UTF-8

 All parsing functions return std::nullopt on any error and never throw.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meshwalk {
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
 *   SafeParsePort("6421") -> 6421
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 *   SafeParsePort("99999") -> std::nullopt (out of range)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse a finite decimal number within [min, max]
 *
 * Examples:
 *   SafeParseDouble("10.5", 0, 60) -> 10.5
 *   SafeParseDouble("nan", 0, 60) -> std::nullopt
 */
std::optional<double> SafeParseDouble(const std::string& str, double min, double max);

/**
 * Validate hexadecimal string (non-empty, [0-9a-fA-F] only)
 */
bool IsValidHex(const std::string& str);

/**
 * Lowercase hex encoding of a byte string
 */
std::string HexStr(const std::vector<uint8_t>& data);

/**
 * Decode hex string (even length, hex digits only)
 * @return bytes or std::nullopt if malformed
 */
std::optional<std::vector<uint8_t>> ParseHex(const std::string& str);

/**
 * Strip leading and trailing ASCII whitespace
 */
std::string TrimWhitespace(std::string_view str);

/**
 * Split on runs of ASCII whitespace, dropping empty tokens
 */
std::vector<std::string> SplitWhitespace(std::string_view str);

/**
 * Check that a byte string is well-formed UTF-8 (no overlongs, no surrogates)
 */
bool IsValidUtf8(std::string_view str);

} // namespace util
} // namespace meshwalk
