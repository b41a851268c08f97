#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command line and config values into numeric types
 - Every function validates that the whole input is consumed and that the
   value is within bounds
 - Returns std::nullopt on any parsing error (no exceptions thrown)
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace headerpipe {
namespace util {

/**
 * Parse unsigned 64-bit string with bounds checking
 *
 * Block numbers and queue sizes go through here. A leading '-' or '+' is
 * rejected rather than wrapped.
 *
 * Examples:
 *   SafeParseUInt64("17000000", 0, UINT64_MAX) -> 17000000
 *   SafeParseUInt64("-1", 0, 10) -> std::nullopt
 *   SafeParseUInt64("18446744073709551616", 0, UINT64_MAX) -> std::nullopt (overflow)
 */
std::optional<uint64_t> SafeParseUInt64(const std::string& str, uint64_t min, uint64_t max);

// Split "a,b,c" into {"a","b","c"}; empty items are dropped
std::vector<std::string> SplitCommaList(const std::string& str);

} // namespace util
} // namespace headerpipe
