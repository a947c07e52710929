#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace aiblame {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// Validate a non-empty run of hex digits
auto looks_hex(std::string_view str) -> bool;

// Short form used in human-readable output
auto abbrev(std::string_view hex, std::size_t len = 8) -> std::string;

inline auto as_bytes(std::string_view s) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip spaces, tabs and CR on both ends
  auto trim(std::string_view sv) -> std::string;

  // Split on a single character; keeps empty fields
  auto split(std::string_view sv, char sep) -> std::vector<std::string>;

  // Parse a decimal integer occupying the whole string
  auto parse_int(std::string_view sv, long long& out) -> bool;
}

}
