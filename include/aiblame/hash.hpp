#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace aiblame {

// Binary object id as stored in trees and pack indexes.
using oid = std::array<std::uint8_t, 20>;

oid sha1(std::span<const std::uint8_t> data);

inline oid sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

// Id of a loose object: SHA-1 over "<type> <size>\0" followed by the payload.
oid object_id(std::string_view type, std::span<const std::uint8_t> payload);

// Prompt digests are lowercase hex SHA-256 of the prompt text.
std::string sha256_hex(std::string_view text);

std::string to_hex(const oid &id);

// False on wrong length or a non-hex character; `out` is then unspecified.
bool from_hex(std::string_view hex, oid &out);

} // namespace aiblame
