#pragma once
#include "aiblame/hash.hpp"
#include "aiblame/object_store.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace aiblame {

// Read-only view of one "pack-<id>.pack" and its version 2 ".idx".
// The pack data is memory-mapped; the index is loaded eagerly.
class PackFile {
public:
  explicit PackFile(const std::filesystem::path& idx_path);
  ~PackFile();
  PackFile(const PackFile&) = delete;
  PackFile& operator=(const PackFile&) = delete;

  // Offset of the object inside the pack, if the pack has it.
  [[nodiscard]] std::optional<std::uint64_t> find(const oid& id) const;

  // Append ids whose hex form starts with `hex_prefix`.
  void find_prefix(std::string_view hex_prefix, std::vector<oid>& out) const;

  // Decode the object at `offset`, resolving deltas. REF_DELTA bases are
  // looked up through `store`, which may live in another pack.
  [[nodiscard]] Object read_at(std::uint64_t offset, const ObjectStore& store) const;

private:
  [[nodiscard]] Object read_at_depth(std::uint64_t offset, const ObjectStore& store,
                                     int depth) const;
  [[nodiscard]] std::span<const std::uint8_t> bytes_from(std::uint64_t offset) const;

  std::filesystem::path pack_path_;
  std::array<std::uint32_t, 256> fanout_{};
  std::vector<oid> names_;
  std::vector<std::uint64_t> offsets_;
  const std::uint8_t* map_ = nullptr;
  std::size_t map_len_ = 0;
};

// Apply a git delta (copy/insert instruction stream) to `base`.
std::vector<std::uint8_t> apply_delta(std::span<const std::uint8_t> base,
                                      std::span<const std::uint8_t> delta);

} // namespace aiblame
