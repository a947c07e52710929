#pragma once
#include "aiblame/hash.hpp"
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace aiblame {

struct Object {
  std::string type;                  // "blob" | "tree" | "commit" | "tag"
  std::vector<std::uint8_t> data;    // payload bytes (no header)
};

class PackFile; // fwd, see pack.hpp

class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path objects_dir);
  ~ObjectStore();
  ObjectStore(ObjectStore&&) noexcept;
  ObjectStore& operator=(ObjectStore&&) noexcept;

  // Read a loose or packed object identified by 40-hex; returns type and payload.
  // Throws ObjectError if it is nowhere to be found.
  Object read(std::string_view hex_oid) const;

  // Does the object exist (loose or packed)?
  [[nodiscard]] bool contains(std::string_view hex_oid) const;

  // Write a loose object with given type/payload. Returns 40-hex id.
  std::string write(std::string_view type, std::span<const std::uint8_t> payload) const;

  // All object ids starting with `hex_prefix` (loose and packed, de-duplicated).
  [[nodiscard]] std::vector<std::string> find_prefix(std::string_view hex_prefix) const;

  // Get filesystem path of the loose object for a binary oid.
  std::filesystem::path path_for_oid(const oid& object_id) const;

private:
  const std::vector<std::unique_ptr<PackFile>>& packs() const;

  std::filesystem::path objects_dir_;
  mutable std::vector<std::unique_ptr<PackFile>> packs_;
  mutable bool packs_loaded_ = false;
};

} // namespace aiblame
