#include "aiblame/object_store.hpp"

#include "aiblame/consts.hpp"
#include "aiblame/errors.hpp"
#include "aiblame/fs.hpp"
#include "aiblame/pack.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace gfs = aiblame::fs;

namespace aiblame {

ObjectStore::ObjectStore(std::filesystem::path objects_dir)
    : objects_dir_(std::move(objects_dir)) {}

ObjectStore::~ObjectStore() = default;
ObjectStore::ObjectStore(ObjectStore &&) noexcept = default;
ObjectStore &ObjectStore::operator=(ObjectStore &&) noexcept = default;

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  const std::filesystem::path dir = objects_dir_ / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

const std::vector<std::unique_ptr<PackFile>> &ObjectStore::packs() const {
  if (!packs_loaded_) {
    packs_loaded_ = true;
    const auto dir = objects_dir_ / consts::kPackDir;
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
      std::vector<std::filesystem::path> idx_files;
      for (const auto &entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().extension() == ".idx")
          idx_files.push_back(entry.path());
      }
      std::ranges::sort(idx_files);
      for (const auto &idx : idx_files)
        packs_.push_back(std::make_unique<PackFile>(idx));
    }
  }
  return packs_;
}

Object ObjectStore::read(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw ObjectError("object_store: bad oid hex: " + std::string(hex_oid));
  }

  const auto loose = path_for_oid(id);
  if (gfs::exists(loose)) {
    auto store = gfs::z_decompress(gfs::read_file(loose));
    auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(' '));
    if (it_space == store.end()) {
      throw ObjectError("object_store: invalid header in " + loose.string());
    }
    auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>('\0'));
    if (it_nul == store.end()) {
      throw ObjectError("object_store: invalid header in " + loose.string());
    }
    std::string type(store.begin(), it_space);
    const auto payload_off = (it_nul - store.begin()) + 1;
    return Object{.type = std::move(type), .data = {store.begin() + payload_off, store.end()}};
  }

  for (const auto &pack : packs()) {
    if (const auto off = pack->find(id)) {
      return pack->read_at(*off, *this);
    }
  }
  throw ObjectError("object not found: " + std::string(hex_oid));
}

bool ObjectStore::contains(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    return false;
  }
  if (gfs::exists(path_for_oid(id))) {
    return true;
  }
  return std::ranges::any_of(packs(), [&](const auto &pack) { return pack->find(id).has_value(); });
}

std::string ObjectStore::write(std::string_view type, std::span<const std::uint8_t> payload) const {
  const oid store_id = object_id(type, payload);
  const auto path = path_for_oid(store_id);
  if (!std::filesystem::exists(path)) {
    std::string header = std::string(type) + " " + std::to_string(payload.size());
    header.push_back('\0');
    std::vector<std::uint8_t> store(header.begin(), header.end());
    store.insert(store.end(), payload.begin(), payload.end());
    auto compressed = gfs::z_compress(store);
    gfs::write_file_atomic(path, compressed);
  }
  return to_hex(store_id);
}

std::vector<std::string> ObjectStore::find_prefix(std::string_view hex_prefix) const {
  std::set<std::string> found;
  if (hex_prefix.size() >= consts::kFanoutDirHexLen) {
    const auto dir = objects_dir_ / std::string(hex_prefix.substr(0, consts::kFanoutDirHexLen));
    const auto rest = hex_prefix.substr(consts::kFanoutDirHexLen);
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
      for (const auto &entry : std::filesystem::directory_iterator(dir)) {
        const std::string name = entry.path().filename().string();
        if (name.size() + consts::kFanoutDirHexLen == consts::kOidHexLen &&
            name.compare(0, rest.size(), rest) == 0) {
          found.insert(std::string(hex_prefix.substr(0, consts::kFanoutDirHexLen)) + name);
        }
      }
    }
  }
  std::vector<oid> packed;
  for (const auto &pack : packs())
    pack->find_prefix(hex_prefix, packed);
  for (const auto &id : packed)
    found.insert(to_hex(id));
  return {found.begin(), found.end()};
}

} // namespace aiblame
