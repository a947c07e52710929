#include "aiblame/pack.hpp"

#include "aiblame/consts.hpp"
#include "aiblame/errors.hpp"
#include "aiblame/fs.hpp"

#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace gfs = aiblame::fs;

namespace {

constexpr std::uint32_t kIdxMagic = 0xff744f63; // "\377tOc"
constexpr int kMaxDeltaDepth = 10000;

enum PackType : int {
  kPackCommit = 1,
  kPackTree = 2,
  kPackBlob = 3,
  kPackTag = 4,
  kPackOfsDelta = 6,
  kPackRefDelta = 7,
};

std::uint32_t be32(const std::uint8_t *p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

std::uint64_t be64(const std::uint8_t *p) {
  return (static_cast<std::uint64_t>(be32(p)) << 32) | be32(p + 4);
}

std::string_view type_name(int type) {
  switch (type) {
  case kPackCommit:
    return aiblame::consts::kTypeCommit;
  case kPackTree:
    return aiblame::consts::kTypeTree;
  case kPackBlob:
    return aiblame::consts::kTypeBlob;
  case kPackTag:
    return aiblame::consts::kTypeTag;
  default:
    throw aiblame::ObjectError("pack: unexpected object type " + std::to_string(type));
  }
}

// Little-endian base-128 size used in delta headers.
std::size_t delta_varint(std::span<const std::uint8_t> d, std::size_t &pos) {
  std::size_t value = 0;
  int shift = 0;
  for (;;) {
    if (pos >= d.size())
      throw aiblame::ObjectError("delta: truncated size");
    const std::uint8_t c = d[pos++];
    value |= static_cast<std::size_t>(c & 0x7f) << shift;
    shift += 7;
    if ((c & 0x80) == 0)
      break;
  }
  return value;
}

} // namespace

namespace aiblame {

std::vector<std::uint8_t> apply_delta(std::span<const std::uint8_t> base,
                                      std::span<const std::uint8_t> delta) {
  std::size_t pos = 0;
  const std::size_t src_size = delta_varint(delta, pos);
  const std::size_t dst_size = delta_varint(delta, pos);
  if (src_size != base.size())
    throw ObjectError("delta: base size mismatch");

  std::vector<std::uint8_t> out;
  out.reserve(dst_size);
  while (pos < delta.size()) {
    const std::uint8_t op = delta[pos++];
    if (op & 0x80) {
      std::size_t off = 0;
      std::size_t len = 0;
      for (int i = 0; i < 4; ++i) {
        if (op & (1U << i)) {
          if (pos >= delta.size())
            throw ObjectError("delta: truncated copy");
          off |= static_cast<std::size_t>(delta[pos++]) << (8 * i);
        }
      }
      for (int i = 0; i < 3; ++i) {
        if (op & (1U << (4 + i))) {
          if (pos >= delta.size())
            throw ObjectError("delta: truncated copy");
          len |= static_cast<std::size_t>(delta[pos++]) << (8 * i);
        }
      }
      if (len == 0)
        len = 0x10000;
      if (off + len > base.size())
        throw ObjectError("delta: copy out of range");
      out.insert(out.end(), base.begin() + static_cast<std::ptrdiff_t>(off),
                 base.begin() + static_cast<std::ptrdiff_t>(off + len));
    } else if (op != 0) {
      if (pos + op > delta.size())
        throw ObjectError("delta: truncated insert");
      out.insert(out.end(), delta.begin() + static_cast<std::ptrdiff_t>(pos),
                 delta.begin() + static_cast<std::ptrdiff_t>(pos + op));
      pos += op;
    } else {
      throw ObjectError("delta: reserved opcode 0");
    }
  }
  if (out.size() != dst_size)
    throw ObjectError("delta: result size mismatch");
  return out;
}

PackFile::PackFile(const std::filesystem::path &idx_path) {
  pack_path_ = idx_path;
  pack_path_.replace_extension(".pack");

  const auto idx = gfs::read_file(idx_path);
  if (idx.size() < 8 + (256 * 4) || be32(idx.data()) != kIdxMagic || be32(idx.data() + 4) != 2)
    throw ObjectError("unsupported pack index (need version 2): " + idx_path.string());

  const std::uint8_t *p = idx.data() + 8;
  for (std::size_t i = 0; i < 256; ++i)
    fanout_[i] = be32(p + (4 * i));
  const std::size_t n = fanout_[255];

  const std::size_t names_off = 8 + (256 * 4);
  const std::size_t crc_off = names_off + (n * consts::kOidRawLen);
  const std::size_t ofs_off = crc_off + (n * 4);
  const std::size_t large_off = ofs_off + (n * 4);
  // Trailer: checksum of the pack, then checksum of the index itself.
  if (idx.size() < large_off + (2 * consts::kOidRawLen))
    throw ObjectError("truncated pack index: " + idx_path.string());
  const std::size_t trailer_off = idx.size() - (2 * consts::kOidRawLen);
  const oid idx_sum =
      sha1(std::span<const std::uint8_t>(idx.data(), idx.size() - consts::kOidRawLen));
  if (std::memcmp(idx_sum.data(), idx.data() + trailer_off + consts::kOidRawLen,
                  consts::kOidRawLen) != 0)
    throw ObjectError("pack index checksum mismatch: " + idx_path.string());
  oid pack_sum{};
  std::memcpy(pack_sum.data(), idx.data() + trailer_off, consts::kOidRawLen);

  names_.resize(n);
  offsets_.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    std::memcpy(names_[i].data(), idx.data() + names_off + (i * consts::kOidRawLen),
                consts::kOidRawLen);
    const std::uint32_t o = be32(idx.data() + ofs_off + (i * 4));
    if (o & 0x80000000U) {
      const std::size_t at = large_off + (static_cast<std::size_t>(o & 0x7fffffffU) * 8);
      if (at + 8 > trailer_off)
        throw ObjectError("pack index: bad large offset");
      offsets_[i] = be64(idx.data() + at);
    } else {
      offsets_[i] = o;
    }
  }

  const int fd = ::open(pack_path_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0)
    throw ObjectError("cannot open pack: " + pack_path_.string());
  struct stat st {};
  if (::fstat(fd, &st) != 0 || st.st_size < 12 + static_cast<off_t>(consts::kOidRawLen)) {
    ::close(fd);
    throw ObjectError("cannot stat pack: " + pack_path_.string());
  }
  map_len_ = static_cast<std::size_t>(st.st_size);
  void *m = ::mmap(nullptr, map_len_, PROT_READ, MAP_PRIVATE, fd, 0);
  ::close(fd);
  if (m == MAP_FAILED)
    throw ObjectError("cannot map pack: " + pack_path_.string());
  map_ = static_cast<const std::uint8_t *>(m);
  if (std::memcmp(map_, "PACK", 4) != 0) {
    ::munmap(const_cast<std::uint8_t *>(map_), map_len_);
    map_ = nullptr;
    throw ObjectError("not a pack file: " + pack_path_.string());
  }
  if (std::memcmp(map_ + map_len_ - consts::kOidRawLen, pack_sum.data(), consts::kOidRawLen) != 0) {
    ::munmap(const_cast<std::uint8_t *>(map_), map_len_);
    map_ = nullptr;
    throw ObjectError("pack does not match its index: " + pack_path_.string());
  }
}

PackFile::~PackFile() {
  if (map_ != nullptr)
    ::munmap(const_cast<std::uint8_t *>(map_), map_len_);
}

std::optional<std::uint64_t> PackFile::find(const oid &id) const {
  const std::size_t lo = id[0] == 0 ? 0 : fanout_[id[0] - 1];
  const std::size_t hi = fanout_[id[0]];
  const auto first = names_.begin() + static_cast<std::ptrdiff_t>(lo);
  const auto last = names_.begin() + static_cast<std::ptrdiff_t>(hi);
  const auto it = std::lower_bound(first, last, id);
  if (it == last || *it != id)
    return std::nullopt;
  return offsets_[static_cast<std::size_t>(it - names_.begin())];
}

void PackFile::find_prefix(std::string_view hex_prefix, std::vector<oid> &out) const {
  for (const auto &name : names_) {
    if (to_hex(name).compare(0, hex_prefix.size(), hex_prefix) == 0)
      out.push_back(name);
  }
}

std::span<const std::uint8_t> PackFile::bytes_from(std::uint64_t offset) const {
  if (offset >= map_len_)
    throw ObjectError("pack: offset out of range in " + pack_path_.string());
  return {map_ + offset, map_len_ - static_cast<std::size_t>(offset)};
}

Object PackFile::read_at(std::uint64_t offset, const ObjectStore &store) const {
  return read_at_depth(offset, store, 0);
}

Object PackFile::read_at_depth(std::uint64_t offset, const ObjectStore &store, int depth) const {
  if (depth > kMaxDeltaDepth)
    throw ObjectError("pack: delta chain too deep");

  const auto bytes = bytes_from(offset);
  std::size_t pos = 0;
  auto next = [&]() -> std::uint8_t {
    if (pos >= bytes.size())
      throw ObjectError("pack: truncated entry header");
    return bytes[pos++];
  };

  std::uint8_t c = next();
  const int type = (c >> 4) & 7;
  std::size_t size = c & 15;
  int shift = 4;
  while (c & 0x80) {
    c = next();
    size |= static_cast<std::size_t>(c & 0x7f) << shift;
    shift += 7;
  }

  if (type == kPackOfsDelta) {
    c = next();
    std::uint64_t back = c & 0x7f;
    while (c & 0x80) {
      c = next();
      back = ((back + 1) << 7) | (c & 0x7f);
    }
    if (back == 0 || back > offset)
      throw ObjectError("pack: bad delta base offset");
    const auto delta = gfs::z_inflate_prefix(bytes.subspan(pos), size);
    Object base = read_at_depth(offset - back, store, depth + 1);
    return Object{.type = std::move(base.type), .data = apply_delta(base.data, delta)};
  }

  if (type == kPackRefDelta) {
    if (pos + consts::kOidRawLen > bytes.size())
      throw ObjectError("pack: truncated delta base id");
    oid base_id{};
    std::memcpy(base_id.data(), bytes.data() + pos, consts::kOidRawLen);
    pos += consts::kOidRawLen;
    const auto delta = gfs::z_inflate_prefix(bytes.subspan(pos), size);
    Object base;
    if (const auto local = find(base_id)) {
      base = read_at_depth(*local, store, depth + 1);
    } else {
      base = store.read(to_hex(base_id));
    }
    return Object{.type = std::move(base.type), .data = apply_delta(base.data, delta)};
  }

  return Object{.type = std::string(type_name(type)),
                .data = gfs::z_inflate_prefix(bytes.subspan(pos), size)};
}

} // namespace aiblame
