#include "aiblame/errors.hpp"
#include "aiblame/fs.hpp"
#include "aiblame/hash.hpp"
#include "aiblame/pack.hpp"
#include "aiblame/repo.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using Bytes = std::vector<std::uint8_t>;

namespace {

Bytes bytes(std::string_view s) { return Bytes(s.begin(), s.end()); }

void put32(Bytes &out, std::uint32_t v) {
  for (int shift = 24; shift >= 0; shift -= 8) out.push_back(static_cast<std::uint8_t>(v >> shift));
}

aiblame::oid object_id(std::string_view type, std::string_view payload) {
  return aiblame::object_id(type, aiblame::as_bytes(payload));
}

// Entry header: type in bits 4-6 of the first byte, size as a base-128 varint.
void entry_header(Bytes &out, int type, std::size_t size) {
  std::uint8_t c = static_cast<std::uint8_t>((type << 4) | (size & 15));
  size >>= 4;
  while (size != 0) {
    out.push_back(c | 0x80);
    c = static_cast<std::uint8_t>(size & 0x7f);
    size >>= 7;
  }
  out.push_back(c);
}

void ofs_encode(Bytes &out, std::uint64_t ofs) {
  Bytes buf;
  buf.push_back(static_cast<std::uint8_t>(ofs & 127));
  while (ofs >>= 7) {
    --ofs;
    buf.push_back(static_cast<std::uint8_t>(128 | (ofs & 127)));
  }
  out.insert(out.end(), buf.rbegin(), buf.rend());
}

void append(Bytes &out, const Bytes &more) { out.insert(out.end(), more.begin(), more.end()); }

struct Packed {
  aiblame::oid id;
  std::uint32_t offset;
};

} // namespace

int main() {
  testsupport::Sandbox sb("pack");
  try {
    const auto objects = sb.root / ".git" / "objects";

    // a loose base for the REF_DELTA entry
    const std::string loose_text = "loose base\n";
    {
      const aiblame::ObjectStore store{objects};
      store.write("blob", aiblame::as_bytes(loose_text));
    }
    const auto loose_id = object_id("blob", loose_text);

    const std::string base_text = "hello world\n";
    const std::string ofs_text = "hello world\nand more\n";
    const std::string ref_text = "loose base\nextra\n";

    std::string tree_payload = "100644 f.txt";
    tree_payload.push_back('\0');
    const auto ofs_id = object_id("blob", ofs_text);
    tree_payload.append(reinterpret_cast<const char *>(ofs_id.data()), ofs_id.size());
    const auto tree_id = object_id("tree", tree_payload);
    const std::string commit_payload = "tree " + aiblame::to_hex(tree_id) +
                                       "\nauthor A <a@x> 100 +0000\ncommitter A <a@x> 100 +0000\n\npacked\n";

    Bytes pack = bytes("PACK");
    put32(pack, 2);
    put32(pack, 5);
    std::vector<Packed> entries;

    auto full = [&](int type, std::string_view type_name, const std::string &payload) {
      entries.push_back(Packed{object_id(type_name, payload), static_cast<std::uint32_t>(pack.size())});
      entry_header(pack, type, payload.size());
      append(pack, aiblame::fs::z_compress(aiblame::as_bytes(payload)));
    };

    full(3, "blob", base_text);
    const std::uint32_t base_offset = entries.back().offset;

    // OFS_DELTA: copy the 12 base bytes, insert the rest
    Bytes delta{12, 21, 0x90, 12, 9};
    append(delta, bytes("and more\n"));
    entries.push_back(Packed{ofs_id, static_cast<std::uint32_t>(pack.size())});
    entry_header(pack, 6, delta.size());
    ofs_encode(pack, entries.back().offset - base_offset);
    append(pack, aiblame::fs::z_compress(delta));

    // REF_DELTA against the loose object
    Bytes ref_delta{11, 17, 0x90, 11, 6};
    append(ref_delta, bytes("extra\n"));
    entries.push_back(Packed{object_id("blob", ref_text), static_cast<std::uint32_t>(pack.size())});
    entry_header(pack, 7, ref_delta.size());
    pack.insert(pack.end(), loose_id.begin(), loose_id.end());
    append(pack, aiblame::fs::z_compress(ref_delta));

    full(2, "tree", tree_payload);
    full(1, "commit", commit_payload);
    const auto trailer = aiblame::sha1(std::span<const std::uint8_t>(pack));
    pack.insert(pack.end(), trailer.begin(), trailer.end());

    std::ranges::sort(entries, [](const Packed &a, const Packed &b) { return a.id < b.id; });
    Bytes idx{0xff, 't', 'O', 'c'};
    put32(idx, 2);
    for (int b = 0; b < 256; ++b) {
      put32(idx, static_cast<std::uint32_t>(std::ranges::count_if(
                     entries, [&](const Packed &e) { return e.id[0] <= b; })));
    }
    for (const auto &e : entries) idx.insert(idx.end(), e.id.begin(), e.id.end());
    for (std::size_t i = 0; i < entries.size(); ++i) put32(idx, 0); // crc32, unchecked
    for (const auto &e : entries) put32(idx, e.offset);
    idx.insert(idx.end(), trailer.begin(), trailer.end());
    const auto idx_sum = aiblame::sha1(std::span<const std::uint8_t>(idx));
    idx.insert(idx.end(), idx_sum.begin(), idx_sum.end());

    const auto pack_dir = objects / "pack";
    aiblame::fs::write_file_atomic(pack_dir / "pack-test.pack", pack);
    aiblame::fs::write_file_atomic(pack_dir / "pack-test.idx", idx);

    const aiblame::Repository repo{sb.root};
    auto text_of = [&](const aiblame::oid &id) {
      const auto data = repo.read_blob(aiblame::to_hex(id));
      return std::string(data.begin(), data.end());
    };
    if (text_of(object_id("blob", base_text)) != base_text) {
      std::cerr << "full packed blob wrong\n";
      return 1;
    }
    if (text_of(ofs_id) != ofs_text) {
      std::cerr << "OFS_DELTA blob wrong\n";
      return 1;
    }
    if (text_of(object_id("blob", ref_text)) != ref_text) {
      std::cerr << "REF_DELTA blob wrong\n";
      return 1;
    }

    // packed commit -> packed tree -> delta blob, and abbreviated lookup
    const auto commit_hex = aiblame::to_hex(object_id("commit", commit_payload));
    if (repo.read_text_at(commit_hex, "f.txt").value_or("") != ofs_text ||
        repo.resolve_commit(commit_hex.substr(0, 8)) != commit_hex ||
        !repo.objects().contains(aiblame::to_hex(tree_id))) {
      std::cerr << "packed history not readable\n";
      return 1;
    }

    // index trailer must match both the index and the pack
    const auto bad_dir = sb.root / "corrupt";
    Bytes flipped = idx;
    flipped[8 + (256 * 4)] ^= 0xff;
    aiblame::fs::write_file_atomic(bad_dir / "pack-a.pack", pack);
    aiblame::fs::write_file_atomic(bad_dir / "pack-a.idx", flipped);
    Bytes other_pack = pack;
    other_pack.back() ^= 0xff;
    aiblame::fs::write_file_atomic(bad_dir / "pack-b.pack", other_pack);
    aiblame::fs::write_file_atomic(bad_dir / "pack-b.idx", idx);
    for (const char *name : {"pack-a.idx", "pack-b.idx"}) {
      bool rejected = false;
      try {
        const aiblame::PackFile corrupt{bad_dir / name};
      } catch (const aiblame::ObjectError &) {
        rejected = true;
      }
      if (!rejected) {
        std::cerr << name << " accepted despite a checksum mismatch\n";
        return 1;
      }
    }

    // malformed delta
    bool threw = false;
    try {
      const Bytes bad{5, 3, 0x90, 9};
      (void)aiblame::apply_delta(aiblame::as_bytes("abcde"), bad);
    } catch (const aiblame::ObjectError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "out-of-range delta copy accepted\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "pack test failed: " << e.what() << "\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
