#include "aiblame/repo.hpp"

#include "aiblame/consts.hpp"
#include "aiblame/errors.hpp"
#include "aiblame/fs.hpp"
#include "aiblame/refs.hpp"
#include "aiblame/time.hpp"
#include "aiblame/util.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;
namespace gfs   = aiblame::fs;

namespace {

[[nodiscard]] auto split_first(std::string_view path)
    -> std::pair<std::string, std::string> {
  const std::size_t pos = path.find('/');
  if (pos == std::string_view::npos) {
    return {std::string(path), std::string{}};
  }
  return {std::string(path.substr(0, pos)), std::string(path.substr(pos + 1))};
}

// "<git dir>" for a working tree: .git itself, or the target of a "gitdir:" file.
[[nodiscard]] auto locate_git_dir(const stdfs::path& root) -> std::optional<stdfs::path> {
  const auto dot_git = root / aiblame::consts::kGitDir;
  std::error_code ec;
  if (stdfs::is_directory(dot_git, ec)) {
    return dot_git;
  }
  if (stdfs::is_regular_file(dot_git, ec)) {
    std::string text = gfs::read_text(dot_git);
    aiblame::strutil::rstrip_newlines(text);
    if (text.rfind(aiblame::consts::kGitdirPrefix, 0) != 0) {
      return std::nullopt;
    }
    stdfs::path target = text.substr(aiblame::consts::kGitdirPrefix.size());
    if (target.is_relative()) {
      target = root / target;
    }
    return target.lexically_normal();
  }
  return std::nullopt;
}

[[nodiscard]] auto common_dir_of(const stdfs::path& git_dir) -> stdfs::path {
  const auto commondir = git_dir / "commondir";
  if (!gfs::exists(commondir)) {
    return git_dir;
  }
  std::string text = gfs::read_text(commondir);
  aiblame::strutil::rstrip_newlines(text);
  stdfs::path p = text;
  if (p.is_relative()) {
    p = git_dir / p;
  }
  p = p.lexically_normal();
  return p.has_filename() ? p : p.parent_path(); // "a/b/.." normalizes to "a/"
}

// Git orders tree entries as if directory names had a trailing '/'.
[[nodiscard]] auto tree_sort_key(const aiblame::TreeEntry& e) -> std::string {
  return e.mode == aiblame::consts::kModeTree ? e.name + "/" : e.name;
}

} // namespace

namespace aiblame {

Repository::Repository(stdfs::path root, stdfs::path git_dir)
    : root_(std::move(root)), git_dir_(std::move(git_dir)), common_dir_(common_dir_of(git_dir_)),
      store_(common_dir_ / consts::kObjectsDir) {}

Repository::Repository(stdfs::path root)
    : Repository(root, locate_git_dir(root).value_or(root / consts::kGitDir)) {}

Repository Repository::discover(const stdfs::path& start) {
  std::error_code ec;
  stdfs::path dir = stdfs::weakly_canonical(start, ec);
  if (ec) {
    dir = stdfs::absolute(start);
  }
  for (;;) {
    if (const auto gd = locate_git_dir(dir)) {
      return Repository{dir, *gd};
    }
    if (!dir.has_parent_path() || dir.parent_path() == dir) {
      break;
    }
    dir = dir.parent_path();
  }
  throw NotARepositoryError(start.string());
}

// Modes

auto Repository::mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

auto Repository::ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      break;
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

// Blobs

auto Repository::write_blob(std::span<const std::uint8_t> bytes) const -> std::string {
  return store_.write(consts::kTypeBlob, bytes);
}

auto Repository::read_blob(std::string_view hex_oid) const -> std::vector<std::uint8_t> {
  auto [type, data] = store_.read(hex_oid);
  if (type != consts::kTypeBlob) {
    throw ObjectError("object is not a blob: " + std::string(hex_oid));
  }
  return std::move(data);
}

// Trees (binary)

auto Repository::write_tree(const std::vector<TreeEntry>& entries_in) const -> std::string {
  auto entries = entries_in;
  std::ranges::sort(entries, [](const TreeEntry& a, const TreeEntry& b) {
    return tree_sort_key(a) < tree_sort_key(b);
  });

  std::string data;
  for (const auto& e : entries) {
    const std::string mode = mode_to_ascii_octal(e.mode);
    data.append(mode);
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char*>(e.id.data()),
                static_cast<std::size_t>(consts::kOidRawLen));
  }
  return store_.write(consts::kTypeTree, as_bytes(data));
}

auto Repository::read_tree(std::string_view hex_oid) const -> std::vector<TreeEntry> {
  const auto [type, data] = store_.read(hex_oid);
  if (type != consts::kTypeTree) {
    throw ObjectError("object is not a tree: " + std::string(hex_oid));
  }

  std::vector<TreeEntry> out;
  auto p   = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw ObjectError("tree parse: expected space");
    }
    const std::string mode_str(p, q_space);
    const std::uint32_t mode = ascii_octal_to_mode(mode_str);

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw ObjectError("tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw ObjectError("tree parse: truncated oid");
    }

    TreeEntry e{};
    e.mode = mode;
    e.name = std::move(name);
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(e));
  }
  return out;
}

// Commits

auto Repository::write_commit(std::string_view tree_hex,
                              const std::vector<std::string>& parent_hexes,
                              std::string_view author_line,
                              std::string_view committer_line,
                              std::string_view message) const -> std::string {
  std::string txt;

  txt += std::string(consts::kTreePrefix);
  txt += std::string(tree_hex);
  txt += '\n';

  for (const auto& p : parent_hexes) {
    txt += std::string(consts::kParentPrefix);
    txt += p;
    txt += '\n';
  }

  txt += std::string(consts::kAuthorPrefix);
  txt += std::string(author_line);
  txt += '\n';

  txt += std::string(consts::kCommitterPrefix);
  txt += std::string(committer_line);
  txt += "\n\n";

  txt += std::string(message);

  return store_.write(consts::kTypeCommit, as_bytes(txt));
}

auto Repository::read_commit(std::string_view commit_hex) const -> CommitInfo {
  const auto obj = store_.read(commit_hex);
  if (obj.type != consts::kTypeCommit) {
    throw ObjectError("object is not a commit: " + std::string(commit_hex));
  }
  const std::string text(obj.data.begin(), obj.data.end());

  CommitInfo info{};
  std::size_t pos = 0;

  for (;;) {
    const std::size_t nl = text.find('\n', pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);

    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }

    if (line.rfind(consts::kTreePrefix, 0) == 0) {
      info.tree_hex = line.substr(consts::kTreePrefix.size(), consts::kOidHexLen);
    } else if (line.rfind(consts::kParentPrefix, 0) == 0) {
      info.parents.push_back(line.substr(consts::kParentPrefix.size(), consts::kOidHexLen));
    } else if (line.rfind(consts::kAuthorPrefix, 0) == 0) {
      info.author = line.substr(consts::kAuthorPrefix.size());
    } else if (line.rfind(consts::kCommitterPrefix, 0) == 0) {
      info.committer = line.substr(consts::kCommitterPrefix.size());
      if (const auto t = timeutil::signature_epoch(info.committer)) {
        info.commit_time = *t;
      }
    }

    if (nl == std::string::npos) break;
    pos = nl + 1;
  }

  if (info.tree_hex.size() != consts::kOidHexLen) {
    throw ObjectError("commit missing tree: " + std::string(commit_hex));
  }
  return info;
}

// Tree <-> path maps

auto Repository::tree_to_map(std::string_view tree_hex) const -> PathOidMap {
  PathOidMap out;
  const auto walk = [&](const auto& self, std::string_view hex, const std::string& prefix) -> void {
    for (const auto& e : read_tree(hex)) {
      if (e.mode == consts::kModeTree) {
        self(self, to_hex(e.id), prefix + e.name + "/");
      } else if (e.mode != consts::kModeGitlink) {
        out[prefix + e.name] = to_hex(e.id);
      }
    }
  };
  walk(walk, tree_hex, "");
  return out;
}

auto Repository::write_tree_from_map(const PathOidMap& files) const -> std::string {
  const auto build = [&](const auto& self, const PathOidMap& group) -> std::string {
    std::map<std::string, PathOidMap> subdirs; // dirname -> child entries
    std::vector<TreeEntry> tree_entries;

    for (const auto& [path, hex] : group) {
      const auto [first, rest] = split_first(path);
      if (rest.empty()) {
        TreeEntry te{};
        te.mode = consts::kModeFile;
        te.name = first;
        if (!from_hex(hex, te.id)) {
          throw ObjectError("bad blob hex oid for " + path);
        }
        tree_entries.push_back(std::move(te));
      } else {
        subdirs[first][rest] = hex;
      }
    }

    for (const auto& [dirname, children] : subdirs) {
      TreeEntry te{};
      te.mode = consts::kModeTree;
      te.name = dirname;
      if (!from_hex(self(self, children), te.id)) {
        throw ObjectError("bad subtree hex oid");
      }
      tree_entries.push_back(std::move(te));
    }

    return write_tree(tree_entries);
  };

  return build(build, files);
}

auto Repository::blob_at(std::string_view tree_hex, std::string_view path) const
    -> std::optional<std::string> {
  std::string cur(tree_hex);
  std::string_view rest = path;
  for (;;) {
    const auto [first, remainder] = split_first(rest);
    const auto entries = read_tree(cur);
    const auto it = std::ranges::find_if(entries, [&](const TreeEntry& e) { return e.name == first; });
    if (it == entries.end()) {
      return std::nullopt;
    }
    if (remainder.empty()) {
      if (it->mode == consts::kModeTree || it->mode == consts::kModeGitlink) {
        return std::nullopt;
      }
      return to_hex(it->id);
    }
    if (it->mode != consts::kModeTree) {
      return std::nullopt;
    }
    cur = to_hex(it->id);
    rest = path.substr(path.size() - remainder.size());
  }
}

auto Repository::read_text_at(std::string_view commit_hex, std::string_view path) const
    -> std::optional<std::string> {
  const auto info = read_commit(commit_hex);
  const auto blob = blob_at(info.tree_hex, path);
  if (!blob) {
    return std::nullopt;
  }
  const auto bytes = read_blob(*blob);
  return std::string(bytes.begin(), bytes.end());
}

// Revisions

auto Repository::head_commit() const -> std::optional<std::string> {
  auto head_txt = read_HEAD(git_dir_);
  if (!head_txt) {
    return std::nullopt;
  }
  strutil::rstrip_newlines(*head_txt);
  if (head_txt->rfind(consts::kRefPrefix, 0) == 0) {
    return read_ref(common_dir_, head_txt->substr(consts::kRefPrefix.size()));
  }
  if (looks_hex40(*head_txt)) {
    return *head_txt;
  }
  return std::nullopt;
}

auto Repository::resolve_base(std::string_view name) const -> std::optional<std::string> {
  if (name.empty() || name == "HEAD" || name == "@") {
    return head_commit();
  }
  std::string lowered(name);
  std::ranges::transform(lowered, lowered.begin(),
                         [](unsigned char c) { return std::tolower(c); });
  if (looks_hex40(lowered) && store_.contains(lowered)) {
    return lowered;
  }

  const std::string n(name);
  const std::vector<std::string> candidates = {
      n, "refs/" + n, "refs/tags/" + n, "refs/heads/" + n, "refs/remotes/" + n,
      "refs/remotes/" + n + "/HEAD"};
  for (const auto& c : candidates) {
    if (c.rfind("refs/", 0) != 0) {
      continue;
    }
    if (auto hex = read_ref(common_dir_, c)) {
      return hex;
    }
  }

  if (lowered.size() >= consts::kMinAbbrevLen && looks_hex(lowered)) {
    const auto matches = store_.find_prefix(lowered);
    if (matches.size() > 1) {
      throw RevisionError(n + " (ambiguous abbreviation)");
    }
    if (matches.size() == 1) {
      return matches.front();
    }
  }
  return std::nullopt;
}

auto Repository::peel_to_commit(std::string hex, std::string_view rev) const -> std::string {
  for (int depth = 0; depth < 16; ++depth) {
    const auto obj = store_.read(hex);
    if (obj.type == consts::kTypeCommit) {
      return hex;
    }
    if (obj.type != consts::kTypeTag) {
      throw RevisionError(std::string(rev) + " (not a commit)");
    }
    const std::string text(obj.data.begin(), obj.data.end());
    if (text.rfind(consts::kObjectPrefix, 0) != 0) {
      throw ObjectError("tag without object line: " + hex);
    }
    hex = text.substr(consts::kObjectPrefix.size(), consts::kOidHexLen);
  }
  throw RevisionError(std::string(rev) + " (tag chain too deep)");
}

auto Repository::resolve_object(std::string_view rev) const -> std::string {
  const std::size_t op_pos = std::min(rev.find_first_of("~^"), rev.size());
  auto base = resolve_base(rev.substr(0, op_pos));
  if (!base) {
    throw RevisionError(std::string(rev));
  }
  std::string hex = *base;

  std::size_t pos = op_pos;
  while (pos < rev.size()) {
    const char op = rev[pos++];
    if (op == '^' && pos < rev.size() && rev[pos] == '{') {
      const auto close = rev.find('}', pos);
      if (close == std::string_view::npos) {
        throw RevisionError(std::string(rev));
      }
      const auto inner = rev.substr(pos + 1, close - pos - 1);
      if (inner != "commit" && !inner.empty()) {
        throw RevisionError(std::string(rev) + " (unsupported peel)");
      }
      hex = peel_to_commit(hex, rev);
      pos = close + 1;
      continue;
    }

    std::size_t digits_end = pos;
    while (digits_end < rev.size() && std::isdigit(static_cast<unsigned char>(rev[digits_end]))) {
      ++digits_end;
    }
    long long n = 1;
    if (digits_end > pos && !strutil::parse_int(rev.substr(pos, digits_end - pos), n)) {
      throw RevisionError(std::string(rev));
    }
    pos = digits_end;

    if (op == '~') {
      for (long long i = 0; i < n; ++i) {
        const auto info = read_commit(peel_to_commit(hex, rev));
        if (info.parents.empty()) {
          throw RevisionError(std::string(rev) + " (history is too short)");
        }
        hex = info.parents.front();
      }
    } else if (op == '^') {
      hex = peel_to_commit(hex, rev);
      if (n == 0) {
        continue;
      }
      const auto info = read_commit(hex);
      if (static_cast<std::size_t>(n) > info.parents.size()) {
        throw RevisionError(std::string(rev) + " (no such parent)");
      }
      hex = info.parents[static_cast<std::size_t>(n - 1)];
    } else {
      throw RevisionError(std::string(rev));
    }
  }
  return hex;
}

auto Repository::resolve_commit(std::string_view rev) const -> std::string {
  try {
    return peel_to_commit(resolve_object(rev), rev);
  } catch (const ObjectError&) {
    throw RevisionError(std::string(rev));
  }
}

auto Repository::ancestors(std::string_view tip) const -> std::vector<std::string> {
  std::vector<std::string> out;
  std::vector<std::string> stack{std::string(tip)};
  std::set<std::string> seen;
  while (!stack.empty()) {
    const auto cur = stack.back();
    stack.pop_back();
    if (!seen.insert(cur).second) continue;
    out.push_back(cur);
    const auto info = read_commit(cur);
    for (const auto& p : info.parents) stack.push_back(p);
  }
  return out;
}

auto Repository::rev_list(std::string_view range) const -> std::vector<std::string> {
  std::set<std::string> excluded;
  std::string tip;
  if (const auto dots = range.find(".."); dots != std::string_view::npos) {
    const auto left = range.substr(0, dots);
    const auto right = range.substr(dots + 2);
    const auto base = resolve_commit(left.empty() ? "HEAD" : left);
    tip = resolve_commit(right.empty() ? "HEAD" : right);
    for (auto& c : ancestors(base)) excluded.insert(std::move(c));
  } else {
    tip = resolve_commit(range);
  }

  std::vector<std::pair<std::int64_t, std::string>> timed;
  for (auto& c : ancestors(tip)) {
    if (excluded.contains(c)) continue;
    const auto t = read_commit(c).commit_time;
    timed.emplace_back(t, std::move(c));
  }
  std::ranges::stable_sort(timed, [](const auto& a, const auto& b) { return a.first > b.first; });

  std::vector<std::string> out;
  out.reserve(timed.size());
  for (auto& [_, c] : timed) out.push_back(std::move(c));
  return out;
}

auto Repository::relative_path(const stdfs::path& p) const -> std::string {
  std::error_code ec;
  const auto abs = p.is_relative() ? stdfs::current_path() / p : p;
  const auto full = stdfs::weakly_canonical(abs, ec);
  const auto base = stdfs::weakly_canonical(root_, ec);
  const auto rel = (ec ? abs : full).lexically_relative(base);
  const std::string s = rel.generic_string();
  if (s.empty() || s == "." || s.rfind("..", 0) == 0) {
    return {};
  }
  return s;
}

} // namespace aiblame
