#pragma once
#include "aiblame/consts.hpp"
#include "aiblame/hash.hpp"
#include "aiblame/object_store.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace aiblame {

struct TreeEntry {
  std::uint32_t mode; // e.g., consts::kModeFile file, 040000 dir (octal)
  std::string name;   // filename (no '/')
  oid id;             // 20-byte raw SHA-1 of referenced object
};

using PathOidMap = std::map<std::string, std::string>; // path -> 40-hex blob id

class Repository {
public:
  // Open the repository whose working tree is `root` (root/.git must exist,
  // either as a directory or as a "gitdir:" file).
  explicit Repository(std::filesystem::path root);

  // Walk up from `start` to the first directory containing .git.
  // Throws NotARepositoryError when there is none.
  static Repository discover(const std::filesystem::path& start);

  // Core paths
  [[nodiscard]] const std::filesystem::path& root() const { return root_; }
  [[nodiscard]] const std::filesystem::path& git_dir() const { return git_dir_; }
  // Shared dir of linked worktrees (objects, refs); equal to git_dir() otherwise
  [[nodiscard]] const std::filesystem::path& common_dir() const { return common_dir_; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return common_dir_ / consts::kObjectsDir;
  }
  [[nodiscard]] auto hooks_dir() const -> std::filesystem::path {
    return common_dir_ / consts::kHooksDir;
  }
  [[nodiscard]] auto state_dir() const -> std::filesystem::path {
    return git_dir_ / consts::kStateDir;
  }
  [[nodiscard]] auto config_file() const -> std::filesystem::path {
    return common_dir_ / "config";
  }

  [[nodiscard]] const ObjectStore& objects() const { return store_; }

  // Object plumbing
  [[nodiscard]] auto write_blob(std::span<const std::uint8_t> bytes) const -> std::string;
  std::vector<std::uint8_t> read_blob(std::string_view hex_oid) const;

  [[nodiscard]] auto write_tree(const std::vector<TreeEntry>& entries) const -> std::string;
  std::vector<TreeEntry> read_tree(std::string_view hex_oid) const;

  [[nodiscard]] auto write_commit(std::string_view tree_hex,
                                  const std::vector<std::string>& parent_hexes,
                                  std::string_view author_line, std::string_view committer_line,
                                  std::string_view message) const -> std::string;

  struct CommitInfo {
    std::string tree_hex;
    std::vector<std::string> parents; // zero or more parents (40-hex each)
    std::string author;               // full author line after "author "
    std::string committer;            // full committer line
    std::int64_t commit_time = 0;     // committer epoch seconds
    std::string message;              // raw message (may contain newlines)
  };

  // Read and parse a commit object into headers + message.
  [[nodiscard]] auto read_commit(std::string_view commit_hex) const -> CommitInfo;

  // Recursive path -> blob map of a tree (submodule entries skipped).
  [[nodiscard]] auto tree_to_map(std::string_view tree_hex) const -> PathOidMap;

  // Build nested trees from a path -> blob map; returns the root tree id.
  [[nodiscard]] auto write_tree_from_map(const PathOidMap& files) const -> std::string;

  // Blob id of `path` inside `tree_hex`, if present.
  [[nodiscard]] auto blob_at(std::string_view tree_hex, std::string_view path) const
      -> std::optional<std::string>;

  // Text of `path` at `commit_hex`, if the file exists there.
  [[nodiscard]] auto read_text_at(std::string_view commit_hex, std::string_view path) const
      -> std::optional<std::string>;

  // Commit HEAD points at; empty on an unborn branch.
  [[nodiscard]] auto head_commit() const -> std::optional<std::string>;

  // Resolve HEAD, names, (abbreviated) ids and ~N/^N/^{commit} suffixes to a commit.
  // Throws RevisionError.
  [[nodiscard]] auto resolve_commit(std::string_view rev) const -> std::string;

  // Commits selected by "A..B" (reachable from B, not from A) or by a single
  // revision (it and its ancestors). Each commit appears once, newest first.
  [[nodiscard]] auto rev_list(std::string_view range) const -> std::vector<std::string>;

  // Repository-relative "/"-separated path for a working-tree path, or empty
  // if it lies outside the working tree.
  [[nodiscard]] auto relative_path(const std::filesystem::path& p) const -> std::string;

private:
  Repository(std::filesystem::path root, std::filesystem::path git_dir);

  [[nodiscard]] auto resolve_object(std::string_view rev) const -> std::string;
  [[nodiscard]] auto resolve_base(std::string_view name) const -> std::optional<std::string>;
  [[nodiscard]] auto peel_to_commit(std::string hex, std::string_view rev) const -> std::string;
  [[nodiscard]] auto ancestors(std::string_view tip) const -> std::vector<std::string>;

  static auto mode_to_ascii_octal(std::uint32_t mode) -> std::string;
  static auto ascii_octal_to_mode(std::string_view str) -> std::uint32_t;

  std::filesystem::path root_;
  std::filesystem::path git_dir_;
  std::filesystem::path common_dir_;
  ObjectStore store_;
};

} // namespace aiblame
