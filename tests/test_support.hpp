#pragma once
// Throw-away repositories for the tests. History is written with the library's
// own object writer, so no git binary is needed.

#include "aiblame/config.hpp"
#include "aiblame/consts.hpp"
#include "aiblame/refs.hpp"
#include "aiblame/repo.hpp"
#include "aiblame/util.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace testsupport {

namespace fs = std::filesystem;

inline void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

// Symbolic ref file "ref: <target>" under the git dir.
inline void write_symbolic_ref(const fs::path &git_dir, const std::string &name,
                               const std::string &target) {
  write_file(git_dir / name, "ref: " + target + "\n");
}

// Empty repository with HEAD on an unborn master branch.
inline fs::path make_repo(const std::string &tag) {
  const fs::path root =
      fs::temp_directory_path() / ("aiblame_" + tag + "_" + std::to_string(std::random_device{}()));
  fs::create_directories(root / ".git" / "objects");
  fs::create_directories(root / ".git" / "refs" / "heads");
  write_file(root / ".git" / "HEAD", "ref: refs/heads/master\n");
  return root;
}

// Removes the sandbox when the test returns.
struct Sandbox {
  explicit Sandbox(const std::string &tag) : root(make_repo(tag)) {}
  Sandbox(const Sandbox &) = delete;
  Sandbox &operator=(const Sandbox &) = delete;
  ~Sandbox() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }
  fs::path root;
};

inline aiblame::Settings default_settings() {
  return aiblame::Settings{.notes_ref = std::string(aiblame::consts::kNotesRef),
                           .lock_timeout_ms = aiblame::consts::kDefaultLockTimeoutMs,
                           .note_retries = aiblame::consts::kDefaultNoteRetries};
}

// "<prefix> <n>\n" for n in [from, to].
inline std::string numbered_lines(int from, int to, std::string_view prefix = "line") {
  std::string out;
  for (int i = from; i <= to; ++i) {
    out.append(prefix);
    out += " " + std::to_string(i) + "\n";
  }
  return out;
}

using Files = std::map<std::string, std::string>; // path -> content

// Commit `files` (the complete tree) on top of `parents` with committer time
// `when`, and move master to it.
inline std::string commit(const aiblame::Repository &repo, const Files &files,
                          const std::vector<std::string> &parents, std::int64_t when,
                          std::string_view message = "test\n") {
  aiblame::PathOidMap tree;
  for (const auto &[path, text] : files) {
    tree[path] = repo.write_blob(aiblame::as_bytes(text));
  }
  const std::string sig = "Test User <test@example.com> " + std::to_string(when) + " +0000";
  const std::string hex =
      repo.write_commit(repo.write_tree_from_map(tree), parents, sig, sig, message);
  const auto old = aiblame::read_ref(repo.git_dir(), "refs/heads/master");
  aiblame::update_ref(repo.git_dir(), "refs/heads/master", hex, old);
  return hex;
}

} // namespace testsupport
