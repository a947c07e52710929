#include "aiblame/refs.hpp"

#include "aiblame/consts.hpp"
#include "aiblame/errors.hpp"
#include "aiblame/fs.hpp"
#include "aiblame/util.hpp"

#include <sstream>
#include <string>
#include <string_view>

namespace aiblame {

static std::filesystem::path ref_path(const std::filesystem::path &git_dir,
                                      const std::string &refname) {
  return git_dir / refname;
}

std::optional<std::string> read_HEAD(const std::filesystem::path &git_dir) {
  const auto head = git_dir / consts::kHeadFile;
  if (!fs::exists(head)) {
    return std::nullopt;
  }
  return fs::read_text(head);
}

std::map<std::string, std::string> read_packed_refs(const std::filesystem::path &git_dir) {
  std::map<std::string, std::string> out;
  const auto p = git_dir / consts::kPackedRefs;
  if (!fs::exists(p)) {
    return out;
  }
  std::istringstream iss(fs::read_text(p));
  std::string line;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    if (line.empty() || line[0] == '#' || line[0] == '^') {
      continue; // header, or peeled value of the previous tag
    }
    const auto sp = line.find(consts::kSpace);
    if (sp == std::string::npos || !looks_hex40(std::string_view(line).substr(0, sp))) {
      continue;
    }
    out[line.substr(sp + 1)] = line.substr(0, sp);
  }
  return out;
}

static std::optional<std::string> read_ref_depth(const std::filesystem::path &git_dir,
                                                 const std::string &refname, int depth) {
  if (depth > 5) {
    throw std::runtime_error("symbolic ref loop at " + refname);
  }
  const auto p = ref_path(git_dir, refname);
  if (fs::exists(p) && std::filesystem::is_regular_file(p)) {
    std::string s = fs::read_text(p);
    strutil::rstrip_newlines(s);
    if (s.rfind(consts::kRefPrefix, 0) == 0) {
      return read_ref_depth(git_dir, s.substr(consts::kRefPrefix.size()), depth + 1);
    }
    if (looks_hex40(s)) {
      return s;
    }
    return std::nullopt;
  }
  const auto packed = read_packed_refs(git_dir);
  if (const auto it = packed.find(refname); it != packed.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<std::string> read_ref(const std::filesystem::path &git_dir,
                                    const std::string &refname) {
  return read_ref_depth(git_dir, refname, 0);
}

void update_ref(const std::filesystem::path &git_dir, const std::string &refname,
                const std::string &new_hex, const std::optional<std::string> &expected_old) {
  const auto p = ref_path(git_dir, refname);
  auto lock_path = p;
  lock_path += consts::kLockSuffix;

  auto lock = fs::LockFile::try_acquire(lock_path);
  if (!lock) {
    throw RefConflictError("ref " + refname + " is locked; remove " + lock_path.string() +
                           " if no other writer is running");
  }
  const auto current = read_ref(git_dir, refname);
  if (current != expected_old) {
    throw RefConflictError("ref " + refname + " moved (expected " +
                           expected_old.value_or("nothing") + ", found " +
                           current.value_or("nothing") + ")");
  }
  lock->write(new_hex + "\n");
  lock->commit_to(p);
}

} // namespace aiblame
