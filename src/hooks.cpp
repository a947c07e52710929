#include "aiblame/hooks.hpp"

#include "aiblame/fs.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace aiblame::hooks {

namespace {

std::string snippet(std::string_view invocation) {
  std::string s = "# ai-blame\nif command -v ai-blame >/dev/null 2>&1; then\n    ";
  s.append(invocation);
  s += " || true\nfi\n";
  return s;
}

} // namespace

HookInstall install_hook(const std::filesystem::path &hooks_dir, std::string_view name,
                         std::string_view invocation) {
  const auto path = hooks_dir / name;
  HookInstall result = HookInstall::Created;
  std::string text;
  if (fs::exists(path)) {
    text = fs::read_text(path);
    if (text.find("ai-blame") != std::string::npos) {
      return HookInstall::AlreadyPresent;
    }
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) text.pop_back();
    text += "\n\n" + snippet(invocation);
    result = HookInstall::Appended;
  } else {
    text = "#!/bin/sh\n" + snippet(invocation);
  }
  fs::write_text_atomic(path, text);

  std::error_code ec;
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec |
                                   std::filesystem::perms::others_read |
                                   std::filesystem::perms::others_exec,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    throw std::runtime_error("cannot make " + path.string() + " executable: " + ec.message());
  }
  return result;
}

std::vector<std::string> configure_notes_refspecs(GitConfig &config, std::string_view notes_ref) {
  std::vector<std::string> added;
  if (!config.has_section("remote.origin")) {
    return added;
  }
  const std::string ref(notes_ref);
  const std::pair<const char *, std::string> wanted[] = {
      {"remote.origin.push", ref},
      {"remote.origin.fetch", "+" + ref + ":" + ref},
  };
  for (const auto &[key, spec] : wanted) {
    const auto have = config.get_all(key);
    if (std::ranges::find(have, spec) != have.end()) continue;
    config.add_value(key, spec);
    added.push_back(spec);
  }
  return added;
}

} // namespace aiblame::hooks
