#include "aiblame/config.hpp"

#include "aiblame/consts.hpp"
#include "aiblame/fs.hpp"
#include "aiblame/util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace {

std::string lower(std::string_view sv) {
  std::string s(sv);
  std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

// "Remote.origin.URL" -> "remote.origin.url": section and name are case-insensitive,
// the subsection is not.
std::string normalize_key(std::string_view key) {
  const auto first = key.find('.');
  const auto last = key.rfind('.');
  if (first == std::string_view::npos) {
    return lower(key);
  }
  if (first == last) {
    return lower(key.substr(0, first)) + "." + lower(key.substr(first + 1));
  }
  return lower(key.substr(0, first)) + std::string(key.substr(first, last - first)) + "." +
         lower(key.substr(last + 1));
}

// Drop a trailing comment and surrounding quotes from a raw value.
std::string clean_value(std::string_view raw) {
  std::string out;
  bool quoted = false;
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c == '"') {
      quoted = !quoted;
      continue;
    }
    if (!quoted && (c == '#' || c == ';'))
      break;
    if (c == '\\' && i + 1 < raw.size()) {
      const char n = raw[++i];
      out.push_back(n == 't' ? '\t' : n == 'n' ? '\n' : n);
      continue;
    }
    out.push_back(c);
  }
  return aiblame::strutil::trim(out);
}

int env_int(const char *name, int fallback) {
  const char *v = std::getenv(name);
  if (v == nullptr || *v == '\0')
    return fallback;
  long long n = 0;
  if (!aiblame::strutil::parse_int(v, n) || n < 0)
    throw std::runtime_error(std::string("invalid number in ") + name + ": " + v);
  return static_cast<int>(n);
}

} // namespace

namespace aiblame {

void GitConfig::load() {
  lines_.clear();
  entries_.clear();
  sections_.clear();
  if (!fs::exists(file_))
    return;

  std::istringstream iss(fs::read_text(file_));
  std::string line;
  std::string section;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    lines_.push_back(line);
    const std::string t = strutil::trim(line);
    if (t.empty() || t[0] == '#' || t[0] == ';')
      continue;

    if (t[0] == '[') {
      const auto close = t.find(']');
      if (close == std::string::npos)
        throw std::runtime_error("bad config section header in " + file_.string() + ": " + t);
      const std::string inner = t.substr(1, close - 1);
      const auto q = inner.find('"');
      if (q != std::string::npos) {
        const auto q2 = inner.rfind('"');
        section = lower(strutil::trim(inner.substr(0, q))) + "." +
                  inner.substr(q + 1, q2 > q ? q2 - q - 1 : std::string::npos);
      } else {
        section = normalize_key(inner);
      }
      sections_.push_back(Section{.key = section, .last_line = lines_.size() - 1});
      continue;
    }

    if (section.empty())
      continue;
    sections_.back().last_line = lines_.size() - 1;
    const auto eq = t.find('=');
    const std::string name = strutil::trim(t.substr(0, eq));
    const std::string value = eq == std::string::npos ? "true" : clean_value(t.substr(eq + 1));
    entries_.push_back(Entry{.key = section + "." + lower(name), .value = value});
  }
}

std::optional<std::string> GitConfig::get(std::string_view key) const {
  auto all = get_all(key);
  if (all.empty())
    return std::nullopt;
  return all.back();
}

std::vector<std::string> GitConfig::get_all(std::string_view key) const {
  const std::string k = normalize_key(key);
  std::vector<std::string> out;
  for (const auto &e : entries_) {
    if (e.key == k)
      out.push_back(e.value);
  }
  return out;
}

bool GitConfig::has_section(std::string_view section_key) const {
  const std::string k = normalize_key(std::string(section_key) + ".x");
  const std::string want = k.substr(0, k.size() - 2);
  return std::ranges::any_of(sections_, [&](const Section &s) { return s.key == want; });
}

void GitConfig::add_value(std::string_view key, std::string_view value) {
  const std::string k = normalize_key(key);
  const auto dot = k.rfind('.');
  if (dot == std::string::npos)
    throw std::runtime_error("config key needs a section: " + std::string(key));
  const std::string section = k.substr(0, dot);
  const std::string name = k.substr(dot + 1);
  const std::string line = "\t" + name + " = " + std::string(value);

  const auto it = std::ranges::find_if(sections_, [&](const Section &s) { return s.key == section; });
  if (it != sections_.end()) {
    lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(it->last_line) + 1, line);
  } else {
    const auto sub = section.find('.');
    if (sub == std::string::npos) {
      lines_.push_back("[" + section + "]");
    } else {
      lines_.push_back("[" + section.substr(0, sub) + " \"" + section.substr(sub + 1) + "\"]");
    }
    lines_.push_back(line);
  }

  std::string text;
  for (const auto &l : lines_) {
    text += l;
    text.push_back('\n');
  }
  fs::write_text_atomic(file_, text);
  load();
}

Identity load_identity(const std::filesystem::path &git_dir) {
  Identity out{};
  GitConfig repo_cfg{git_dir / "config"};
  repo_cfg.load();
  out.name = repo_cfg.get("user.name").value_or("");
  out.email = repo_cfg.get("user.email").value_or("");

  if (out.name.empty() || out.email.empty()) {
    if (const char *home = std::getenv("HOME"); home != nullptr) {
      GitConfig global{std::filesystem::path(home) / ".gitconfig"};
      global.load();
      if (out.name.empty())
        out.name = global.get("user.name").value_or("");
      if (out.email.empty())
        out.email = global.get("user.email").value_or("");
    }
  }
  if (out.name.empty())
    out.name = "ai-blame";
  if (out.email.empty())
    out.email = "ai-blame@localhost";
  return out;
}

Settings load_settings(const std::filesystem::path &git_dir) {
  Settings out{.notes_ref = std::string(consts::kNotesRef),
               .lock_timeout_ms = consts::kDefaultLockTimeoutMs,
               .note_retries = consts::kDefaultNoteRetries};

  const auto path = git_dir / consts::kStateDir / consts::kConfigFile;
  if (fs::exists(path)) {
    std::istringstream iss(fs::read_text(path));

    constexpr std::string_view k_notes_ref = "notes-ref:";
    constexpr std::string_view k_lock_timeout = "lock-timeout-ms:";
    constexpr std::string_view k_note_retries = "note-retries:";

    auto number = [&](std::string_view sv, std::string_view key) {
      long long n = 0;
      const std::string t = strutil::trim(sv);
      if (!strutil::parse_int(t, n) || n < 0)
        throw std::runtime_error(path.string() + ": invalid " + std::string(key) + " " + t);
      return static_cast<int>(n);
    };

    std::string line;
    while (std::getline(iss, line)) {
      std::string_view sv{line};
      if (sv.empty() || sv[0] == '#')
        continue; // allow comments
      if (sv.rfind(k_notes_ref, 0) == 0) {
        out.notes_ref = strutil::trim(sv.substr(k_notes_ref.size()));
      } else if (sv.rfind(k_lock_timeout, 0) == 0) {
        out.lock_timeout_ms = number(sv.substr(k_lock_timeout.size()), k_lock_timeout);
      } else if (sv.rfind(k_note_retries, 0) == 0) {
        out.note_retries = number(sv.substr(k_note_retries.size()), k_note_retries);
      }
    }
  }

  if (const char *ref = std::getenv("AI_BLAME_NOTES_REF"); ref != nullptr && *ref != '\0')
    out.notes_ref = ref;
  out.lock_timeout_ms = env_int("AI_BLAME_LOCK_TIMEOUT_MS", out.lock_timeout_ms);

  if (out.notes_ref.rfind("refs/notes/", 0) != 0)
    throw std::runtime_error("notes-ref must live under refs/notes/: " + out.notes_ref);
  if (out.note_retries < 1)
    out.note_retries = 1;
  return out;
}

} // namespace aiblame
