#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aiblame {

struct Identity {
  std::string name;
  std::string email;
};

// Tunables read from .git/ai-blame/config ("key: value" lines) and the environment.
struct Settings {
  std::string notes_ref;
  int lock_timeout_ms;
  int note_retries;
};

// Minimal reader/writer for git's INI-style config files.
// Keys are addressed as "section.name" or "section.subsection.name".
class GitConfig {
public:
  explicit GitConfig(std::filesystem::path file) : file_(std::move(file)) {}

  // Parse the file if it exists (no throw if missing)
  void load();

  [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
  [[nodiscard]] std::vector<std::string> get_all(std::string_view key) const;
  [[nodiscard]] bool has_section(std::string_view section_key) const;

  // Append one value under its section (created if missing) and save atomically.
  void add_value(std::string_view key, std::string_view value);

private:
  struct Entry {
    std::string key;  // normalized "section[.subsection].name"
    std::string value;
  };
  struct Section {
    std::string key;       // normalized "section[.subsection]"
    std::size_t last_line; // index of the last line belonging to the section
  };

  std::filesystem::path file_;
  std::vector<std::string> lines_;
  std::vector<Entry> entries_;
  std::vector<Section> sections_;
};

// user.name/user.email from the repository config, then ~/.gitconfig, then a fallback.
Identity load_identity(const std::filesystem::path& git_dir);

// Read .git/ai-blame/config; missing file means defaults. Bad numbers throw.
Settings load_settings(const std::filesystem::path& git_dir);

} // namespace aiblame
