#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace aiblame {

// Write-once side table of prompt text keyed by its SHA-256 digest, stored
// under .git/ai-blame/prompts/<2 hex>/<62 hex>.
class PromptStore {
public:
  explicit PromptStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

  // Store `text` unless already present; returns its digest. Empty text has
  // no digest and stores nothing.
  std::string put(std::string_view text) const;

  [[nodiscard]] std::optional<std::string> get(std::string_view digest) const;

private:
  [[nodiscard]] std::filesystem::path path_for(std::string_view digest) const;

  std::filesystem::path dir_;
};

} // namespace aiblame
