#include "aiblame/prompt_store.hpp"

#include "aiblame/fs.hpp"
#include "aiblame/hash.hpp"
#include "aiblame/util.hpp"

#include <stdexcept>

namespace aiblame {

std::filesystem::path PromptStore::path_for(std::string_view digest) const {
  if (digest.size() < 3 || !looks_hex(digest)) {
    throw std::runtime_error("bad prompt digest: " + std::string(digest));
  }
  return dir_ / std::string(digest.substr(0, 2)) / std::string(digest.substr(2));
}

std::string PromptStore::put(std::string_view text) const {
  if (text.empty()) {
    return {};
  }
  std::string digest = sha256_hex(text);
  const auto p = path_for(digest);
  if (!fs::exists(p)) {
    fs::write_text_atomic(p, text);
  }
  return digest;
}

std::optional<std::string> PromptStore::get(std::string_view digest) const {
  if (digest.empty()) {
    return std::nullopt;
  }
  const auto p = path_for(digest);
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  return fs::read_text(p);
}

} // namespace aiblame
