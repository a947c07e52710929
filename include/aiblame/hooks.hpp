#pragma once
#include "aiblame/config.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace aiblame::hooks {

enum class HookInstall { Created, Appended, AlreadyPresent };

// Make `hooks_dir/name` run `invocation` (e.g. "ai-blame post-commit") with
// failures swallowed. An existing foreign hook gets our snippet appended.
HookInstall install_hook(const std::filesystem::path& hooks_dir, std::string_view name,
                         std::string_view invocation);

// Add push/fetch refspecs for `notes_ref` to remote.origin when that remote
// exists. Returns the refspecs that were added.
std::vector<std::string> configure_notes_refspecs(GitConfig& config, std::string_view notes_ref);

} // namespace aiblame::hooks
