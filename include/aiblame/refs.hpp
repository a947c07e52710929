#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace aiblame {

// Read HEAD file as raw string (e.g., "ref: refs/heads/main\n" or a 40-hex id).
// Returns std::nullopt if HEAD does not exist.
std::optional<std::string> read_HEAD(const std::filesystem::path& git_dir);

// refname -> 40-hex from the packed-refs file (peel lines skipped).
std::map<std::string, std::string> read_packed_refs(const std::filesystem::path& git_dir);

// Resolve a full ref name (e.g., "refs/heads/main") to a 40-hex id: loose file
// first, then packed-refs; symbolic refs are followed. std::nullopt if missing.
std::optional<std::string> read_ref(const std::filesystem::path& git_dir, const std::string& refname);

// Compare-and-swap update of a ref under "<ref>.lock". `expected_old` empty means
// the ref must not exist yet. Throws RefConflictError if the lock is held or the
// ref no longer has the expected value.
void update_ref(const std::filesystem::path& git_dir, const std::string& refname,
                const std::string& new_hex, const std::optional<std::string>& expected_old);

} // namespace aiblame
