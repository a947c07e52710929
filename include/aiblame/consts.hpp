#pragma once
#include <cstdint>
#include <string_view>

namespace aiblame::consts {

// Directory and file names
inline constexpr std::string_view kGitDir      = ".git";
inline constexpr std::string_view kObjectsDir  = "objects";
inline constexpr std::string_view kPackDir     = "pack";
inline constexpr std::string_view kHeadFile    = "HEAD";
inline constexpr std::string_view kPackedRefs  = "packed-refs";
inline constexpr std::string_view kHooksDir    = "hooks";
inline constexpr std::string_view kLockSuffix  = ".lock";

// ai-blame private state under the git dir
inline constexpr std::string_view kStateDir    = "ai-blame";
inline constexpr std::string_view kPendingFile = "pending.jsonl";
inline constexpr std::string_view kPendingLock = "pending.lock";
inline constexpr std::string_view kPromptsDir  = "prompts";
inline constexpr std::string_view kConfigFile  = "config";
inline constexpr std::string_view kOrphanPrefix = "orphaned-";

// Notes namespace
inline constexpr std::string_view kNotesRef     = "refs/notes/ai-blame";
inline constexpr std::string_view kNotesMessage = "Notes added by 'ai-blame'\n";

// Git object type strings
inline constexpr std::string_view kTypeBlob    = "blob";
inline constexpr std::string_view kTypeTree    = "tree";
inline constexpr std::string_view kTypeCommit  = "commit";
inline constexpr std::string_view kTypeTag     = "tag";

// File modes (octal)
inline constexpr std::uint32_t kModeFile = 0100644; // regular file
inline constexpr std::uint32_t kModeTree = 0040000; // directory entry in tree
inline constexpr std::uint32_t kModeGitlink = 0160000; // submodule

// Object ID sizes
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)
inline constexpr std::size_t kMinAbbrevLen = 4;

// Object store fanout
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in .git/objects

// Commit header prefixes (used in parsing/formatting)
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kGitdirPrefix    = "gitdir: ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";
inline constexpr std::string_view kObjectPrefix    = "object ";

// Common characters
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';

// Defaults
inline constexpr int kDefaultLockTimeoutMs = 5000;
inline constexpr int kDefaultNoteRetries   = 5;

} // namespace aiblame::consts
