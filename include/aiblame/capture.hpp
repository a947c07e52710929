#pragma once
#include "aiblame/attribution.hpp"
#include "aiblame/repo.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aiblame::capture {

// Tool name recorded for events that arrive through the editing hook.
inline constexpr std::string_view kDefaultTool = "claude";

struct Edit {
  std::string old_string;
  std::string new_string;
};

// What an editing agent's post-tool hook sends on stdin.
struct HookPayload {
  std::string session_id;
  std::string tool_name;  // Write, Edit, MultiEdit, NotebookEdit
  std::string file_path;
  std::string content;    // Write
  std::vector<Edit> edits; // Edit (one) or MultiEdit (many)
  std::string prompt;
  std::string transcript_path;
  std::string cwd;
};

// Throws CaptureError when `json_text` is not a JSON object.
HookPayload parse_hook_payload(std::string_view json_text);

// Lines `needle` occupies at its first occurrence in `text`, or nullopt if it
// is empty or absent.
std::optional<LineRange> locate_lines(std::string_view text, std::string_view needle);

// Explicit [start, end) for a file of `line_count` lines, with `end` cut back
// to the end of the file. Nullopt when `start` lies past the last line. Throws
// CaptureError for start < 1, start >= end, or numbers beyond int range.
std::optional<LineRange> clamp_range(long long start, long long end, std::size_t line_count);

// Text of the last user message in a transcript (JSON lines); empty if none.
std::string last_user_prompt(const std::filesystem::path& transcript);

// Events for one hook invocation. Unknown tools, files outside the working
// tree and edits that cannot be located produce nothing.
std::vector<CaptureEvent> events_from_payload(const Repository& repo, const HookPayload& payload,
                                              std::string_view tool, std::int64_t now_ms);

} // namespace aiblame::capture
