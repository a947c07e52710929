#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aiblame {

enum class ContributorKind : std::uint8_t { Ai, Human };

std::string_view to_string(ContributorKind kind);
std::optional<ContributorKind> parse_contributor_kind(std::string_view text);

// 1-indexed, end-exclusive line range.
struct LineRange {
  int start = 0;
  int end = 0;

  [[nodiscard]] int length() const { return end > start ? end - start : 0; }
  [[nodiscard]] bool contains(int line) const { return line >= start && line < end; }
  [[nodiscard]] bool valid() const { return start >= 1 && end > start; }
  bool operator==(const LineRange&) const = default;
};

// One recorded edit, as staged between a tool invocation and the next commit.
struct CaptureEvent {
  std::string path;          // repository-relative, '/' separated
  LineRange range;
  std::string tool;
  std::string prompt;        // raw text on the way in; empty once staged
  std::string prompt_digest; // sha256 hex of the prompt, set when staged
  std::string session_id;
  std::int64_t timestamp_ms = 0;
  ContributorKind kind = ContributorKind::Ai;

  bool operator==(const CaptureEvent&) const = default;
};

struct LineAttribution {
  std::string path;
  LineRange range;
  ContributorKind kind = ContributorKind::Ai;
  std::string tool;
  std::string session_id;
  std::string prompt_digest;

  // Same tags, ignoring path and range
  [[nodiscard]] bool same_origin(const LineAttribution& o) const {
    return kind == o.kind && tool == o.tool && session_id == o.session_id &&
           prompt_digest == o.prompt_digest;
  }
  bool operator==(const LineAttribution&) const = default;
};

// Everything known about one commit. Entries of one file never overlap.
struct AttributionRecord {
  std::string commit;                          // 40-hex
  std::vector<LineAttribution> entries;        // sorted by (path, start)
  std::map<std::string, std::string> prompts;  // digest -> prompt text

  // Entry covering `line` of `path`, or nullptr.
  [[nodiscard]] const LineAttribution* find(std::string_view path, int line) const;

  // Sort entries by (path, start) and drop prompts nothing refers to.
  void normalize();

  [[nodiscard]] int total_lines() const;
  [[nodiscard]] int ai_lines() const;

  bool operator==(const AttributionRecord&) const = default;
};

// Read-only summary of what is waiting to be finalized.
struct PendingStatus {
  bool has_pending = false;
  std::string session_id;            // session of the most recent event
  std::vector<std::string> sessions; // distinct sessions, first-seen order
  std::size_t event_count = 0;
  std::size_t file_count = 0;
  std::size_t line_count = 0;
};

// Fold per-line owners into minimal non-overlapping ranges: consecutive lines
// with the same origin become one entry. `owners` maps line -> template entry
// (its path and range are ignored).
std::vector<LineAttribution> coalesce_lines(const std::string& path,
                                            const std::map<int, LineAttribution>& owners);

} // namespace aiblame
