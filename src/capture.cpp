#include "aiblame/capture.hpp"

#include "aiblame/diff.hpp"
#include "aiblame/errors.hpp"
#include "aiblame/fs.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <limits>

using nlohmann::json;

namespace aiblame::capture {

namespace {

std::string string_at(const json &j, const char *key) {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

// "content" of a transcript message: a string, or a list of typed blocks of
// which the text ones count. Tool results are not prompts.
std::string message_text(const json &content) {
  if (content.is_string()) {
    return content.get<std::string>();
  }
  std::string out;
  if (!content.is_array()) return out;
  for (const auto &block : content) {
    if (!block.is_object() || string_at(block, "type") != "text") continue;
    if (!out.empty()) out.push_back('\n');
    out += string_at(block, "text");
  }
  return out;
}

} // namespace

HookPayload parse_hook_payload(std::string_view json_text) {
  json j = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    throw CaptureError("hook input is not a JSON object");
  }
  HookPayload p;
  p.session_id = string_at(j, "session_id");
  p.tool_name = string_at(j, "tool_name");
  p.prompt = string_at(j, "prompt");
  p.transcript_path = string_at(j, "transcript_path");
  p.cwd = string_at(j, "cwd");

  const auto input = j.find("tool_input");
  if (input != j.end() && input->is_object()) {
    p.file_path = string_at(*input, "file_path");
    if (p.file_path.empty()) p.file_path = string_at(*input, "notebook_path");
    p.content = string_at(*input, "content");
    if (input->contains("new_string")) {
      p.edits.push_back(Edit{.old_string = string_at(*input, "old_string"),
                             .new_string = string_at(*input, "new_string")});
    }
    const auto edits = input->find("edits");
    if (edits != input->end() && edits->is_array()) {
      for (const auto &e : *edits) {
        if (!e.is_object()) continue;
        p.edits.push_back(Edit{.old_string = string_at(e, "old_string"),
                               .new_string = string_at(e, "new_string")});
      }
    }
  }
  return p;
}

std::optional<LineRange> locate_lines(std::string_view text, std::string_view needle) {
  if (needle.empty()) return std::nullopt;
  const auto pos = text.find(needle);
  if (pos == std::string_view::npos) return std::nullopt;

  const int start = 1 + static_cast<int>(std::count(text.begin(), text.begin() + pos, '\n'));
  std::string_view body = needle;
  if (body.back() == '\n') body.remove_suffix(1);
  const int span = 1 + static_cast<int>(std::count(body.begin(), body.end(), '\n'));
  return LineRange{.start = start, .end = start + span};
}

std::optional<LineRange> clamp_range(long long start, long long end, std::size_t line_count) {
  constexpr long long kMax = std::numeric_limits<int>::max();
  if (start < 1 || end > kMax || start >= end) {
    throw CaptureError("invalid line range [" + std::to_string(start) + ", " +
                       std::to_string(end) + ")");
  }
  const long long stop = std::min(end, static_cast<long long>(line_count) + 1);
  if (start >= stop) return std::nullopt;
  return LineRange{.start = static_cast<int>(start), .end = static_cast<int>(stop)};
}

std::string last_user_prompt(const std::filesystem::path &transcript) {
  std::ifstream in(transcript);
  if (!in) return {};
  std::string last;
  std::string line;
  while (std::getline(in, line)) {
    json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) continue;
    const auto msg = j.find("message");
    const bool user = string_at(j, "type") == "user" ||
                      (msg != j.end() && msg->is_object() && string_at(*msg, "role") == "user");
    if (!user || msg == j.end() || !msg->is_object() || !msg->contains("content")) continue;
    std::string text = message_text(msg->at("content"));
    if (!text.empty()) last = std::move(text);
  }
  return last;
}

std::vector<CaptureEvent> events_from_payload(const Repository &repo, const HookPayload &payload,
                                              std::string_view tool, std::int64_t now_ms) {
  std::vector<CaptureEvent> out;
  const std::string &name = payload.tool_name;
  if (name != "Write" && name != "Edit" && name != "MultiEdit" && name != "NotebookEdit") {
    return out;
  }
  if (payload.file_path.empty()) return out;

  std::filesystem::path file = payload.file_path;
  if (file.is_relative()) {
    file = (payload.cwd.empty() ? repo.root() : std::filesystem::path(payload.cwd)) / file;
  }
  const std::string rel = repo.relative_path(file);
  if (rel.empty() || rel == ".git" || rel.starts_with(".git/")) return out;

  // The hook runs after the tool, so the file on disk is the edited version.
  std::string current;
  if (fs::exists(file)) {
    current = fs::read_text(file);
  } else if (name == "Write") {
    current = payload.content;
  } else {
    return out;
  }

  std::string prompt = payload.prompt;
  if (prompt.empty() && !payload.transcript_path.empty()) {
    prompt = last_user_prompt(payload.transcript_path);
  }

  auto make = [&](LineRange range) {
    out.push_back(CaptureEvent{.path = rel,
                               .range = range,
                               .tool = std::string(tool),
                               .prompt = prompt,
                               .prompt_digest = {},
                               .session_id = payload.session_id,
                               .timestamp_ms = now_ms,
                               .kind = ContributorKind::Ai});
  };

  if (name == "Write" || name == "NotebookEdit") {
    const auto n = static_cast<int>(diff::split_lines(current).size());
    if (n > 0) make(LineRange{.start = 1, .end = n + 1});
    return out;
  }
  for (const auto &edit : payload.edits) {
    if (auto range = locate_lines(current, edit.new_string)) make(*range);
  }
  return out;
}

} // namespace aiblame::capture
