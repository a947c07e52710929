#include "cli/context.hpp"

#include "aiblame/capture.hpp"
#include "aiblame/diff.hpp"
#include "aiblame/fs.hpp"
#include "aiblame/time.hpp"
#include "aiblame/util.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct CaptureArgs {
  bool stdin_mode = false;
  std::optional<std::string> file;
  std::optional<long long> start;
  std::optional<long long> end;
  std::optional<std::string> tool;
  std::string prompt;
  std::string session;
  aiblame::ContributorKind kind = aiblame::ContributorKind::Ai;
};

// Direct-argument form: one event for --file, the whole file when no lines are given.
std::vector<aiblame::CaptureEvent> events_from_args(const aiblame::Repository &repo,
                                                    const CaptureArgs &args) {
  const std::string rel = repo.relative_path(*args.file);
  if (rel.empty()) {
    throw std::runtime_error(*args.file + " is outside the repository");
  }
  const auto abs = repo.root() / rel;
  const std::size_t n =
      aiblame::fs::exists(abs) ? aiblame::diff::split_lines(aiblame::fs::read_text(abs)).size() : 0;
  aiblame::LineRange range{.start = 1, .end = static_cast<int>(n) + 1};
  if (args.start && args.end) {
    const auto clamped = aiblame::capture::clamp_range(*args.start, *args.end, n);
    if (!clamped) {
      return {}; // starts past the end of the file
    }
    range = *clamped;
  } else if (!range.valid()) {
    return {}; // empty file
  }
  return {aiblame::CaptureEvent{.path = rel,
                                .range = range,
                                .tool = args.tool.value_or(std::string(aiblame::capture::kDefaultTool)),
                                .prompt = args.prompt,
                                .prompt_digest = {},
                                .session_id = args.session,
                                .timestamp_ms = aiblame::timeutil::now_millis(),
                                .kind = args.kind}};
}

} // namespace

int cmd_capture(int argc, char **argv) {
  CaptureArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) return std::nullopt;
      return std::string(argv[++i]);
    };
    auto number = [&](std::optional<long long> &out) {
      const auto v = value();
      long long n = 0;
      if (!v || !aiblame::strutil::parse_int(*v, n)) return false;
      out = n;
      return true;
    };
    bool ok = true;
    if (a == "--stdin") {
      args.stdin_mode = true;
    } else if (a == "--file") {
      args.file = value();
      ok = args.file.has_value();
    } else if (a == "--start") {
      ok = number(args.start);
    } else if (a == "--end") {
      ok = number(args.end);
    } else if (a == "--tool") {
      args.tool = value();
      ok = args.tool.has_value();
    } else if (a == "--prompt") {
      const auto v = value();
      ok = v.has_value();
      args.prompt = v.value_or("");
    } else if (a == "--session") {
      const auto v = value();
      ok = v.has_value();
      args.session = v.value_or("");
    } else if (a == "--kind") {
      const auto v = value();
      const auto k = v ? aiblame::parse_contributor_kind(*v) : std::nullopt;
      ok = k.has_value();
      if (k) args.kind = *k;
    } else {
      ok = false;
    }
    if (!ok) {
      std::cerr << "capture: bad argument '" << a << "'\n";
      return 2;
    }
  }
  if (args.start.has_value() != args.end.has_value()) {
    std::cerr << "capture: --start and --end go together\n";
    return 2;
  }

  try {
    aiblame::cli::Context ctx{std::filesystem::current_path()};
    std::vector<aiblame::CaptureEvent> events;
    if (args.file && !args.stdin_mode) {
      events = events_from_args(ctx.repo, args);
    } else {
      const std::string input{std::istreambuf_iterator<char>(std::cin),
                              std::istreambuf_iterator<char>()};
      const auto payload = aiblame::capture::parse_hook_payload(input);
      events = aiblame::capture::events_from_payload(
          ctx.repo, payload, args.tool.value_or(std::string(aiblame::capture::kDefaultTool)),
          aiblame::timeutil::now_millis());
    }
    if (events.empty()) {
      return 0; // nothing we track
    }
    ctx.staging.append_all(events);
    if (std::getenv("AI_BLAME_DEBUG") != nullptr) {
      for (const auto &e : events) {
        std::cerr << "capture: staged " << e.path << " [" << e.range.start << ", " << e.range.end
                  << ")\n";
      }
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "capture: " << e.what() << "\n";
    return 1;
  }
}
