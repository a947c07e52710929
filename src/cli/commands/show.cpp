#include "cli/context.hpp"

#include "aiblame/util.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <string>

int cmd_show(int argc, char **argv) {
  std::string rev = "HEAD";
  bool as_json = false;
  bool rev_given = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--json") {
      as_json = true;
    } else if (!rev_given && !a.starts_with("--")) {
      rev = a;
      rev_given = true;
    } else {
      std::cerr << "show: bad argument '" << a << "'\n";
      return 2;
    }
  }

  try {
    aiblame::cli::Context ctx{std::filesystem::current_path()};
    const std::string commit = ctx.repo.resolve_commit(rev);
    const auto record = ctx.notes.read(commit);

    if (as_json) {
      nlohmann::json out{{"commit", commit}, {"has_record", record.has_value()}};
      nlohmann::json entries = nlohmann::json::array();
      if (record) {
        for (const auto &e : record->entries) {
          entries.push_back({{"path", e.path},
                             {"start", e.range.start},
                             {"end", e.range.end},
                             {"kind", aiblame::to_string(e.kind)},
                             {"tool", e.tool},
                             {"session", e.session_id},
                             {"prompt", e.prompt_digest}});
        }
        out["ai_lines"] = record->ai_lines();
        out["total_lines"] = record->total_lines();
      }
      out["entries"] = entries;
      std::cout << out.dump(2) << "\n";
      return 0;
    }

    if (!record) {
      std::cout << "Commit " << aiblame::abbrev(commit) << " has no AI attribution.\n";
      return 0;
    }
    std::cout << "commit " << commit << "\n";
    std::cout << "AI lines: " << record->ai_lines() << " of " << record->total_lines()
              << " attributed\n\n";
    for (const auto &e : record->entries) {
      std::cout << "  " << e.path << ":" << e.range.start << "-" << (e.range.end - 1) << "  "
                << aiblame::to_string(e.kind);
      if (!e.tool.empty()) std::cout << "  " << e.tool;
      if (!e.session_id.empty()) std::cout << "  session " << e.session_id;
      if (!e.prompt_digest.empty()) std::cout << "  prompt " << aiblame::abbrev(e.prompt_digest);
      std::cout << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "show: " << e.what() << "\n";
    return 1;
  }
}
