#include "cli/context.hpp"

#include "aiblame/blame.hpp"
#include "aiblame/util.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int cmd_prompt(int argc, char **argv) {
  std::string rev = "HEAD";
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--rev" && i + 1 < argc) {
      rev = argv[++i];
    } else {
      positional.push_back(a);
    }
  }
  long long line = 0;
  if (positional.size() != 2 || !aiblame::strutil::parse_int(positional[1], line) || line < 1) {
    std::cerr << "usage: ai-blame prompt <file> <line> [--rev R]\n";
    return 2;
  }

  try {
    aiblame::cli::Context ctx{std::filesystem::current_path()};
    const std::string path = ctx.repo.relative_path(positional[0]);
    if (path.empty()) {
      std::cerr << "prompt: " << positional[0] << " is outside the repository\n";
      return 1;
    }
    const aiblame::BlameEngine engine{ctx.repo, ctx.notes};
    const auto view = engine.blame(path, rev);
    if (static_cast<std::size_t>(line) > view.size()) {
      std::cerr << "prompt: " << path << " has only " << view.size() << " lines\n";
      return 1;
    }
    const auto l = view.at(static_cast<std::size_t>(line - 1));
    if (l.kind != aiblame::ContributorKind::Ai) {
      std::cout << path << ":" << line << " was not written by an AI tool ("
                << aiblame::abbrev(l.commit) << ").\n";
      return 0;
    }
    std::cout << path << ":" << line << "  " << l.tool << "  commit " << aiblame::abbrev(l.commit);
    if (!l.session_id.empty()) std::cout << "  session " << l.session_id;
    std::cout << "\n\n";

    auto text = view.prompt(l.prompt_digest);
    if (!text && !l.prompt_digest.empty()) text = ctx.staging.prompts().get(l.prompt_digest);
    if (text) {
      std::cout << *text << "\n";
    } else {
      std::cout << "(prompt not recorded)\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "prompt: " << e.what() << "\n";
    return 1;
  }
}
