#include "cli/context.hpp"

#include "aiblame/blame.hpp"
#include "aiblame/util.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

int cmd_blame(int argc, char **argv) {
  std::string rev = "HEAD";
  std::string file;
  bool as_json = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--rev" && i + 1 < argc) {
      rev = argv[++i];
    } else if (a == "--json") {
      as_json = true;
    } else if (file.empty() && !a.starts_with("--")) {
      file = a;
    } else {
      std::cerr << "blame: bad argument '" << a << "'\n";
      return 2;
    }
  }
  if (file.empty()) {
    std::cerr << "usage: ai-blame blame <file> [--rev R] [--json]\n";
    return 2;
  }

  try {
    aiblame::cli::Context ctx{std::filesystem::current_path()};
    const std::string path = ctx.repo.relative_path(file);
    if (path.empty()) {
      std::cerr << "blame: " << file << " is outside the repository\n";
      return 1;
    }
    const aiblame::BlameEngine engine{ctx.repo, ctx.notes};
    const auto view = engine.blame(path, rev);

    if (as_json) {
      nlohmann::json lines = nlohmann::json::array();
      for (const auto &l : view) {
        lines.push_back({{"line", l.line},
                         {"commit", l.commit},
                         {"kind", aiblame::to_string(l.kind)},
                         {"tool", l.tool},
                         {"session", l.session_id},
                         {"prompt", l.prompt_digest},
                         {"content", l.content}});
      }
      std::cout << nlohmann::json{{"path", path}, {"lines", lines}}.dump(2) << "\n";
      return 0;
    }

    const int width = static_cast<int>(std::to_string(view.size()).size());
    for (const auto &l : view) {
      const std::string who =
          l.kind == aiblame::ContributorKind::Ai ? "AI:" + l.tool : std::string("human");
      std::cout << aiblame::abbrev(l.commit) << " " << std::left << std::setw(14) << who
                << std::right << " " << std::setw(width) << l.line << ") " << l.content << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "blame: " << e.what() << "\n";
    return 1;
  }
}
