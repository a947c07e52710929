#include "cli/context.hpp"

#include "aiblame/summary.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>

static void print_breakdown(const char *title, const std::map<std::string, int> &counts) {
  if (counts.empty()) return;
  std::cout << "\n" << title << ":\n";
  for (const auto &[name, n] : counts) {
    std::cout << "  " << std::left << std::setw(24) << name << std::right << " " << n << "\n";
  }
}

int cmd_summary(int argc, char **argv) {
  std::string range = "HEAD";
  bool as_json = false;
  bool range_given = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--json") {
      as_json = true;
    } else if (!range_given && !a.starts_with("--")) {
      range = a;
      range_given = true;
    } else {
      std::cerr << "summary: bad argument '" << a << "'\n";
      return 2;
    }
  }

  try {
    aiblame::cli::Context ctx{std::filesystem::current_path()};
    const auto s = aiblame::summarize(ctx.repo, ctx.notes, range);

    if (as_json) {
      const nlohmann::json out{{"range", range},
                               {"commits", s.commits},
                               {"commits_with_records", s.commits_with_records},
                               {"total_lines", s.total_lines},
                               {"ai_lines", s.ai_lines},
                               {"by_tool", s.by_tool},
                               {"by_session", s.by_session},
                               {"by_file", s.by_file}};
      std::cout << out.dump(2) << "\n";
      return 0;
    }

    std::cout << "Range: " << range << "\n";
    std::cout << "Commits: " << s.commits << " (" << s.commits_with_records
              << " with attribution)\n";
    std::cout << "AI lines: " << s.ai_lines << " of " << s.total_lines << " attributed";
    if (s.total_lines > 0) {
      std::cout << " (" << std::fixed << std::setprecision(1)
                << 100.0 * s.ai_lines / s.total_lines << "%)";
    }
    std::cout << "\n";
    print_breakdown("By tool", s.by_tool);
    print_breakdown("By session", s.by_session);
    print_breakdown("By file", s.by_file);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "summary: " << e.what() << "\n";
    return 1;
  }
}
