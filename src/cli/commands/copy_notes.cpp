#include "cli/context.hpp"

#include "aiblame/util.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int cmd_copy_notes(int argc, char **argv) {
  bool dry_run = false;
  std::vector<std::string> revs;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--dry-run") {
      dry_run = true;
    } else {
      revs.push_back(a);
    }
  }
  if (revs.size() != 2) {
    std::cerr << "usage: ai-blame copy-notes <source> <target> [--dry-run]\n";
    return 2;
  }

  try {
    aiblame::cli::Context ctx{std::filesystem::current_path()};
    const std::string source = ctx.repo.resolve_commit(revs[0]);
    const std::string target = ctx.repo.resolve_commit(revs[1]);
    if (dry_run) {
      if (!ctx.notes.has_record(source)) {
        std::cout << "Source commit " << aiblame::abbrev(source) << " has no attribution.\n";
        return 1;
      }
      std::cout << "Would copy attribution: " << aiblame::abbrev(source) << " -> "
                << aiblame::abbrev(target) << "\n";
      return 0;
    }
    ctx.notes.copy(source, target);
    std::cout << "Copied attribution: " << aiblame::abbrev(source) << " -> "
              << aiblame::abbrev(target) << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "copy-notes: " << e.what() << "\n";
    return 1;
  }
}
