#include "cli/context.hpp"

#include "aiblame/rewrite.hpp"
#include "aiblame/util.hpp"

#include <filesystem>
#include <iostream>

int cmd_propagate(int argc, char **argv) {
  if (argc != 3) {
    std::cerr << "usage: ai-blame propagate <old> <new>\n";
    return 2;
  }
  try {
    aiblame::cli::Context ctx{std::filesystem::current_path()};
    const aiblame::RewritePropagator propagator{ctx.repo, ctx.notes};
    const auto r = propagator.propagate(argv[1], argv[2]);
    if (r.written) {
      std::cout << "Propagated attribution: " << aiblame::abbrev(r.old_commit) << " -> "
                << aiblame::abbrev(r.new_commit) << " (" << r.record.total_lines()
                << " lines)\n";
    } else {
      std::cout << "Nothing to propagate: no attributed lines survive in "
                << aiblame::abbrev(r.new_commit) << ".\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "propagate: " << e.what() << "\n";
    return 1;
  }
}
