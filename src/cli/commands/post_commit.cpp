#include "cli/context.hpp"

#include "aiblame/finalizer.hpp"
#include "aiblame/util.hpp"

#include <filesystem>
#include <iostream>

int cmd_post_commit(int argc, char **argv) {
  const std::string rev = argc > 1 ? argv[1] : "HEAD";
  try {
    aiblame::cli::Context ctx{std::filesystem::current_path()};
    const aiblame::Finalizer finalizer{ctx.repo, ctx.staging, ctx.notes};
    const auto result = finalizer.run(rev);
    if (result.written) {
      std::cout << "ai-blame: " << result.lines << " attributed lines recorded for "
                << aiblame::abbrev(result.commit) << "\n";
    } else if (result.events > 0) {
      std::cout << "ai-blame: staged edits did not survive into "
                << aiblame::abbrev(result.commit) << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "post-commit: " << e.what() << "\n";
    return 1;
  }
}
