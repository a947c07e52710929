#include "cli/context.hpp"

#include "aiblame/rewrite.hpp"
#include "aiblame/util.hpp"

#include <filesystem>
#include <iostream>

// git runs post-rewrite with "amend" or "rebase" and the pairs on stdin.
int cmd_post_rewrite(int argc, char **argv) {
  const std::string how = argc > 1 ? argv[1] : "rebase";
  try {
    aiblame::cli::Context ctx{std::filesystem::current_path()};
    const aiblame::RewritePropagator propagator{ctx.repo, ctx.notes};
    std::size_t written = 0;
    for (const auto &r : propagator.post_rewrite(std::cin)) {
      if (r.written) ++written;
    }
    if (written > 0) {
      std::cout << "ai-blame: carried attribution to " << written << " commit"
                << (written == 1 ? "" : "s") << " after " << how << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "post-rewrite: " << e.what() << "\n";
    return 1;
  }
}
