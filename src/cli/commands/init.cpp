#include "cli/context.hpp"

#include "aiblame/hooks.hpp"

#include <filesystem>
#include <iostream>

using aiblame::hooks::HookInstall;

static void report(const char *hook, HookInstall how) {
  switch (how) {
  case HookInstall::Created:
    std::cout << "Installed " << hook << " hook.\n";
    break;
  case HookInstall::Appended:
    std::cout << "Added ai-blame to existing " << hook << " hook.\n";
    break;
  case HookInstall::AlreadyPresent:
    std::cout << hook << " hook already runs ai-blame.\n";
    break;
  }
}

int cmd_init(int /*argc*/, char ** /*argv*/) {
  try {
    aiblame::cli::Context ctx{std::filesystem::current_path()};
    const auto hooks = ctx.repo.hooks_dir();
    report("post-commit", aiblame::hooks::install_hook(hooks, "post-commit", "ai-blame post-commit"));
    report("post-rewrite",
           aiblame::hooks::install_hook(hooks, "post-rewrite", "ai-blame post-rewrite \"$1\""));

    aiblame::GitConfig config{ctx.repo.config_file()};
    config.load();
    for (const auto &spec : aiblame::hooks::configure_notes_refspecs(config, ctx.settings.notes_ref)) {
      std::cout << "Configured remote.origin refspec " << spec << "\n";
    }
    std::cout << "ai-blame is set up in " << ctx.repo.root().string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
