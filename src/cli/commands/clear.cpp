#include "cli/context.hpp"

#include <filesystem>
#include <iostream>

int cmd_clear(int /*argc*/, char ** /*argv*/) {
  try {
    aiblame::cli::Context ctx{std::filesystem::current_path()};
    ctx.staging.clear();
    std::cout << "Cleared pending AI attribution.\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "clear: " << e.what() << "\n";
    return 1;
  }
}
