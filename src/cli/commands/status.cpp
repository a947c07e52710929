#include "cli/context.hpp"

#include <filesystem>
#include <iostream>

int cmd_status(int /*argc*/, char ** /*argv*/) {
  try {
    aiblame::cli::Context ctx{std::filesystem::current_path()};
    const auto status = ctx.staging.current_status();
    if (!status.has_pending) {
      std::cout << "No pending AI attribution.\n";
      return 0;
    }
    std::cout << "Pending AI attribution:\n";
    std::cout << "  Session: " << (status.session_id.empty() ? "unknown" : status.session_id)
              << "\n";
    if (status.sessions.size() > 1) {
      std::cout << "  Sessions: " << status.sessions.size() << "\n";
    }
    std::cout << "  Events: " << status.event_count << "\n";
    std::cout << "  Files: " << status.file_count << "\n";
    std::cout << "  Lines: " << status.line_count << "\n";
    std::cout << "\nRun 'git commit' to finalize attribution.\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "status: " << e.what() << "\n";
    return 1;
  }
}
