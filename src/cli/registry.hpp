#pragma once
#include <string_view>
#include <vector>
#include "cli/command.hpp"

namespace aiblame::cli {

struct Command {
  std::string_view name;
  command_fn fn;
  std::string_view summary;
};

// Commands in the order `ai-blame help` lists them. Defined in register_commands.cpp.
auto commands() -> const std::vector<Command>&;

// Runs argv[1] with the remaining arguments; returns the process exit code.
auto dispatch(int argc, char** argv) -> int;

} // namespace aiblame::cli
