#include "cli/registry.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>

namespace aiblame::cli {

namespace {

constexpr std::string_view kVersion = "0.1.0";

void print_usage(std::ostream &os) {
  std::size_t width = 0;
  for (const auto &c : commands()) width = std::max(width, c.name.size());
  os << "usage: ai-blame <command> [args]\n\ncommands:\n";
  for (const auto &c : commands()) {
    os << "  " << std::left << std::setw(static_cast<int>(width)) << std::string(c.name) << "  "
       << c.summary << "\n";
  }
}

} // namespace

int dispatch(int argc, char **argv) {
  if (argc < 2) {
    print_usage(std::cerr);
    return 2;
  }
  const std::string_view name = argv[1];
  if (name == "help" || name == "--help" || name == "-h") {
    print_usage(std::cout);
    return 0;
  }
  if (name == "--version") {
    std::cout << "ai-blame " << kVersion << "\n";
    return 0;
  }

  const auto &all = commands();
  const auto it = std::ranges::find(all, name, &Command::name);
  if (it == all.end()) {
    std::cerr << "ai-blame: unknown command '" << name << "'\n";
    print_usage(std::cerr);
    return 2;
  }
  // The handler sees its own name as argv[0].
  return it->fn(argc - 1, argv + 1);
}

} // namespace aiblame::cli
