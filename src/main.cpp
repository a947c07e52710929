#include "cli/registry.hpp"

int main(int argc, char **argv) { return aiblame::cli::dispatch(argc, argv); }
