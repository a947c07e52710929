#pragma once
#include "aiblame/notes.hpp"
#include "aiblame/repo.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace aiblame {

struct Summary {
  int total_lines = 0; // every attributed line
  int ai_lines = 0;    // lines of kind AI
  std::map<std::string, int> by_tool;
  std::map<std::string, int> by_session;
  std::map<std::string, int> by_file;
  std::size_t commits = 0;              // distinct commits in the range
  std::size_t commits_with_records = 0;
};

// Fold the records of every commit selected by `range` ("A..B" or a single
// revision). Each commit counts once; commits without a record add nothing.
Summary summarize(const Repository& repo, const NotesRepository& notes, std::string_view range);

} // namespace aiblame
