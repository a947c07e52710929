#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace aiblame::diff {

// Split raw text into lines (newlines and CRs trimmed).
std::vector<std::string> split_lines(std::string_view text);

// Myers O(ND) edit script: '=' keep, '-' delete from a, '+' insert from b.
std::vector<char> diff_ops(const std::vector<std::string>& a, const std::vector<std::string>& b);

// Line-level correspondence between two versions of a file (0-based indices).
struct LineCorrespondence {
  std::vector<int> old_to_new; // -1 if the old line was removed or rewritten
  std::vector<int> new_to_old; // -1 if the new line was added or rewritten
};

LineCorrespondence correspond(const std::vector<std::string>& a,
                              const std::vector<std::string>& b);

} // namespace aiblame::diff
