#include "aiblame/diff.hpp"
#include <iostream>
#include <vector>

int main() {
  using aiblame::diff::correspond;
  using aiblame::diff::diff_ops;
  using aiblame::diff::split_lines;

  const char* A = "line1\nline2\nline3\n";
  const char* B = "line1\nlineZ\nline3\nline4\n";
  auto a = split_lines(A);
  auto b = split_lines(B);
  if (a.size() != 3 || b.size() != 4) { std::cerr << "split_lines wrong\n"; return 1; }
  if (split_lines("x\r\ny").size() != 2 || split_lines("").size() != 0) {
    std::cerr << "split_lines edge cases wrong\n"; return 1;
  }

  auto ops = diff_ops(a, b);
  int keep = 0, del = 0, ins = 0;
  for (char op : ops) {
    keep += op == '=';
    del += op == '-';
    ins += op == '+';
  }
  if (keep != 2 || del != 1 || ins != 2) { std::cerr << "edit script not minimal\n"; return 1; }

  auto map = correspond(a, b);
  const std::vector<int> want_old{0, -1, 2};
  const std::vector<int> want_new{0, -1, 2, -1};
  if (map.old_to_new != want_old || map.new_to_old != want_new) {
    std::cerr << "correspondence wrong\n"; return 1;
  }

  // insertion in the middle of repeated lines shifts the tail
  auto c = split_lines("x\nx\nx\n");
  auto d = split_lines("x\nnew\nx\nx\n");
  auto m2 = correspond(c, d);
  int kept = 0, added = 0;
  for (int v : m2.old_to_new) kept += v >= 0;
  for (int v : m2.new_to_old) added += v < 0;
  if (kept != 3 || added != 1) {
    std::cerr << "repeated lines not all kept\n"; return 1;
  }

  // everything replaced / everything new
  auto e = correspond(split_lines("a\nb\n"), split_lines("c\nd\n"));
  if (e.old_to_new != std::vector<int>{-1, -1}) { std::cerr << "replacement kept lines\n"; return 1; }
  auto f = correspond({}, split_lines("a\n"));
  if (f.new_to_old != std::vector<int>{-1}) { std::cerr << "insert into empty wrong\n"; return 1; }

  std::cout << "OK\n";
  return 0;
}
