#include "aiblame/diff.hpp"

#include <algorithm>

namespace aiblame::diff {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::string cur;
  for (const char c : text) {
    if (c == '\n') {
      out.push_back(std::move(cur));
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) {
    out.push_back(std::move(cur));
  }
  return out;
}

// Myers over a[a0, a0+N) and b[b0, b0+M); appends ops in forward order.
static void myers_diff(const std::vector<std::string> &a, std::size_t a0, int N,
                       const std::vector<std::string> &b, std::size_t b0, int M,
                       std::vector<char> &ops) {
  const int MAX = N + M;
  if (MAX == 0) {
    return;
  }
  const int OFFSET = MAX;
  std::vector<int> v(2 * MAX + 2, 0);
  std::vector<std::vector<int>> trace;

  auto eq = [&](int x, int y) { return a[a0 + x] == b[b0 + y]; };

  for (int d = 0; d <= MAX; ++d) {
    trace.push_back(v); // snapshot of layer d-1, used to backtrack layer d
    for (int k = -d; k <= d; k += 2) {
      int x;
      if (k == -d || (k != d && v[OFFSET + k - 1] < v[OFFSET + k + 1])) {
        x = v[OFFSET + k + 1];     // down (insertion)
      } else {
        x = v[OFFSET + k - 1] + 1; // right (deletion)
      }
      int y = x - k;
      while (x < N && y < M && eq(x, y)) { ++x; ++y; }
      v[OFFSET + k] = x;
      if (x >= N && y >= M) {
        std::vector<char> rev_ops;
        int cx = N, cy = M;
        for (int dd = d; dd > 0; --dd) {
          const auto &vv = trace[dd];
          const int kk = cx - cy;
          const bool down =
              kk == -dd || (kk != dd && vv[OFFSET + kk - 1] < vv[OFFSET + kk + 1]);
          const int prev_k = down ? kk + 1 : kk - 1;
          const int px = vv[OFFSET + prev_k];
          const int py = px - prev_k;
          const int mx = down ? px : px + 1; // point right after the edit
          while (cx > mx) { rev_ops.push_back('='); --cx; --cy; }
          rev_ops.push_back(down ? '+' : '-');
          cx = px; cy = py;
        }
        while (cx > 0 && cy > 0) { rev_ops.push_back('='); --cx; --cy; }
        ops.insert(ops.end(), rev_ops.rbegin(), rev_ops.rend());
        return;
      }
    }
  }
}

std::vector<char> diff_ops(const std::vector<std::string> &a, const std::vector<std::string> &b) {
  // Common prefix and suffix never need the O(ND) search.
  std::size_t pre = 0;
  while (pre < a.size() && pre < b.size() && a[pre] == b[pre]) ++pre;
  std::size_t suf = 0;
  while (suf < a.size() - pre && suf < b.size() - pre &&
         a[a.size() - 1 - suf] == b[b.size() - 1 - suf]) ++suf;

  std::vector<char> ops(pre, '=');
  ops.reserve(a.size() + b.size());
  myers_diff(a, pre, static_cast<int>(a.size() - pre - suf), b, pre,
             static_cast<int>(b.size() - pre - suf), ops);
  ops.insert(ops.end(), suf, '=');
  return ops;
}

LineCorrespondence correspond(const std::vector<std::string> &a,
                              const std::vector<std::string> &b) {
  LineCorrespondence out;
  out.old_to_new.assign(a.size(), -1);
  out.new_to_old.assign(b.size(), -1);
  int ia = 0;
  int ib = 0;
  for (const char op : diff_ops(a, b)) {
    if (op == '=') {
      out.old_to_new[static_cast<std::size_t>(ia)] = ib;
      out.new_to_old[static_cast<std::size_t>(ib)] = ia;
      ++ia;
      ++ib;
    } else if (op == '-') {
      ++ia;
    } else {
      ++ib;
    }
  }
  return out;
}

} // namespace aiblame::diff
