#include "aiblame/attribution.hpp"

#include <algorithm>
#include <set>
#include <tuple>

namespace aiblame {

std::string_view to_string(ContributorKind kind) {
  return kind == ContributorKind::Ai ? "ai" : "human";
}

std::optional<ContributorKind> parse_contributor_kind(std::string_view text) {
  if (text == "ai") {
    return ContributorKind::Ai;
  }
  if (text == "human") {
    return ContributorKind::Human;
  }
  return std::nullopt;
}

const LineAttribution *AttributionRecord::find(std::string_view path, int line) const {
  for (const auto &e : entries) {
    if (e.path == path && e.range.contains(line)) {
      return &e;
    }
  }
  return nullptr;
}

void AttributionRecord::normalize() {
  std::ranges::sort(entries, [](const LineAttribution &a, const LineAttribution &b) {
    return std::tie(a.path, a.range.start) < std::tie(b.path, b.range.start);
  });
  std::set<std::string> used;
  for (const auto &e : entries) {
    if (!e.prompt_digest.empty()) {
      used.insert(e.prompt_digest);
    }
  }
  std::erase_if(prompts, [&](const auto &kv) { return !used.contains(kv.first); });
}

int AttributionRecord::total_lines() const {
  int n = 0;
  for (const auto &e : entries) n += e.range.length();
  return n;
}

int AttributionRecord::ai_lines() const {
  int n = 0;
  for (const auto &e : entries) {
    if (e.kind == ContributorKind::Ai) n += e.range.length();
  }
  return n;
}

std::vector<LineAttribution> coalesce_lines(const std::string &path,
                                            const std::map<int, LineAttribution> &owners) {
  std::vector<LineAttribution> out;
  for (const auto &[line, owner] : owners) {
    if (!out.empty() && out.back().range.end == line && out.back().same_origin(owner)) {
      out.back().range.end = line + 1;
      continue;
    }
    LineAttribution e = owner;
    e.path = path;
    e.range = LineRange{.start = line, .end = line + 1};
    out.push_back(std::move(e));
  }
  return out;
}

} // namespace aiblame
