#include "aiblame/summary.hpp"

namespace aiblame {

Summary summarize(const Repository &repo, const NotesRepository &notes, std::string_view range) {
  Summary s;
  for (const auto &commit : repo.rev_list(range)) {
    ++s.commits;
    const auto record = notes.read(commit);
    if (!record) continue;
    ++s.commits_with_records;
    for (const auto &e : record->entries) {
      const int n = e.range.length();
      s.total_lines += n;
      if (e.kind == ContributorKind::Ai) s.ai_lines += n;
      if (!e.tool.empty()) s.by_tool[e.tool] += n;
      if (!e.session_id.empty()) s.by_session[e.session_id] += n;
      s.by_file[e.path] += n;
    }
  }
  return s;
}

} // namespace aiblame
