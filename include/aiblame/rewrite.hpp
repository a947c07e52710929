#pragma once
#include "aiblame/attribution.hpp"
#include "aiblame/notes.hpp"
#include "aiblame/repo.hpp"

#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace aiblame {

struct PropagateResult {
  std::string old_commit;
  std::string new_commit;
  bool written = false;     // false when nothing survived the remap
  AttributionRecord record; // what the new commit ended up with
};

// Carries attribution across amend/rebase/cherry-pick by remapping line
// numbers through a line diff of each attributed file.
class RewritePropagator {
public:
  RewritePropagator(const Repository& repo, const NotesRepository& notes)
      : repo_(repo), notes_(notes) {}

  // Remap `old_record` (taken at `old_hex`) onto the file versions of
  // `new_hex`. Unchanged lines move to their new numbers, rewritten or
  // deleted lines are dropped. Files missing on either side are dropped.
  [[nodiscard]] AttributionRecord remap(const AttributionRecord& old_record,
                                        std::string_view old_hex,
                                        std::string_view new_hex) const;

  // Remap the record of `old_rev` onto `new_rev` and persist it. Entries the
  // new commit already has win over propagated ones. MissingRecordError if
  // `old_rev` has no record.
  PropagateResult propagate(std::string_view old_rev, std::string_view new_rev) const;

  // git's post-rewrite contract: "<old> <new> [extra]" per line. Pairs
  // whose old commit has no record are skipped. Several old commits folded
  // into one new commit are merged, later pairs winning.
  std::vector<PropagateResult> post_rewrite(std::istream& in) const;

private:
  const Repository& repo_;
  const NotesRepository& notes_;
};

} // namespace aiblame
