#pragma once
#include "aiblame/attribution.hpp"
#include "aiblame/notes.hpp"
#include "aiblame/prompt_store.hpp"
#include "aiblame/repo.hpp"
#include "aiblame/staging.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace aiblame {

struct FinalizeResult {
  std::string commit;
  std::size_t events = 0;  // drained from staging
  bool written = false;    // a record was persisted
  std::size_t entries = 0; // LineAttribution entries in it
  int lines = 0;           // lines they cover
};

// Lines a commit changed in one file (1-indexed, new-side numbering).
// std::nullopt means "unknown": captured ranges are then kept whole.
using ChangedLines = std::optional<std::set<int>>;

// Turns staged events into the commit's AttributionRecord once the commit exists.
class Finalizer {
public:
  Finalizer(const Repository& repo, const StagingStore& staging, const NotesRepository& notes)
      : repo_(repo), staging_(staging), notes_(notes) {}

  // Drain staging and persist the record for `commit_rev`. Nothing staged
  // means nothing written. A persistence failure after the drain throws
  // FinalizeError; the drained events are dumped next to the staging file.
  FinalizeResult run(std::string_view commit_rev = "HEAD") const;

  // Changed-line set of `path` in `commit_hex` against its first parent.
  // A root commit (or a file new to it) changes every line.
  [[nodiscard]] ChangedLines changed_lines(std::string_view commit_hex,
                                           std::string_view path) const;

  // Intersect events with the changed lines and resolve overlaps, the later
  // timestamp winning. Paths missing from `changed` keep their ranges whole.
  static AttributionRecord resolve(const std::string& commit_hex,
                                   const std::vector<CaptureEvent>& events,
                                   const std::map<std::string, ChangedLines>& changed,
                                   const PromptStore& prompts);

private:
  const Repository& repo_;
  const StagingStore& staging_;
  const NotesRepository& notes_;
};

} // namespace aiblame
