#pragma once
#include "aiblame/attribution.hpp"
#include "aiblame/config.hpp"
#include "aiblame/repo.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aiblame {

// commit -> AttributionRecord, persisted as git notes under a dedicated ref
// (refs/notes/ai-blame by default). Every write is a new notes commit whose
// parent is the previous tip, published with a compare-and-swap ref update.
class NotesRepository {
public:
  NotesRepository(const Repository& repo, const Settings& settings);

  [[nodiscard]] bool has_record(std::string_view commit_hex) const;

  // Decoded note of `commit_hex`; std::nullopt if there is none.
  [[nodiscard]] std::optional<AttributionRecord> read(std::string_view commit_hex) const;

  // Replace the note of `commit_hex` wholesale. The record's commit field is
  // set to `commit_hex`. Lock/CAS conflicts are retried; NoteConflictError
  // once the retries are exhausted.
  void write(std::string_view commit_hex, AttributionRecord record) const;

  // Copy the record of `source_rev` verbatim onto `target_rev`.
  // RevisionError if either does not resolve, MissingRecordError if the
  // source has no record (the target is left untouched).
  void copy(std::string_view source_rev, std::string_view target_rev) const;

  // Every annotated commit id, sorted.
  [[nodiscard]] std::vector<std::string> list() const;

  [[nodiscard]] const std::string& ref() const { return ref_; }

private:
  struct NoteEntry {
    std::string path; // path inside the notes tree, possibly fanned out ("ab/cdef...")
    std::string blob;
  };
  using NoteIndex = std::map<std::string, NoteEntry>; // commit hex -> entry

  [[nodiscard]] std::optional<std::string> tip() const;
  [[nodiscard]] const NoteIndex& index_at(const std::optional<std::string>& tip) const;
  void write_once(const std::string& commit_hex, const std::string& blob_hex) const;

  const Repository& repo_;
  std::string ref_;
  int retries_;
  Identity identity_;

  mutable std::optional<std::string> cached_tip_;
  mutable NoteIndex cached_index_;
  mutable bool cache_valid_ = false;
};

} // namespace aiblame
