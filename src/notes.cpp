#include "aiblame/notes.hpp"

#include "aiblame/codec.hpp"
#include "aiblame/consts.hpp"
#include "aiblame/errors.hpp"
#include "aiblame/refs.hpp"
#include "aiblame/time.hpp"
#include "aiblame/util.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace aiblame {

NotesRepository::NotesRepository(const Repository &repo, const Settings &settings)
    : repo_(repo), ref_(settings.notes_ref), retries_(settings.note_retries),
      identity_(load_identity(repo.common_dir())) {}

std::optional<std::string> NotesRepository::tip() const {
  return read_ref(repo_.common_dir(), ref_);
}

const NotesRepository::NoteIndex &
NotesRepository::index_at(const std::optional<std::string> &tip) const {
  if (cache_valid_ && cached_tip_ == tip) {
    return cached_index_;
  }
  NoteIndex index;
  if (tip) {
    const auto info = repo_.read_commit(*tip);
    for (auto &[path, blob] : repo_.tree_to_map(info.tree_hex)) {
      std::string name = path;
      std::erase(name, '/');
      if (!looks_hex40(name)) {
        continue; // not a note (git allows other files in a notes tree)
      }
      index[name] = NoteEntry{.path = path, .blob = blob};
    }
  }
  cached_tip_ = tip;
  cached_index_ = std::move(index);
  cache_valid_ = true;
  return cached_index_;
}

bool NotesRepository::has_record(std::string_view commit_hex) const {
  return index_at(tip()).contains(std::string(commit_hex));
}

std::optional<AttributionRecord> NotesRepository::read(std::string_view commit_hex) const {
  const auto &index = index_at(tip());
  const auto it = index.find(std::string(commit_hex));
  if (it == index.end()) {
    return std::nullopt;
  }
  const auto bytes = repo_.read_blob(it->second.blob);
  AttributionRecord r = codec::decode(std::string_view(
      reinterpret_cast<const char *>(bytes.data()), bytes.size()));
  // The notes key is authoritative; blobs copied by git (notes.rewriteRef)
  // still name the pre-rewrite commit.
  r.commit = std::string(commit_hex);
  return r;
}

void NotesRepository::write_once(const std::string &commit_hex, const std::string &blob_hex) const {
  const auto old_tip = tip();
  PathOidMap files;
  if (old_tip) {
    files = repo_.tree_to_map(repo_.read_commit(*old_tip).tree_hex);
  }
  // Drop the previous note of this commit wherever the fanout put it.
  std::erase_if(files, [&](const auto &kv) {
    std::string name = kv.first;
    std::erase(name, '/');
    return name == commit_hex;
  });
  files[commit_hex] = blob_hex;

  const std::string tree_hex = repo_.write_tree_from_map(files);
  std::vector<std::string> parents;
  if (old_tip) {
    parents.push_back(*old_tip);
  }
  const std::string sig = timeutil::signature_now(identity_);
  const std::string notes_commit =
      repo_.write_commit(tree_hex, parents, sig, sig, consts::kNotesMessage);
  update_ref(repo_.common_dir(), ref_, notes_commit, old_tip);
  cache_valid_ = false;
}

void NotesRepository::write(std::string_view commit_hex, AttributionRecord record) const {
  if (!looks_hex40(commit_hex)) {
    throw RevisionError(std::string(commit_hex));
  }
  record.commit = std::string(commit_hex);
  record.normalize();
  const std::string body = codec::encode(record);
  const std::string blob_hex = repo_.write_blob(as_bytes(body));

  auto backoff = std::chrono::milliseconds(10);
  for (int attempt = 1;; ++attempt) {
    try {
      write_once(record.commit, blob_hex);
      return;
    } catch (const RefConflictError &e) {
      if (attempt >= retries_) {
        throw NoteConflictError("could not update " + ref_ + " after " +
                                std::to_string(attempt) + " attempts: " + e.what());
      }
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void NotesRepository::copy(std::string_view source_rev, std::string_view target_rev) const {
  const std::string source = repo_.resolve_commit(source_rev);
  const std::string target = repo_.resolve_commit(target_rev);
  auto record = read(source);
  if (!record) {
    throw MissingRecordError(source);
  }
  write(target, std::move(*record));
}

std::vector<std::string> NotesRepository::list() const {
  std::vector<std::string> out;
  for (const auto &[commit, _] : index_at(tip())) {
    out.push_back(commit);
  }
  return out;
}

} // namespace aiblame
