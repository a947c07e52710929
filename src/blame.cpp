#include "aiblame/blame.hpp"

#include "aiblame/diff.hpp"
#include "aiblame/errors.hpp"

#include <cstdint>
#include <queue>
#include <unordered_map>
#include <utility>

namespace aiblame {

BlameView::BlameView(std::string path, std::vector<std::string> content,
                     std::vector<LineOrigin> origins, const NotesRepository &notes)
    : path_(std::move(path)), content_(std::move(content)), origins_(std::move(origins)),
      notes_(&notes), cache_(std::make_shared<RecordCache>()) {}

const std::optional<AttributionRecord> &BlameView::record_of(const std::string &commit) const {
  auto it = cache_->find(commit);
  if (it == cache_->end()) {
    it = cache_->emplace(commit, notes_->read(commit)).first;
  }
  return it->second;
}

BlameLine BlameView::at(std::size_t index) const {
  const LineOrigin &origin = origins_.at(index);
  BlameLine out{.line = static_cast<int>(index) + 1,
                .content = index < content_.size() ? content_[index] : std::string(),
                .kind = ContributorKind::Human,
                .tool = {},
                .session_id = {},
                .prompt_digest = {},
                .commit = origin.commit,
                .origin_line = origin.line};
  const auto &record = record_of(origin.commit);
  if (!record) {
    return out;
  }
  const LineAttribution *entry = record->find(path_, origin.line);
  if (entry == nullptr || entry->kind != ContributorKind::Ai) {
    return out;
  }
  out.kind = ContributorKind::Ai;
  out.tool = entry->tool;
  out.session_id = entry->session_id;
  out.prompt_digest = entry->prompt_digest;
  return out;
}

std::optional<std::string> BlameView::prompt(std::string_view digest) const {
  for (const auto &[commit, record] : *cache_) {
    if (!record) continue;
    if (auto it = record->prompts.find(std::string(digest)); it != record->prompts.end()) {
      return it->second;
    }
  }
  return std::nullopt;
}

namespace {

// A line still looking for its origin: index in the blamed file and its
// 0-based position in the version of the commit currently holding it.
struct Tracked {
  std::size_t final_index;
  int pos;
};

} // namespace

std::vector<LineOrigin> BlameEngine::origins(std::string_view path,
                                             std::string_view commit_hex) const {
  std::unordered_map<std::string, std::vector<std::string>> lines_by_blob;
  auto lines_of = [&](const std::string &blob) -> const std::vector<std::string> & {
    auto it = lines_by_blob.find(blob);
    if (it == lines_by_blob.end()) {
      const auto bytes = repo_.read_blob(blob);
      it = lines_by_blob
               .emplace(blob, diff::split_lines(std::string_view(
                                  reinterpret_cast<const char *>(bytes.data()), bytes.size())))
               .first;
    }
    return it->second;
  };

  std::unordered_map<std::string, Repository::CommitInfo> commits;
  auto commit_of = [&](const std::string &hex) -> const Repository::CommitInfo & {
    auto it = commits.find(hex);
    if (it == commits.end()) {
      it = commits.emplace(hex, repo_.read_commit(hex)).first;
    }
    return it->second;
  };

  const std::string start(commit_hex);
  const auto start_blob = repo_.blob_at(commit_of(start).tree_hex, path);
  if (!start_blob) {
    throw ObjectError("path '" + std::string(path) + "' does not exist in " + start);
  }
  const std::size_t n = lines_of(*start_blob).size();
  std::vector<LineOrigin> result(n);
  if (n == 0) {
    return result;
  }

  // Newest first by committer time; ties broken by id so the order is stable.
  using QueueItem = std::pair<std::int64_t, std::string>;
  std::priority_queue<QueueItem> queue;
  std::unordered_map<std::string, std::vector<Tracked>> pending;

  std::vector<Tracked> all(n);
  for (std::size_t i = 0; i < n; ++i) all[i] = Tracked{.final_index = i, .pos = static_cast<int>(i)};
  pending[start] = std::move(all);
  queue.emplace(commit_of(start).commit_time, start);

  while (!queue.empty()) {
    const std::string hex = queue.top().second;
    queue.pop();
    auto node = pending.extract(hex);
    if (node.empty()) {
      continue; // already processed through an earlier queue entry
    }
    std::vector<Tracked> remaining = std::move(node.mapped());
    const auto &info = commit_of(hex);
    const auto blob = repo_.blob_at(info.tree_hex, path);

    for (const auto &parent : info.parents) {
      if (remaining.empty()) break;
      const auto &pinfo = commit_of(parent);
      const auto parent_blob = repo_.blob_at(pinfo.tree_hex, path);
      if (!parent_blob || !blob) continue;

      std::vector<Tracked> passed;
      std::vector<Tracked> kept;
      if (*parent_blob == *blob) {
        passed = std::move(remaining);
      } else {
        const auto map = diff::correspond(lines_of(*parent_blob), lines_of(*blob));
        for (const auto &t : remaining) {
          const int old_pos = map.new_to_old.at(static_cast<std::size_t>(t.pos));
          if (old_pos >= 0) {
            passed.push_back(Tracked{.final_index = t.final_index, .pos = old_pos});
          } else {
            kept.push_back(t);
          }
        }
      }
      remaining = std::move(kept);
      if (passed.empty()) continue;

      auto &dest = pending[parent];
      if (dest.empty()) {
        queue.emplace(pinfo.commit_time, parent);
      }
      dest.insert(dest.end(), passed.begin(), passed.end());
    }

    for (const auto &t : remaining) {
      result[t.final_index] = LineOrigin{.commit = hex, .line = t.pos + 1};
    }
  }
  return result;
}

BlameView BlameEngine::blame(std::string_view path, std::string_view rev) const {
  const std::string commit = repo_.resolve_commit(rev);
  auto lines = origins(path, commit);
  auto text = repo_.read_text_at(commit, path);
  return BlameView(std::string(path), diff::split_lines(text ? *text : std::string()),
                   std::move(lines), notes_);
}

} // namespace aiblame
