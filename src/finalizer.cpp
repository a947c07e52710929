#include "aiblame/finalizer.hpp"

#include "aiblame/consts.hpp"
#include "aiblame/diff.hpp"
#include "aiblame/errors.hpp"
#include "aiblame/fs.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <numeric>

namespace aiblame {

namespace {

std::vector<std::string> blob_lines(const Repository &repo, const std::string &hex) {
  const auto bytes = repo.read_blob(hex);
  return diff::split_lines(
      std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size()));
}

std::set<int> all_lines(std::size_t n) {
  std::set<int> out;
  for (std::size_t i = 1; i <= n; ++i) out.insert(static_cast<int>(i));
  return out;
}

} // namespace

ChangedLines Finalizer::changed_lines(std::string_view commit_hex, std::string_view path) const {
  try {
    const auto info = repo_.read_commit(commit_hex);
    const auto new_blob = repo_.blob_at(info.tree_hex, path);
    if (!new_blob) {
      return std::set<int>{}; // not part of this commit's tree
    }
    const auto after = blob_lines(repo_, *new_blob);
    if (info.parents.empty()) {
      return all_lines(after.size());
    }
    // Merge commits are compared against their first parent only.
    const auto parent = repo_.read_commit(info.parents.front());
    const auto old_blob = repo_.blob_at(parent.tree_hex, path);
    if (!old_blob) {
      return all_lines(after.size());
    }
    if (*old_blob == *new_blob) {
      return std::set<int>{};
    }
    const auto map = diff::correspond(blob_lines(repo_, *old_blob), after);
    std::set<int> out;
    for (std::size_t i = 0; i < map.new_to_old.size(); ++i) {
      if (map.new_to_old[i] < 0) out.insert(static_cast<int>(i) + 1);
    }
    return out;
  } catch (const std::exception &e) {
    if (std::getenv("AI_BLAME_DEBUG") != nullptr) {
      std::cerr << "ai-blame: diff of " << path << " failed (" << e.what()
                << "); keeping captured ranges\n";
    }
    return std::nullopt;
  }
}

AttributionRecord Finalizer::resolve(const std::string &commit_hex,
                                     const std::vector<CaptureEvent> &events,
                                     const std::map<std::string, ChangedLines> &changed,
                                     const PromptStore &prompts) {
  // Oldest first, so later events overwrite earlier ones line by line.
  std::vector<std::size_t> order(events.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::ranges::stable_sort(order, [&](std::size_t a, std::size_t b) {
    return events[a].timestamp_ms < events[b].timestamp_ms;
  });

  std::map<std::string, std::map<int, LineAttribution>> owners; // path -> line -> owner
  for (const std::size_t i : order) {
    const auto &ev = events[i];
    const auto it = changed.find(ev.path);
    const std::set<int> *allowed =
        (it != changed.end() && it->second.has_value()) ? &*it->second : nullptr;

    const LineAttribution owner{.path = ev.path,
                                .range = {},
                                .kind = ev.kind,
                                .tool = ev.tool,
                                .session_id = ev.session_id,
                                .prompt_digest = ev.prompt_digest};
    auto &file = owners[ev.path];
    if (allowed != nullptr) {
      for (auto l = allowed->lower_bound(ev.range.start);
           l != allowed->end() && *l < ev.range.end; ++l) {
        file[*l] = owner;
      }
    } else {
      for (int l = ev.range.start; l < ev.range.end; ++l) file[l] = owner;
    }
  }

  AttributionRecord record;
  record.commit = commit_hex;
  for (const auto &[path, lines] : owners) {
    for (auto &e : coalesce_lines(path, lines)) {
      record.entries.push_back(std::move(e));
    }
  }
  for (const auto &e : record.entries) {
    if (e.prompt_digest.empty() || record.prompts.contains(e.prompt_digest)) continue;
    if (auto text = prompts.get(e.prompt_digest)) {
      record.prompts[e.prompt_digest] = std::move(*text);
    }
  }
  record.normalize();
  return record;
}

FinalizeResult Finalizer::run(std::string_view commit_rev) const {
  // Resolve first: a bad revision must not cost the staged events.
  FinalizeResult result;
  result.commit = repo_.resolve_commit(commit_rev);

  const auto events = staging_.drain_all();
  result.events = events.size();
  if (events.empty()) {
    return result;
  }

  std::map<std::string, ChangedLines> changed;
  for (const auto &ev : events) {
    if (!changed.contains(ev.path)) {
      changed[ev.path] = changed_lines(result.commit, ev.path);
    }
  }

  const AttributionRecord record = resolve(result.commit, events, changed, staging_.prompts());
  result.entries = record.entries.size();
  result.lines = record.total_lines();
  if (record.entries.empty()) {
    return result;
  }

  try {
    notes_.write(result.commit, record);
    result.written = true;
  } catch (const std::exception &e) {
    const auto dump = staging_.pending_file().parent_path() /
                      (std::string(consts::kOrphanPrefix) + result.commit + ".jsonl");
    std::string text;
    for (const auto &ev : events) {
      text += event_to_json_line(ev);
      text.push_back('\n');
    }
    std::string where;
    try {
      fs::write_text_atomic(dump, text);
      where = "; drained events saved to " + dump.string();
    } catch (const std::exception &dump_error) {
      where = "; saving drained events also failed: " + std::string(dump_error.what());
    }
    throw FinalizeError("attribution for " + result.commit + " not saved (" +
                        std::to_string(events.size()) + " events drained): " + e.what() + where);
  }
  return result;
}

} // namespace aiblame
