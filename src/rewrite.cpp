#include "aiblame/rewrite.hpp"

#include "aiblame/diff.hpp"
#include "aiblame/errors.hpp"
#include "aiblame/util.hpp"

#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>

namespace aiblame {

namespace {

using LineOwners = std::map<std::string, std::map<int, LineAttribution>>; // path -> line -> owner

std::vector<std::string> blob_lines(const Repository &repo, const std::string &hex) {
  const auto bytes = repo.read_blob(hex);
  return diff::split_lines(
      std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size()));
}

// Later calls overwrite earlier ones line by line.
void overlay(LineOwners &owners, std::map<std::string, std::string> &prompts,
             const AttributionRecord &record) {
  for (const auto &e : record.entries) {
    auto &file = owners[e.path];
    for (int l = e.range.start; l < e.range.end; ++l) file[l] = e;
  }
  for (const auto &[digest, text] : record.prompts) prompts[digest] = text;
}

AttributionRecord assemble(const std::string &commit, const LineOwners &owners,
                           std::map<std::string, std::string> prompts) {
  AttributionRecord r;
  r.commit = commit;
  for (const auto &[path, lines] : owners) {
    for (auto &e : coalesce_lines(path, lines)) r.entries.push_back(std::move(e));
  }
  r.prompts = std::move(prompts);
  r.normalize();
  return r;
}

} // namespace

AttributionRecord RewritePropagator::remap(const AttributionRecord &old_record,
                                           std::string_view old_hex,
                                           std::string_view new_hex) const {
  const auto old_tree = repo_.read_commit(old_hex).tree_hex;
  const auto new_tree = repo_.read_commit(new_hex).tree_hex;

  std::map<std::string, std::vector<const LineAttribution *>> by_path;
  for (const auto &e : old_record.entries) by_path[e.path].push_back(&e);

  LineOwners owners;
  for (const auto &[path, entries] : by_path) {
    const auto old_blob = repo_.blob_at(old_tree, path);
    const auto new_blob = repo_.blob_at(new_tree, path);
    if (!old_blob || !new_blob) {
      continue;
    }
    const auto before = blob_lines(repo_, *old_blob);
    std::vector<int> old_to_new;
    if (*old_blob == *new_blob) {
      old_to_new.resize(before.size());
      for (std::size_t i = 0; i < before.size(); ++i) old_to_new[i] = static_cast<int>(i);
    } else {
      old_to_new = diff::correspond(before, blob_lines(repo_, *new_blob)).old_to_new;
    }

    auto &file = owners[path];
    for (const LineAttribution *e : entries) {
      for (int l = e->range.start; l < e->range.end; ++l) {
        if (l < 1 || static_cast<std::size_t>(l) > old_to_new.size()) continue;
        const int mapped = old_to_new[static_cast<std::size_t>(l - 1)];
        if (mapped >= 0) file[mapped + 1] = *e;
      }
    }
  }
  return assemble(std::string(new_hex), owners, old_record.prompts);
}

PropagateResult RewritePropagator::propagate(std::string_view old_rev,
                                             std::string_view new_rev) const {
  PropagateResult result;
  result.old_commit = repo_.resolve_commit(old_rev);
  result.new_commit = repo_.resolve_commit(new_rev);

  const auto old_record = notes_.read(result.old_commit);
  if (!old_record) {
    throw MissingRecordError(result.old_commit);
  }

  LineOwners owners;
  std::map<std::string, std::string> prompts;
  overlay(owners, prompts, remap(*old_record, result.old_commit, result.new_commit));
  // amend: post-commit may already have recorded fresh edits on the new commit
  const auto existing = notes_.read(result.new_commit);
  if (existing) {
    overlay(owners, prompts, *existing);
  }
  result.record = assemble(result.new_commit, owners, std::move(prompts));

  if (result.record.entries.empty() || (existing && *existing == result.record)) {
    return result;
  }
  notes_.write(result.new_commit, result.record);
  result.written = true;
  return result;
}

std::vector<PropagateResult> RewritePropagator::post_rewrite(std::istream &in) const {
  struct Pending {
    std::vector<std::string> olds;
    LineOwners owners;
    std::map<std::string, std::string> prompts;
  };
  std::vector<std::string> order; // new commits, first-seen order
  std::map<std::string, Pending> by_new;

  std::string line;
  while (std::getline(in, line)) {
    strutil::rstrip_newlines(line);
    const auto fields = strutil::split(strutil::trim(line), ' ');
    if (fields.size() < 2 || !looks_hex40(fields[0]) || !looks_hex40(fields[1])) {
      if (!line.empty() && std::getenv("AI_BLAME_DEBUG") != nullptr) {
        std::cerr << "ai-blame: ignoring rewrite line '" << line << "'\n";
      }
      continue;
    }
    const std::string &old_hex = fields[0];
    const std::string &new_hex = fields[1];
    const auto old_record = notes_.read(old_hex);
    if (!old_record) {
      continue;
    }
    auto [it, inserted] = by_new.try_emplace(new_hex);
    if (inserted) order.push_back(new_hex);
    it->second.olds.push_back(old_hex);
    overlay(it->second.owners, it->second.prompts, remap(*old_record, old_hex, new_hex));
  }

  std::vector<PropagateResult> results;
  for (const auto &new_hex : order) {
    Pending &p = by_new[new_hex];
    const auto existing = notes_.read(new_hex);
    if (existing) {
      overlay(p.owners, p.prompts, *existing);
    }
    PropagateResult r;
    r.old_commit = p.olds.back();
    r.new_commit = new_hex;
    r.record = assemble(new_hex, p.owners, std::move(p.prompts));
    if (!r.record.entries.empty() && !(existing && *existing == r.record)) {
      notes_.write(new_hex, r.record);
      r.written = true;
    }
    results.push_back(std::move(r));
  }
  return results;
}

} // namespace aiblame
