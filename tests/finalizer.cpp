#include "aiblame/errors.hpp"
#include "aiblame/finalizer.hpp"

#include "test_support.hpp"

#include <chrono>
#include <initializer_list>
#include <iostream>
#include <string>

using aiblame::CaptureEvent;
using aiblame::ContributorKind;
using aiblame::LineRange;

static CaptureEvent event(const std::string &path, int start, int end, std::int64_t ts,
                          const std::string &tool = "claude", const std::string &prompt = "") {
  return CaptureEvent{.path = path,
                      .range = LineRange{.start = start, .end = end},
                      .tool = tool,
                      .prompt = prompt,
                      .prompt_digest = {},
                      .session_id = "s1",
                      .timestamp_ms = ts,
                      .kind = ContributorKind::Ai};
}

// Lines 1..n, with the listed line numbers given new text.
static std::string edited(int n, std::initializer_list<int> changed, std::string_view tag) {
  std::string out;
  for (int i = 1; i <= n; ++i) {
    bool hit = false;
    for (const int c : changed) hit = hit || c == i;
    out += hit ? std::string(tag) + " " + std::to_string(i) + "\n"
               : "line " + std::to_string(i) + "\n";
  }
  return out;
}

int main() {
  testsupport::Sandbox sb("finalizer");
  try {
    const aiblame::Repository repo{sb.root};
    const aiblame::NotesRepository notes{repo, testsupport::default_settings()};
    const aiblame::StagingStore staging{repo.state_dir(), std::chrono::milliseconds(2000)};
    const aiblame::Finalizer finalizer{repo, staging, notes};

    // root commit: every line of a new file counts as changed
    const auto c0 = testsupport::commit(repo, {{"a.txt", testsupport::numbered_lines(1, 30)}}, {}, 1000);
    staging.append(event("a.txt", 28, 40, 1, "claude", "write the file"));
    auto r0 = finalizer.run("HEAD");
    const auto rec0 = notes.read(c0);
    if (!r0.written || r0.commit != c0 || !rec0 || rec0->entries.size() != 1 ||
        rec0->entries[0].range != LineRange{.start = 28, .end = 31}) {
      std::cerr << "root commit finalize wrong\n";
      return 1;
    }
    if (rec0->find("a.txt", 31) != nullptr || rec0->total_lines() != 3) {
      std::cerr << "lines past the end of the file were attributed\n";
      return 1;
    }
    if (rec0->prompts.size() != 1 || rec0->prompts.begin()->second != "write the file") {
      std::cerr << "prompt text not attached to the record\n";
      return 1;
    }

    // nothing staged: nothing written
    const auto c1 = testsupport::commit(
        repo, {{"a.txt", edited(30, {12, 13, 14, 18}, "changed")}}, {c0}, 2000);
    const auto empty = finalizer.run("HEAD");
    if (empty.written || empty.events != 0 || notes.has_record(c1)) {
      std::cerr << "finalize without events wrote a record\n";
      return 1;
    }

    // captured [10,20) intersected with changed {12,13,14,18}
    const auto c2 = testsupport::commit(
        repo, {{"a.txt", edited(30, {12, 13, 14, 18}, "again")}}, {c1}, 3000);
    staging.append(event("a.txt", 10, 20, 10));
    staging.append(event("gone.txt", 1, 5, 11)); // not part of the commit
    const auto r2 = finalizer.run("HEAD");
    const auto rec2 = notes.read(c2);
    if (!r2.written || r2.events != 2 || !rec2 || rec2->entries.size() != 2 ||
        rec2->entries[0].range != LineRange{.start = 12, .end = 15} ||
        rec2->entries[1].range != LineRange{.start = 18, .end = 19} ||
        rec2->entries[0].path != "a.txt") {
      std::cerr << "intersection with changed lines wrong\n";
      return 1;
    }
    if (staging.current_status().has_pending) {
      std::cerr << "finalize did not drain staging\n";
      return 1;
    }

    // overlapping events: the later timestamp wins, whatever the append order
    const auto c3 = testsupport::commit(
        repo, {{"a.txt", edited(30, {1, 2, 3, 4, 5}, "rewritten")}}, {c2}, 4000);
    staging.append(event("a.txt", 1, 6, 200, "first"));
    staging.append(event("a.txt", 3, 5, 100, "stale"));
    staging.append(event("a.txt", 4, 6, 300, "last"));
    finalizer.run("HEAD");
    const auto rec3 = notes.read(c3);
    if (!rec3 || rec3->entries.size() != 2 || rec3->entries[0].tool != "first" ||
        rec3->entries[0].range != LineRange{.start = 1, .end = 4} ||
        rec3->entries[1].tool != "last" ||
        rec3->entries[1].range != LineRange{.start = 4, .end = 6}) {
      std::cerr << "last-writer-wins resolution wrong\n";
      return 1;
    }

    // persistence failure after the drain: error names the dump
    const auto c4 = testsupport::commit(
        repo, {{"a.txt", edited(30, {30}, "tail")}}, {c3}, 5000);
    auto settings = testsupport::default_settings();
    settings.note_retries = 1;
    const aiblame::NotesRepository stuck{repo, settings};
    const aiblame::Finalizer failing{repo, staging, stuck};
    staging.append(event("a.txt", 30, 31, 1));
    const auto lock = repo.git_dir() / "refs" / "notes" / "ai-blame.lock";
    testsupport::write_file(lock, "held\n");
    bool threw = false;
    try {
      failing.run("HEAD");
    } catch (const aiblame::FinalizeError &e) {
      threw = std::string(e.what()).find("orphaned-" + c4) != std::string::npos;
    }
    std::filesystem::remove(lock);
    const auto dump = repo.state_dir() / ("orphaned-" + c4 + ".jsonl");
    if (!threw || !aiblame::fs::exists(dump) ||
        aiblame::event_from_json_line(aiblame::fs::read_text(dump).substr(
            0, aiblame::fs::read_text(dump).find('\n'))).range != LineRange{.start = 30, .end = 31}) {
      std::cerr << "persistence failure not reported with its dump\n";
      return 1;
    }

    // bad revision keeps the staged events
    staging.append(event("a.txt", 1, 2, 1));
    threw = false;
    try {
      finalizer.run("does-not-exist");
    } catch (const aiblame::RevisionError &) {
      threw = true;
    }
    if (!threw || staging.current_status().event_count != 1) {
      std::cerr << "bad revision consumed staged events\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "finalizer test failed: " << e.what() << "\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
