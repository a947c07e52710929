#include "aiblame/errors.hpp"
#include "aiblame/fs.hpp"
#include "aiblame/hash.hpp"
#include "aiblame/staging.hpp"

#include "test_support.hpp"

#include <chrono>
#include <iostream>
#include <map>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

using aiblame::CaptureEvent;
using aiblame::ContributorKind;
using aiblame::LineRange;

static CaptureEvent event(const std::string &path, int start, int end, std::int64_t ts,
                          const std::string &session = "s1", const std::string &prompt = "") {
  return CaptureEvent{.path = path,
                      .range = LineRange{.start = start, .end = end},
                      .tool = "claude",
                      .prompt = prompt,
                      .prompt_digest = {},
                      .session_id = session,
                      .timestamp_ms = ts,
                      .kind = ContributorKind::Ai};
}

int main() {
  testsupport::Sandbox sb("staging");
  const auto state = sb.root / ".git" / "ai-blame";
  const aiblame::StagingStore store{state, std::chrono::milliseconds(2000)};

  try {
    // nothing staged is not an error
    if (store.current_status().has_pending || !store.drain_all().empty()) {
      std::cerr << "fresh store reports pending events\n";
      return 1;
    }

    // append order is drain order; prompts leave the log
    store.append(event("a.txt", 1, 3, 100, "s1", "write a parser"));
    store.append(event("b.txt", 5, 6, 50, "s2"));
    store.append(event("a.txt", 2, 9, 200, "s1"));

    const auto st = store.current_status();
    if (!st.has_pending || st.event_count != 3 || st.file_count != 2 || st.line_count != 10 ||
        st.session_id != "s1" || st.sessions.size() != 2) {
      std::cerr << "unexpected status: events=" << st.event_count << " files=" << st.file_count
                << " lines=" << st.line_count << "\n";
      return 1;
    }
    if (aiblame::fs::read_text(store.pending_file()).find("write a parser") != std::string::npos) {
      std::cerr << "prompt text leaked into the staging log\n";
      return 1;
    }

    auto drained = store.drain_all();
    if (drained.size() != 3 || drained[0].path != "a.txt" || drained[1].path != "b.txt" ||
        drained[2].range != LineRange{.start = 2, .end = 9}) {
      std::cerr << "drain order differs from append order\n";
      return 1;
    }
    const std::string digest = aiblame::sha256_hex("write a parser");
    if (drained[0].prompt_digest != digest || !drained[0].prompt.empty()) {
      std::cerr << "prompt digest not recorded\n";
      return 1;
    }
    if (store.prompts().get(digest).value_or("") != "write a parser") {
      std::cerr << "prompt store lost the text\n";
      return 1;
    }
    if (!store.drain_all().empty()) {
      std::cerr << "second drain returned events\n";
      return 1;
    }

    // clear discards
    store.append(event("c.txt", 1, 2, 1));
    store.clear();
    if (store.current_status().has_pending) {
      std::cerr << "clear left events behind\n";
      return 1;
    }

    // interleaved appends from separate processes
    constexpr int kWriters = 4;
    constexpr int kPerWriter = 25;
    std::vector<pid_t> children;
    for (int w = 0; w < kWriters; ++w) {
      const pid_t pid = ::fork();
      if (pid < 0) {
        std::cerr << "fork failed\n";
        return 1;
      }
      if (pid == 0) {
        int rc = 0;
        try {
          for (int i = 0; i < kPerWriter; ++i) {
            store.append(event("w" + std::to_string(w) + ".txt", i + 1, i + 2, i));
          }
        } catch (const std::exception &e) {
          std::cerr << "writer " << w << ": " << e.what() << "\n";
          rc = 1;
        }
        ::_exit(rc);
      }
      children.push_back(pid);
    }
    for (const pid_t pid : children) {
      int status = 0;
      ::waitpid(pid, &status, 0);
      if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::cerr << "a writer process failed\n";
        return 1;
      }
    }
    const auto all = store.drain_all();
    if (all.size() != static_cast<std::size_t>(kWriters * kPerWriter)) {
      std::cerr << "expected " << kWriters * kPerWriter << " events, got " << all.size() << "\n";
      return 1;
    }
    std::map<std::string, int> next;
    for (const auto &e : all) {
      int &expected = next[e.path];
      if (e.range.start != expected + 1) {
        std::cerr << "events of " << e.path << " out of order\n";
        return 1;
      }
      ++expected;
    }

    // malformed data is an error, distinct from "nothing pending"
    testsupport::write_file(store.pending_file(), "{\"path\":\"x\"}\nnot json\n");
    bool threw = false;
    try {
      (void)store.current_status();
    } catch (const aiblame::StagingError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "corrupt staging file not reported\n";
      return 1;
    }
    testsupport::write_file(store.pending_file(), aiblame::event_to_json_line(event("x", 1, 2, 1)));
    threw = false;
    try {
      (void)store.drain_all();
    } catch (const aiblame::StagingError &) {
      threw = true;
    }
    if (!threw || !aiblame::fs::exists(store.pending_file())) {
      std::cerr << "truncated event must fail without discarding the log\n";
      return 1;
    }
    store.clear();
    if (store.current_status().has_pending) {
      std::cerr << "clear did not recover from corruption\n";
      return 1;
    }

    // a holder whose lock was taken over as stale must not remove its successor's
    const auto lock_path = sb.root / "takeover.lock";
    auto slow = aiblame::fs::LockFile::acquire(lock_path, std::chrono::milliseconds(50));
    auto successor = aiblame::fs::LockFile::acquire(lock_path, std::chrono::milliseconds(50));
    if (slow.owned() || !successor.owned()) {
      std::cerr << "stale lock takeover not reflected in ownership\n";
      return 1;
    }
    slow.release();
    if (aiblame::fs::LockFile::try_acquire(lock_path).has_value()) {
      std::cerr << "releasing a taken-over lock freed the successor's lock\n";
      return 1;
    }
    bool refused = false;
    try {
      slow = aiblame::fs::LockFile::acquire(lock_path, std::chrono::milliseconds(50));
      auto again = aiblame::fs::LockFile::acquire(lock_path, std::chrono::milliseconds(50));
      slow.commit_to(sb.root / "takeover.target");
    } catch (const std::runtime_error &) {
      refused = true;
    }
    if (!refused || aiblame::fs::exists(sb.root / "takeover.target")) {
      std::cerr << "a taken-over lock was still committed\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "staging test failed: " << e.what() << "\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
