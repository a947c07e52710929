#pragma once
#include "aiblame/attribution.hpp"
#include "aiblame/fs.hpp"
#include "aiblame/prompt_store.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace aiblame {

// Durable accumulator of capture events between tool invocations and the
// commit that consumes them. One JSON object per line in
// .git/ai-blame/pending.jsonl; every operation holds pending.lock.
class StagingStore {
public:
  StagingStore(std::filesystem::path state_dir, std::chrono::milliseconds lock_timeout);

  // Stage one event. Its prompt text goes to the prompt store and only the
  // digest is written to the log.
  void append(const CaptureEvent& event) const;

  // Stage several events under a single lock acquisition.
  void append_all(const std::vector<CaptureEvent>& events) const;

  // Counters for the status report. Throws StagingError on malformed data.
  [[nodiscard]] PendingStatus current_status() const;

  // Remove and return everything staged, in append order.
  std::vector<CaptureEvent> drain_all() const;

  // Discard everything staged, malformed or not.
  void clear() const;

  [[nodiscard]] const PromptStore& prompts() const { return prompts_; }
  [[nodiscard]] std::filesystem::path pending_file() const;

private:
  [[nodiscard]] fs::LockFile lock() const;
  [[nodiscard]] std::vector<CaptureEvent> read_locked() const;
  void write_locked(const std::vector<CaptureEvent>& events) const;

  std::filesystem::path dir_;
  std::chrono::milliseconds lock_timeout_;
  PromptStore prompts_;
};

// One event as a single JSON line (no trailing newline), and back.
std::string event_to_json_line(const CaptureEvent& event);
CaptureEvent event_from_json_line(std::string_view line);

} // namespace aiblame
