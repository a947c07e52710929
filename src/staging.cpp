#include "aiblame/staging.hpp"

#include "aiblame/consts.hpp"
#include "aiblame/errors.hpp"
#include "aiblame/util.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <set>
#include <sstream>
#include <unistd.h>

using nlohmann::json;

namespace aiblame {

void to_json(json &j, const CaptureEvent &e) {
  j = json{{"path", e.path},
           {"start", e.range.start},
           {"end", e.range.end},
           {"tool", e.tool},
           {"session", e.session_id},
           {"prompt", e.prompt_digest},
           {"ts", e.timestamp_ms},
           {"kind", to_string(e.kind)}};
}

void from_json(const json &j, CaptureEvent &e) {
  j.at("path").get_to(e.path);
  j.at("start").get_to(e.range.start);
  j.at("end").get_to(e.range.end);
  j.at("tool").get_to(e.tool);
  j.at("session").get_to(e.session_id);
  j.at("prompt").get_to(e.prompt_digest);
  j.at("ts").get_to(e.timestamp_ms);
  const auto kind = parse_contributor_kind(j.value("kind", std::string("ai")));
  if (!kind) {
    throw StagingError("unknown contributor kind in staged event");
  }
  e.kind = *kind;
  e.prompt.clear();
}

std::string event_to_json_line(const CaptureEvent &event) { return json(event).dump(); }

CaptureEvent event_from_json_line(std::string_view line) {
  return json::parse(line).get<CaptureEvent>();
}

StagingStore::StagingStore(std::filesystem::path state_dir, std::chrono::milliseconds lock_timeout)
    : dir_(std::move(state_dir)), lock_timeout_(lock_timeout),
      prompts_(dir_ / consts::kPromptsDir) {}

std::filesystem::path StagingStore::pending_file() const { return dir_ / consts::kPendingFile; }

fs::LockFile StagingStore::lock() const {
  return fs::LockFile::acquire(dir_ / consts::kPendingLock, lock_timeout_);
}

std::vector<CaptureEvent> StagingStore::read_locked() const {
  std::vector<CaptureEvent> out;
  const auto path = pending_file();
  if (!fs::exists(path)) {
    return out;
  }

  std::string text;
  try {
    text = fs::read_text(path);
  } catch (const std::exception &e) {
    throw StagingError("staging file unreadable: " + std::string(e.what()));
  }
  if (!text.empty() && text.back() != '\n') {
    throw StagingError(path.string() + ": truncated last event (run 'ai-blame clear' to discard)");
  }

  std::istringstream iss(text);
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(iss, line)) {
    ++line_no;
    if (strutil::trim(line).empty()) {
      continue;
    }
    try {
      CaptureEvent e = event_from_json_line(line);
      if (e.path.empty() || !e.range.valid()) {
        throw StagingError("invalid path or line range");
      }
      out.push_back(std::move(e));
    } catch (const std::exception &e) {
      throw StagingError(path.string() + ":" + std::to_string(line_no) +
                         ": malformed event (" + e.what() +
                         "); run 'ai-blame clear' to discard pending state");
    }
  }
  return out;
}

void StagingStore::write_locked(const std::vector<CaptureEvent> &events) const {
  std::string text;
  for (const auto &e : events) {
    text += event_to_json_line(e);
    text.push_back('\n');
  }

  const auto path = pending_file();
  fs::ensure_parent_dir(path);
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw StagingError("cannot open " + path.string() + ": " + std::strerror(errno));
  }
  std::size_t off = 0;
  while (off < text.size()) {
    const ssize_t n = ::write(fd, text.data() + off, text.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      ::close(fd);
      throw StagingError("write to " + path.string() + " failed: " + std::strerror(err));
    }
    off += static_cast<std::size_t>(n);
  }
  const int sync_rc = ::fsync(fd);
  ::close(fd);
  if (sync_rc != 0) {
    throw StagingError("fsync of " + path.string() + " failed");
  }
}

void StagingStore::append(const CaptureEvent &event) const { append_all({event}); }

void StagingStore::append_all(const std::vector<CaptureEvent> &events) const {
  if (events.empty()) {
    return;
  }
  std::vector<CaptureEvent> staged;
  staged.reserve(events.size());
  auto guard = lock();
  for (const auto &e : events) {
    if (e.path.empty() || !e.range.valid()) {
      throw StagingError("refusing to stage event with empty path or range");
    }
    CaptureEvent s = e;
    if (!s.prompt.empty()) {
      s.prompt_digest = prompts_.put(s.prompt);
      s.prompt.clear();
    }
    staged.push_back(std::move(s));
  }
  write_locked(staged);
}

PendingStatus StagingStore::current_status() const {
  std::vector<CaptureEvent> events;
  {
    auto guard = lock();
    events = read_locked();
  }

  PendingStatus st;
  st.has_pending = !events.empty();
  st.event_count = events.size();
  std::set<std::string> files;
  std::set<std::string> seen_sessions;
  for (const auto &e : events) {
    files.insert(e.path);
    st.line_count += static_cast<std::size_t>(e.range.length());
    if (seen_sessions.insert(e.session_id).second) {
      st.sessions.push_back(e.session_id);
    }
  }
  st.file_count = files.size();
  if (!events.empty()) {
    st.session_id = events.back().session_id;
  }
  return st;
}

std::vector<CaptureEvent> StagingStore::drain_all() const {
  auto guard = lock();
  auto events = read_locked();
  std::error_code ec;
  std::filesystem::remove(pending_file(), ec);
  if (ec) {
    throw StagingError("cannot remove " + pending_file().string() + ": " + ec.message());
  }
  return events;
}

void StagingStore::clear() const {
  auto guard = lock();
  std::error_code ec;
  std::filesystem::remove(pending_file(), ec);
  if (ec) {
    throw StagingError("cannot remove " + pending_file().string() + ": " + ec.message());
  }
}

} // namespace aiblame
