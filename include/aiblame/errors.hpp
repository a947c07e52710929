#pragma once
#include <stdexcept>
#include <string>

namespace aiblame {

// No .git directory could be found from the starting path upwards.
class NotARepositoryError : public std::runtime_error {
public:
  explicit NotARepositoryError(const std::string& where)
      : std::runtime_error("not a git repository (or any parent up to /): " + where) {}
};

// A revision string did not resolve to a commit.
class RevisionError : public std::runtime_error {
public:
  explicit RevisionError(const std::string& rev)
      : std::runtime_error("unknown revision: " + rev), rev_(rev) {}
  [[nodiscard]] const std::string& revision() const { return rev_; }

private:
  std::string rev_;
};

// Object missing, of the wrong type, or corrupt on disk.
class ObjectError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Staging file is unreadable or malformed. Distinct from "nothing pending".
class StagingError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Tool-hook payload is not the JSON shape we expect.
class CaptureError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A note blob could not be decoded.
class CodecError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Ref lock held by someone else, or the ref moved under us.
class RefConflictError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Note write still conflicting after the bounded retries. Retryable by the caller.
class NoteConflictError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// copy/propagate was asked to read a record that does not exist.
class MissingRecordError : public std::runtime_error {
public:
  explicit MissingRecordError(const std::string& commit_hex)
      : std::runtime_error("commit " + commit_hex + " has no attribution record") {}
};

// Events were drained but the record could not be persisted.
class FinalizeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace aiblame
