#pragma once
#include "aiblame/config.hpp"
#include "aiblame/notes.hpp"
#include "aiblame/repo.hpp"
#include "aiblame/staging.hpp"

#include <chrono>
#include <filesystem>

namespace aiblame::cli {

// What every command needs, opened from the current directory.
struct Context {
  explicit Context(const std::filesystem::path& start)
      : repo(Repository::discover(start)), settings(load_settings(repo.git_dir())),
        staging(repo.state_dir(), std::chrono::milliseconds(settings.lock_timeout_ms)),
        notes(repo, settings) {}

  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  Repository repo;
  Settings settings;
  StagingStore staging;
  NotesRepository notes;
};

} // namespace aiblame::cli
