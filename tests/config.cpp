#include "aiblame/config.hpp"
#include "aiblame/fs.hpp"
#include "aiblame/hooks.hpp"

#include "test_support.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

int main() {
  testsupport::Sandbox sb("config");
  const auto git_dir = sb.root / ".git";
  try {
    ::unsetenv("AI_BLAME_NOTES_REF");
    ::unsetenv("AI_BLAME_LOCK_TIMEOUT_MS");

    // defaults
    auto s = aiblame::load_settings(git_dir);
    if (s.notes_ref != "refs/notes/ai-blame" || s.lock_timeout_ms != 5000 || s.note_retries != 5) {
      std::cerr << "unexpected defaults\n";
      return 1;
    }

    // file, then environment on top
    testsupport::write_file(git_dir / "ai-blame" / "config",
                            "# tuning\nnotes-ref: refs/notes/team\nlock-timeout-ms: 250\n"
                            "note-retries: 9\nunknown-key: whatever\n");
    s = aiblame::load_settings(git_dir);
    if (s.notes_ref != "refs/notes/team" || s.lock_timeout_ms != 250 || s.note_retries != 9) {
      std::cerr << "config file not applied\n";
      return 1;
    }
    ::setenv("AI_BLAME_LOCK_TIMEOUT_MS", "75", 1);
    ::setenv("AI_BLAME_NOTES_REF", "refs/notes/env", 1);
    s = aiblame::load_settings(git_dir);
    if (s.notes_ref != "refs/notes/env" || s.lock_timeout_ms != 75) {
      std::cerr << "environment overrides not applied\n";
      return 1;
    }
    ::setenv("AI_BLAME_NOTES_REF", "refs/heads/oops", 1);
    bool threw = false;
    try {
      (void)aiblame::load_settings(git_dir);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    ::unsetenv("AI_BLAME_NOTES_REF");
    ::unsetenv("AI_BLAME_LOCK_TIMEOUT_MS");
    if (!threw) {
      std::cerr << "notes ref outside refs/notes accepted\n";
      return 1;
    }
    testsupport::write_file(git_dir / "ai-blame" / "config", "lock-timeout-ms: soon\n");
    threw = false;
    try {
      (void)aiblame::load_settings(git_dir);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "malformed number accepted\n";
      return 1;
    }

    // identity from the repository config
    testsupport::write_file(git_dir / "config",
                            "[core]\n\tbare = false\n[user]\n\tname = Ada Lovelace\n"
                            "\temail = ada@example.com ; work\n"
                            "[remote \"origin\"]\n\turl = https://example.com/r.git\n"
                            "\tfetch = +refs/heads/*:refs/remotes/origin/*\n");
    const auto id = aiblame::load_identity(git_dir);
    if (id.name != "Ada Lovelace" || id.email != "ada@example.com") {
      std::cerr << "identity not read: " << id.name << " <" << id.email << ">\n";
      return 1;
    }

    // refspecs appended once, existing values kept
    aiblame::GitConfig cfg{git_dir / "config"};
    cfg.load();
    const auto added = aiblame::hooks::configure_notes_refspecs(cfg, "refs/notes/ai-blame");
    const auto again = aiblame::hooks::configure_notes_refspecs(cfg, "refs/notes/ai-blame");
    aiblame::GitConfig reread{git_dir / "config"};
    reread.load();
    const auto fetch = reread.get_all("remote.origin.fetch");
    if (added.size() != 2 || !again.empty() || fetch.size() != 2 ||
        fetch[0] != "+refs/heads/*:refs/remotes/origin/*" ||
        fetch[1] != "+refs/notes/ai-blame:refs/notes/ai-blame" ||
        reread.get("remote.origin.push").value_or("") != "refs/notes/ai-blame" ||
        reread.get("user.name").value_or("") != "Ada Lovelace") {
      std::cerr << "refspecs not configured as expected\n";
      return 1;
    }
    aiblame::GitConfig no_remote{sb.root / "other.config"};
    no_remote.load();
    if (!aiblame::hooks::configure_notes_refspecs(no_remote, "refs/notes/ai-blame").empty()) {
      std::cerr << "refspecs added without a remote\n";
      return 1;
    }

    // hooks: created, appended to a foreign hook, idempotent
    const auto hooks = git_dir / "hooks";
    using aiblame::hooks::HookInstall;
    if (aiblame::hooks::install_hook(hooks, "post-commit", "ai-blame post-commit") !=
            HookInstall::Created ||
        aiblame::hooks::install_hook(hooks, "post-commit", "ai-blame post-commit") !=
            HookInstall::AlreadyPresent) {
      std::cerr << "post-commit hook install not idempotent\n";
      return 1;
    }
    const auto hook_text = aiblame::fs::read_text(hooks / "post-commit");
    if (hook_text.rfind("#!/bin/sh\n", 0) != 0 ||
        hook_text.find("ai-blame post-commit || true") == std::string::npos) {
      std::cerr << "hook body unexpected:\n" << hook_text;
      return 1;
    }
    const auto perms = std::filesystem::status(hooks / "post-commit").permissions();
    if ((perms & std::filesystem::perms::owner_exec) == std::filesystem::perms::none) {
      std::cerr << "hook not executable\n";
      return 1;
    }
    testsupport::write_file(hooks / "post-rewrite", "#!/bin/sh\necho mine\n");
    if (aiblame::hooks::install_hook(hooks, "post-rewrite", "ai-blame post-rewrite \"$1\"") !=
        HookInstall::Appended) {
      std::cerr << "foreign hook not appended to\n";
      return 1;
    }
    const auto rewrite_text = aiblame::fs::read_text(hooks / "post-rewrite");
    if (rewrite_text.find("echo mine") == std::string::npos ||
        rewrite_text.find("ai-blame post-rewrite \"$1\" || true") == std::string::npos) {
      std::cerr << "appended hook lost content\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "config test failed: " << e.what() << "\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
