#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_capture(int argc, char **argv);
int cmd_post_commit(int, char **);
int cmd_post_rewrite(int, char **);
int cmd_status(int, char **);
int cmd_clear(int, char **);
int cmd_blame(int, char **);
int cmd_show(int, char **);
int cmd_prompt(int, char **);
int cmd_summary(int, char **);
int cmd_copy_notes(int, char **);
int cmd_propagate(int, char **);

namespace aiblame::cli {

const std::vector<Command> &commands() {
  static const std::vector<Command> table = {
      {"init", ::cmd_init, "Install commit hooks and notes refspecs"},
      {"capture", ::cmd_capture,
       "Stage an edit: hook JSON on stdin, or --file F [--start N --end M] "
       "[--tool T] [--prompt P] [--session S] [--kind ai|human]"},
      {"post-commit", ::cmd_post_commit, "Attach staged attribution to HEAD"},
      {"post-rewrite", ::cmd_post_rewrite,
       "Carry attribution across amend/rebase (reads git's pairs on stdin)"},
      {"status", ::cmd_status, "Show what is staged for the next commit"},
      {"clear", ::cmd_clear, "Discard staged attribution"},
      {"blame", ::cmd_blame, "Per-line attribution: ai-blame blame <file> [--rev R] [--json]"},
      {"show", ::cmd_show, "Attribution record of a commit: ai-blame show [rev] [--json]"},
      {"prompt", ::cmd_prompt, "Prompt behind a line: ai-blame prompt <file> <line> [--rev R]"},
      {"summary", ::cmd_summary, "Totals over a range: ai-blame summary [A..B] [--json]"},
      {"copy-notes", ::cmd_copy_notes,
       "Copy attribution verbatim: ai-blame copy-notes <src> <dst> [--dry-run]"},
      {"propagate", ::cmd_propagate,
       "Remap attribution onto a rewritten commit: ai-blame propagate <old> <new>"},
  };
  return table;
}

} // namespace aiblame::cli
