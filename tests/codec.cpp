#include "aiblame/codec.hpp"
#include "aiblame/errors.hpp"

#include <iostream>
#include <string>

using aiblame::AttributionRecord;
using aiblame::ContributorKind;
using aiblame::LineAttribution;
using aiblame::LineRange;

int main() {
  const std::string commit(40, 'a');
  AttributionRecord r;
  r.commit = commit;
  r.entries.push_back(LineAttribution{.path = "src/z.cpp",
                                      .range = LineRange{.start = 4, .end = 9},
                                      .kind = ContributorKind::Ai,
                                      .tool = "claude",
                                      .session_id = "sess\t1",
                                      .prompt_digest = std::string(64, 'f')});
  r.entries.push_back(LineAttribution{.path = "dir with space/a b.txt",
                                      .range = LineRange{.start = 1, .end = 2},
                                      .kind = ContributorKind::Human,
                                      .tool = {},
                                      .session_id = {},
                                      .prompt_digest = {}});
  r.prompts[std::string(64, 'f')] = "multi\nline \\ prompt\twith tab";
  r.prompts["unused"] = "dropped on encode";

  const std::string text = aiblame::codec::encode(r);
  if (text.rfind("ai-blame-record 1\ncommit " + commit + "\n", 0) != 0) {
    std::cerr << "unexpected header:\n" << text;
    return 1;
  }
  const AttributionRecord back = aiblame::codec::decode(text);
  if (back.entries.size() != 2 || back.entries[0].path != "dir with space/a b.txt" ||
      back.entries[1].session_id != "sess\t1" || back.prompts.size() != 1 ||
      back.prompts.at(std::string(64, 'f')) != "multi\nline \\ prompt\twith tab") {
    std::cerr << "decode lost information\n";
    return 1;
  }

  // what git's cat_sort_uniq merge strategy produces: lines sorted, duplicates removed
  const std::string merged = "commit " + commit + "\n" +
                             "range a.txt\t1\t3\tai\tclaude\t\t\n" +
                             "ai-blame-record 1\n" + "range a.txt\t1\t3\tai\tclaude\t\t\n";
  const auto m = aiblame::codec::decode(merged);
  if (m.entries.size() != 1 || m.entries[0].range != LineRange{.start = 1, .end = 3}) {
    std::cerr << "reordered note did not decode\n";
    return 1;
  }

  const char *bad[] = {
      "",
      "commit " "0000000000000000000000000000000000000000\n",
      "ai-blame-record 2\ncommit 0000000000000000000000000000000000000000\n",
      "ai-blame-record 1\n",
      "ai-blame-record 1\ncommit 0000000000000000000000000000000000000000\nrange a\t5\t5\tai\t\t\t\n",
      "ai-blame-record 1\ncommit 0000000000000000000000000000000000000000\nrange a\t1\t2\trobot\t\t\t\n",
      "ai-blame-record 1\ncommit 0000000000000000000000000000000000000000\nfrobnicate\n",
  };
  for (const char *b : bad) {
    bool threw = false;
    try {
      (void)aiblame::codec::decode(b);
    } catch (const aiblame::CodecError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "accepted malformed note: " << b << "\n";
      return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}
