#include "aiblame/capture.hpp"
#include "aiblame/errors.hpp"

#include "test_support.hpp"

#include <iostream>
#include <string>
#include <utility>

using aiblame::LineRange;
namespace capture = aiblame::capture;

int main() {
  testsupport::Sandbox sb("capture");
  try {
    const aiblame::Repository repo{sb.root};

    // locating new text
    const std::string text = "alpha\nbeta\ngamma\ndelta\n";
    if (capture::locate_lines(text, "gamma\ndelta\n") != LineRange{.start = 3, .end = 5} ||
        capture::locate_lines(text, "beta") != LineRange{.start = 2, .end = 3} ||
        capture::locate_lines(text, "alpha\nbe") != LineRange{.start = 1, .end = 3} ||
        capture::locate_lines(text, "").has_value() ||
        capture::locate_lines(text, "omega").has_value()) {
      std::cerr << "locate_lines wrong\n";
      return 1;
    }

    // explicit ranges stop at the end of the file
    if (capture::clamp_range(28, 40, 30) != LineRange{.start = 28, .end = 31} ||
        capture::clamp_range(2, 4, 30) != LineRange{.start = 2, .end = 4} ||
        capture::clamp_range(1, 2147483647, 5) != LineRange{.start = 1, .end = 6} ||
        capture::clamp_range(31, 35, 30).has_value()) {
      std::cerr << "clamp_range wrong\n";
      return 1;
    }
    const std::pair<long long, long long> bad_ranges[] = {{1, 2147483648LL}, {0, 5}, {7, 7}, {-3, 2}};
    for (const auto &[start, end] : bad_ranges) {
      bool rejected = false;
      try {
        (void)capture::clamp_range(start, end, 10);
      } catch (const aiblame::CaptureError &) {
        rejected = true;
      }
      if (!rejected) {
        std::cerr << "range [" << start << ", " << end << ") accepted\n";
        return 1;
      }
    }

    // Write: whole file
    testsupport::write_file(sb.root / "src" / "w.txt", "1\n2\n3\n");
    const std::string write_json = R"({"session_id":"abc","tool_name":"Write",
        "tool_input":{"file_path":")" + (sb.root / "src" / "w.txt").string() +
                                   R"(","content":"1\n2\n3\n"},"prompt":"make w"})";
    const auto w = capture::events_from_payload(repo, capture::parse_hook_payload(write_json),
                                                capture::kDefaultTool, 42);
    if (w.size() != 1 || w[0].path != "src/w.txt" || w[0].range != LineRange{.start = 1, .end = 4} ||
        w[0].session_id != "abc" || w[0].prompt != "make w" || w[0].tool != "claude" ||
        w[0].timestamp_ms != 42) {
      std::cerr << "Write event wrong\n";
      return 1;
    }

    // MultiEdit with a relative path and the prompt from the transcript
    testsupport::write_file(sb.root / "m.txt", "a\nb\nnew one\nc\nnew\ntwo\n");
    const auto transcript = sb.root / "transcript.jsonl";
    testsupport::write_file(
        transcript,
        "{\"type\":\"user\",\"message\":{\"role\":\"user\",\"content\":\"first ask\"}}\n"
        "not json at all\n"
        "{\"type\":\"assistant\",\"message\":{\"role\":\"assistant\",\"content\":\"sure\"}}\n"
        "{\"type\":\"user\",\"message\":{\"role\":\"user\",\"content\":[{\"type\":\"text\",\"text\":\"second ask\"}]}}\n"
        "{\"type\":\"user\",\"message\":{\"role\":\"user\",\"content\":[{\"type\":\"tool_result\",\"content\":\"ok\"}]}}\n");
    const std::string multi_json =
        R"({"session_id":"s","tool_name":"MultiEdit","cwd":")" + sb.root.string() +
        R"(","transcript_path":")" + transcript.string() +
        R"(","tool_input":{"file_path":"m.txt","edits":[
            {"old_string":"x","new_string":"new one"},
            {"old_string":"y","new_string":"new\ntwo"},
            {"old_string":"z","new_string":""},
            {"old_string":"q","new_string":"not there"}]}})";
    const auto m = capture::events_from_payload(repo, capture::parse_hook_payload(multi_json),
                                                "claude", 1);
    if (m.size() != 2 || m[0].range != LineRange{.start = 3, .end = 4} ||
        m[1].range != LineRange{.start = 5, .end = 7} || m[0].prompt != "second ask") {
      std::cerr << "MultiEdit events wrong\n";
      return 1;
    }

    // Edit: one event
    const std::string edit_json = R"({"tool_name":"Edit","tool_input":{"file_path":")" +
                                  (sb.root / "m.txt").string() +
                                  R"(","old_string":"b","new_string":"c"}})";
    const auto e = capture::events_from_payload(repo, capture::parse_hook_payload(edit_json),
                                                "claude", 1);
    if (e.size() != 1 || e[0].range != LineRange{.start = 4, .end = 5} || !e[0].prompt.empty()) {
      std::cerr << "Edit event wrong\n";
      return 1;
    }

    // ignored: unknown tools, files outside the tree, the git dir
    const std::string read_json =
        R"({"tool_name":"Read","tool_input":{"file_path":")" + (sb.root / "m.txt").string() + R"("}})";
    const std::string outside_json = R"({"tool_name":"Write","tool_input":{"file_path":"/tmp/../etc/hosts","content":"x"}})";
    const std::string gitdir_json = R"({"tool_name":"Write","tool_input":{"file_path":")" +
                                    (sb.root / ".git" / "HEAD").string() + R"("}})";
    for (const auto &json : {read_json, outside_json, gitdir_json}) {
      if (!capture::events_from_payload(repo, capture::parse_hook_payload(json), "claude", 1).empty()) {
        std::cerr << "event produced for ignored input: " << json << "\n";
        return 1;
      }
    }

    bool threw = false;
    try {
      (void)capture::parse_hook_payload("[1, 2");
    } catch (const aiblame::CaptureError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "broken JSON accepted\n";
      return 1;
    }
  } catch (const std::exception &ex) {
    std::cerr << "capture test failed: " << ex.what() << "\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
