#include "aiblame/codec.hpp"

#include "aiblame/errors.hpp"
#include "aiblame/util.hpp"

#include <algorithm>
#include <cstdint>
#include <set>
#include <sstream>
#include <string_view>
#include <tuple>

namespace aiblame::codec {

namespace {

constexpr std::string_view kHeader = "ai-blame-record ";
constexpr std::string_view kCommit = "commit ";
constexpr std::string_view kRange = "range ";
constexpr std::string_view kPrompt = "prompt ";

int parse_line_number(const std::string &field, std::size_t line_no) {
  long long n = 0;
  if (!strutil::parse_int(field, n) || n < 1 || n > INT32_MAX) {
    throw CodecError("record line " + std::to_string(line_no) + ": bad line number '" + field +
                     "'");
  }
  return static_cast<int>(n);
}

} // namespace

std::string escape_field(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (const char c : raw) {
    switch (c) {
    case '\\': out += "\\\\"; break;
    case '\t': out += "\\t"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    default: out.push_back(c);
    }
  }
  return out;
}

std::string unescape_field(std::string_view escaped) {
  std::string out;
  out.reserve(escaped.size());
  for (std::size_t i = 0; i < escaped.size(); ++i) {
    const char c = escaped[i];
    if (c != '\\') {
      out.push_back(c);
      continue;
    }
    if (++i >= escaped.size()) {
      throw CodecError("dangling escape in field");
    }
    switch (escaped[i]) {
    case '\\': out.push_back('\\'); break;
    case 't': out.push_back('\t'); break;
    case 'n': out.push_back('\n'); break;
    case 'r': out.push_back('\r'); break;
    default: throw CodecError(std::string("unknown escape \\") + escaped[i]);
    }
  }
  return out;
}

std::string encode(const AttributionRecord &record) {
  AttributionRecord r = record;
  r.normalize();

  std::ostringstream out;
  out << kHeader << kRecordVersion << '\n';
  out << kCommit << r.commit << '\n';
  for (const auto &e : r.entries) {
    out << kRange << escape_field(e.path) << '\t' << e.range.start << '\t' << e.range.end << '\t'
        << to_string(e.kind) << '\t' << escape_field(e.tool) << '\t'
        << escape_field(e.session_id) << '\t' << escape_field(e.prompt_digest) << '\n';
  }
  for (const auto &[digest, text] : r.prompts) {
    out << kPrompt << escape_field(digest) << '\t' << escape_field(text) << '\n';
  }
  return out.str();
}

AttributionRecord decode(std::string_view text) {
  AttributionRecord r;
  bool have_header = false;
  std::set<std::string> seen;

  std::istringstream iss{std::string(text)};
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(iss, line)) {
    ++line_no;
    strutil::rstrip_newlines(line);
    if (line.empty() || !seen.insert(line).second) {
      continue;
    }

    if (line.rfind(kHeader, 0) == 0) {
      long long version = 0;
      if (!strutil::parse_int(line.substr(kHeader.size()), version) ||
          version != kRecordVersion) {
        throw CodecError("unsupported record version: " + line.substr(kHeader.size()));
      }
      have_header = true;
    } else if (line.rfind(kCommit, 0) == 0) {
      const std::string c = line.substr(kCommit.size());
      if (!looks_hex40(c)) {
        throw CodecError("record line " + std::to_string(line_no) + ": bad commit id");
      }
      // A note merged with a copy made by notes.rewriteRef names both
      // commits; the reader sets the real one from the notes key.
      if (r.commit.empty() || c < r.commit) {
        r.commit = c;
      }
    } else if (line.rfind(kRange, 0) == 0) {
      const auto f = strutil::split(std::string_view(line).substr(kRange.size()), '\t');
      if (f.size() != 7) {
        throw CodecError("record line " + std::to_string(line_no) + ": expected 7 fields");
      }
      LineAttribution e;
      e.path = unescape_field(f[0]);
      e.range.start = parse_line_number(f[1], line_no);
      e.range.end = parse_line_number(f[2], line_no);
      if (e.range.end <= e.range.start) {
        throw CodecError("record line " + std::to_string(line_no) + ": empty range");
      }
      const auto kind = parse_contributor_kind(f[3]);
      if (!kind) {
        throw CodecError("record line " + std::to_string(line_no) + ": bad contributor '" +
                         f[3] + "'");
      }
      e.kind = *kind;
      e.tool = unescape_field(f[4]);
      e.session_id = unescape_field(f[5]);
      e.prompt_digest = unescape_field(f[6]);
      if (e.path.empty()) {
        throw CodecError("record line " + std::to_string(line_no) + ": empty path");
      }
      r.entries.push_back(std::move(e));
    } else if (line.rfind(kPrompt, 0) == 0) {
      const auto rest = std::string_view(line).substr(kPrompt.size());
      const auto tab = rest.find('\t');
      if (tab == std::string_view::npos) {
        throw CodecError("record line " + std::to_string(line_no) + ": prompt without text");
      }
      r.prompts[unescape_field(rest.substr(0, tab))] = unescape_field(rest.substr(tab + 1));
    } else {
      throw CodecError("record line " + std::to_string(line_no) + ": unknown directive");
    }
  }

  if (!have_header) {
    throw CodecError("not an ai-blame record (missing header)");
  }
  if (r.commit.empty()) {
    throw CodecError("record without commit line");
  }
  std::ranges::sort(r.entries, [](const LineAttribution &a, const LineAttribution &b) {
    return std::tie(a.path, a.range.start) < std::tie(b.path, b.range.start);
  });
  return r;
}

} // namespace aiblame::codec
