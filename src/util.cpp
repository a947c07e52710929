#include "aiblame/util.hpp"

#include "aiblame/consts.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace aiblame {

namespace {

bool is_hex_digit(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

} // namespace

bool looks_hex(std::string_view str) { return !str.empty() && std::ranges::all_of(str, is_hex_digit); }

bool looks_hex40(std::string_view str) {
  return str.size() == consts::kOidHexLen && looks_hex(str);
}

std::string abbrev(std::string_view hex, std::size_t len) {
  return std::string(hex.substr(0, len));
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  const auto keep = s.find_last_not_of("\r\n");
  s.erase(keep == std::string::npos ? 0 : keep + 1);
}

std::string trim(std::string_view sv) {
  const auto first = sv.find_first_not_of(" \t");
  if (first == std::string_view::npos) return {};
  const auto last = sv.find_last_not_of(" \t\r");
  return std::string(sv.substr(first, last - first + 1));
}

std::vector<std::string> split(std::string_view sv, char sep) {
  std::vector<std::string> fields;
  for (;;) {
    const auto cut = sv.find(sep);
    fields.emplace_back(sv.substr(0, cut));
    if (cut == std::string_view::npos) return fields;
    sv.remove_prefix(cut + 1);
  }
}

bool parse_int(std::string_view sv, long long &out) {
  const char *end = sv.data() + sv.size();
  const auto res = std::from_chars(sv.data(), end, out);
  return !sv.empty() && res.ec == std::errc{} && res.ptr == end;
}

} // namespace strutil

} // namespace aiblame
